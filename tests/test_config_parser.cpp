#include "copy/copy_options.hpp"
#include "testing.hpp"
#include "util/config_parser.hpp"

#include <gtest/gtest.h>
#include <string>

namespace treecopy::config {
namespace {

TEST(ConfigParserTest, LoadsAllKeys) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("treecopy.conf");
    testutil::WriteFile(path, R"({
        "ChunkSizeBytes": 131072,
        "ChannelCapacity": 16,
        "Progress": false,
        "ProgressFile": "/run/treecopy/progress.json",
        "Verify": true,
        "PreserveMode": true,
        "Fsync": false,
        "LogLevel": "Debug"
    })");

    TreecopyConfigFromFile cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(cfg.chunk_size_bytes, 131072u);
    EXPECT_EQ(cfg.channel_capacity, 16u);
    EXPECT_EQ(cfg.progress, false);
    EXPECT_EQ(cfg.progress_file, "/run/treecopy/progress.json");
    EXPECT_EQ(cfg.verify, true);
    EXPECT_EQ(cfg.preserve_mode, true);
    EXPECT_EQ(cfg.fsync, false);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(ConfigParserTest, MissingKeysStayUnset) {
    TreecopyConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"Verify": true})").ok);
    EXPECT_EQ(cfg.verify, true);
    EXPECT_FALSE(cfg.chunk_size_bytes.has_value());
    EXPECT_FALSE(cfg.progress.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigParserTest, RejectsWrongTypesAndValues) {
    TreecopyConfigFromFile cfg;

    auto r = cfg.LoadString(R"({"Progress": "yes"})");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_NE(r.msg.find("Progress"), std::string::npos);
    EXPECT_FALSE(cfg.progress.has_value());

    EXPECT_FALSE(cfg.LoadString(R"({"ChunkSizeBytes": 0})").ok);
    EXPECT_FALSE(cfg.LoadString(R"({"ChunkSizeBytes": -4})").ok);
    EXPECT_FALSE(cfg.LoadString(R"({"LogLevel": "chatty"})").ok);
    EXPECT_FALSE(cfg.LoadString(R"([1, 2, 3])").ok);
    EXPECT_FALSE(cfg.LoadString("{not json").ok);
}

TEST(ConfigParserTest, RejectsChunkSizeAboveLimit) {
    TreecopyConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"ChunkSizeBytes": 67108864})").ok);
    EXPECT_EQ(cfg.chunk_size_bytes, kMaxChunkSize);

    auto r = cfg.LoadString(R"({"ChunkSizeBytes": 1125899906842624})");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_NE(r.msg.find("ChunkSizeBytes"), std::string::npos);
    EXPECT_FALSE(cfg.chunk_size_bytes.has_value());
}

TEST(ConfigParserTest, MissingFileFails) {
    testutil::TemporaryDirectory tmp;
    TreecopyConfigFromFile cfg;
    auto r = cfg.LoadFile(tmp.Sub("absent.conf"));
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_EQ(r.path, tmp.Sub("absent.conf"));
}

} // namespace
} // namespace treecopy::config
