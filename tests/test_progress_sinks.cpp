#include "copy/progress_sinks.hpp"
#include "testing.hpp"
#include "util/logger.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace treecopy {
namespace {

TEST(FileProgressSinkTest, TracksStateAcrossEvents) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("progress.json");
    FileProgressSink sink(path);

    ASSERT_TRUE(sink.Send(ProgressStarted{.total_bytes = 200, .total_files = 4}));
    auto j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["state"].get<std::string>(), "started");
    EXPECT_EQ(j["percent"].get<int>(), 0);
    EXPECT_EQ(j["total_files"].get<int>(), 4);

    ASSERT_TRUE(sink.Send(ProgressAdvanced{.bytes_processed = 50}));
    j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["state"].get<std::string>(), "running");
    EXPECT_EQ(j["percent"].get<int>(), 25);
    EXPECT_EQ(j["bytes_processed"].get<int>(), 50);

    ASSERT_TRUE(sink.Send(ProgressCompleted{}));
    j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["state"].get<std::string>(), "completed");
    EXPECT_EQ(j["percent"].get<int>(), 100);
}

TEST(FileProgressSinkTest, RecordsFailureMessage) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("progress.json");
    FileProgressSink sink(path);

    ASSERT_TRUE(sink.Send(ProgressStarted{.total_bytes = 10, .total_files = 1}));
    ASSERT_TRUE(sink.Send(ProgressFailed{"copying file 1/1: boom"}));
    const auto j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["state"].get<std::string>(), "failed");
    EXPECT_EQ(j["message"].get<std::string>(), "copying file 1/1: boom");
}

TEST(FileProgressSinkTest, UnwritableLocationRefusesEvents) {
    testutil::TemporaryDirectory tmp;
    FileProgressSink sink(tmp.Sub("missing_dir/progress.json"));
    EXPECT_FALSE(sink.Send(ProgressStarted{.total_bytes = 1, .total_files = 1}));
}

TEST(ConsoleProgressSinkTest, RendersOneLine) {
    ConsoleProgressSink sink("copy");

    ::testing::internal::CaptureStderr();
    EXPECT_TRUE(sink.Send(ProgressStarted{.total_bytes = 2000, .total_files = 2}));
    EXPECT_TRUE(IsProgressLineActive());
    EXPECT_TRUE(sink.Send(ProgressAdvanced{.bytes_processed = 1000}));
    EXPECT_TRUE(sink.Send(ProgressCompleted{}));
    EXPECT_FALSE(IsProgressLineActive());
    const std::string out = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("[copy]  50% | 1.0 KB / 2.0 KB | 2 file(s)"), std::string::npos);
    EXPECT_NE(out.find("2 file(s) done\n"), std::string::npos);
}

} // namespace
} // namespace treecopy
