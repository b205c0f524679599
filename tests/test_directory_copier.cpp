#include "copy/directory_copier.hpp"
#include "copy/progress_channel.hpp"
#include "testing.hpp"

#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace treecopy {
namespace {

class DirectoryCopierTest : public ::testing::Test {
  protected:
    void SetUp() override {
        src = tmp.Sub("root");
        dst = tmp.Sub("dest");
    }

    testutil::TemporaryDirectory tmp;
    std::string src;
    std::string dst;
};

TEST_F(DirectoryCopierTest, CopiesSmallTreeWithTotals) {
    testutil::WriteFile(src + "/a.txt", "12345");
    testutil::WriteFile(src + "/sub/b.txt", "1234567890");

    testutil::RecordingSink sink;
    auto res = DirectoryCopier().Copy(src, dst, &sink);
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_EQ(testutil::ReadFile(dst + "/a.txt"), "12345");
    EXPECT_EQ(testutil::ReadFile(dst + "/sub/b.txt"), "1234567890");

    ASSERT_FALSE(sink.events.empty());
    const auto* started = std::get_if<ProgressStarted>(&sink.events.front());
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->total_bytes, 15u);
    EXPECT_EQ(started->total_files, 2u);

    const auto progress = sink.ProgressValues();
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_LE(progress[0], progress[1]);
    EXPECT_EQ(progress.back(), 15u);

    EXPECT_TRUE(std::holds_alternative<ProgressCompleted>(sink.events.back()));
    EXPECT_EQ(sink.Count<ProgressCompleted>(), 1u);
}

TEST_F(DirectoryCopierTest, DestinationMirrorsSourceTree) {
    testutil::WriteFile(src + "/one.bin", testutil::PatternBytes(70 * 1024, 1));
    testutil::WriteFile(src + "/x/two.bin", testutil::PatternBytes(3, 2));
    testutil::WriteFile(src + "/x/y/z/three.bin", testutil::PatternBytes(129 * 1024 + 1, 3));
    testutil::WriteFile(src + "/x/y/empty", "");
    std::filesystem::create_directories(src + "/empty_dir");

    ASSERT_TRUE(DirectoryCopier().Copy(src, dst).ok);
    EXPECT_EQ(testutil::SnapshotTree(dst), testutil::SnapshotTree(src));
}

TEST_F(DirectoryCopierTest, CreatesMissingDestinationAncestors) {
    testutil::WriteFile(src + "/f", "x");
    const std::string deep = tmp.Sub("a/b/c/dest");

    ASSERT_TRUE(DirectoryCopier().Copy(src, deep).ok);
    EXPECT_EQ(testutil::ReadFile(deep + "/f"), "x");
}

TEST_F(DirectoryCopierTest, EmptySourceTreeStartsAndCompletes) {
    std::filesystem::create_directories(src);

    testutil::RecordingSink sink;
    ASSERT_TRUE(DirectoryCopier().Copy(src, dst, &sink).ok);

    ASSERT_EQ(sink.events.size(), 2u);
    const auto* started = std::get_if<ProgressStarted>(&sink.events[0]);
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->total_bytes, 0u);
    EXPECT_EQ(started->total_files, 0u);
    EXPECT_TRUE(std::holds_alternative<ProgressCompleted>(sink.events[1]));
    EXPECT_TRUE(std::filesystem::is_directory(dst));
}

TEST_F(DirectoryCopierTest, WithoutSinkProducesSameTree) {
    testutil::WriteFile(src + "/a", testutil::PatternBytes(1000, 4));
    testutil::WriteFile(src + "/b/c", testutil::PatternBytes(90 * 1024, 5));

    testutil::RecordingSink sink;
    ASSERT_TRUE(DirectoryCopier().Copy(src, tmp.Sub("with"), &sink).ok);
    ASSERT_TRUE(DirectoryCopier().Copy(src, tmp.Sub("without")).ok);

    EXPECT_EQ(testutil::SnapshotTree(tmp.Sub("with")), testutil::SnapshotTree(tmp.Sub("without")));
    EXPECT_EQ(testutil::SnapshotTree(tmp.Sub("with")), testutil::SnapshotTree(src));
}

TEST_F(DirectoryCopierTest, DroppedConsumerAfterStartedStillCopiesEverything) {
    for (int i = 0; i < 20; ++i) {
        testutil::WriteFile(src + "/d" + std::to_string(i % 4) + "/f" + std::to_string(i),
                            testutil::PatternBytes(1000 + i, i));
    }

    ProgressChannel channel(1);
    Result result;
    std::thread producer([&] {
        result = DirectoryCopier().Copy(src, dst, &channel);
        channel.CloseSender();
    });

    auto first = channel.Receive();
    ASSERT_TRUE(first.has_value());
    const auto* started = std::get_if<ProgressStarted>(&*first);
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->total_files, 20u);
    channel.CloseReceiver();

    producer.join();
    ASSERT_TRUE(result.ok) << result.msg;
    EXPECT_EQ(testutil::SnapshotTree(dst), testutil::SnapshotTree(src));
}

TEST_F(DirectoryCopierTest, FilesCreatedAfterListingAreNotCopied) {
    testutil::WriteFile(src + "/a.txt", "abc");

    testutil::RecordingSink sink;
    sink.on_event = [&](const ProgressEvent& e) {
        if (std::holds_alternative<ProgressStarted>(e)) {
            testutil::WriteFile(src + "/late.txt", "late");
        }
    };

    ASSERT_TRUE(DirectoryCopier().Copy(src, dst, &sink).ok);
    EXPECT_TRUE(std::filesystem::exists(dst + "/a.txt"));
    EXPECT_FALSE(std::filesystem::exists(dst + "/late.txt"));
    EXPECT_EQ(sink.ProgressValues().back(), 3u);
}

TEST_F(DirectoryCopierTest, FileVanishingBeforeItsTurnAbortsWithoutCompleted) {
    testutil::WriteFile(src + "/a.txt", "12345");
    testutil::WriteFile(src + "/sub/b.txt", "1234567890");
    testutil::WriteFile(src + "/sub/c.txt", "xyz");
    const std::string victim = src + "/sub/b.txt";

    testutil::RecordingSink sink;
    sink.on_event = [&](const ProgressEvent& e) {
        if (std::holds_alternative<ProgressStarted>(e)) {
            std::filesystem::remove(victim);
        }
    };

    auto res = DirectoryCopier().Copy(src, dst, &sink);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Io);
    EXPECT_EQ(res.path, victim);
    EXPECT_NE(res.msg.find("copying file"), std::string::npos);
    EXPECT_NE(res.msg.find("b.txt"), std::string::npos);

    EXPECT_EQ(sink.Count<ProgressCompleted>(), 0u);
    EXPECT_EQ(sink.Count<ProgressFailed>(), 1u);
    EXPECT_TRUE(std::holds_alternative<ProgressFailed>(sink.events.back()));

    // Every file reported before the failure is on disk.
    const auto progress = sink.ProgressValues();
    const auto copied = testutil::SnapshotTree(dst);
    EXPECT_EQ(copied.size(), progress.size());
    for (const auto& [rel, contents] : copied) {
        EXPECT_EQ(contents, testutil::ReadFile(src + "/" + rel));
    }
}

TEST_F(DirectoryCopierTest, MissingSourceFailsInListingPhase) {
    testutil::RecordingSink sink;
    auto res = DirectoryCopier().Copy(tmp.Sub("does_not_exist"), dst, &sink);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Io);
    EXPECT_EQ(res.msg.rfind("listing: ", 0), 0u);
    EXPECT_TRUE(sink.events.empty());
}

TEST_F(DirectoryCopierTest, UncreatableDestinationFails) {
    testutil::WriteFile(src + "/a", "a");
    testutil::WriteFile(tmp.Sub("blocker"), "regular file in the way");

    auto res = DirectoryCopier().Copy(src, tmp.Sub("blocker/dest"));
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Io);
    EXPECT_EQ(res.msg.rfind("listing: ", 0), 0u);
}

TEST_F(DirectoryCopierTest, SourceRootThatIsAFileIsAPathError) {
    testutil::WriteFile(tmp.Sub("plain.txt"), "abc");

    auto res = DirectoryCopier().Copy(tmp.Sub("plain.txt"), dst);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Path);
}

TEST_F(DirectoryCopierTest, SymlinksAreNotCopied) {
    testutil::WriteFile(src + "/real.txt", "real");
    std::filesystem::create_symlink("real.txt", src + "/link.txt");

    CopyPlan plan;
    ASSERT_TRUE(DirectoryCopier::BuildPlan(src, plan).ok);
    EXPECT_EQ(plan.total_files, 1u);
    EXPECT_EQ(plan.total_bytes, 4u);

    ASSERT_TRUE(DirectoryCopier().Copy(src, dst).ok);
    EXPECT_TRUE(std::filesystem::exists(dst + "/real.txt"));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(dst + "/link.txt")));
}

TEST_F(DirectoryCopierTest, BuildPlanRecordsRelativePaths) {
    testutil::WriteFile(src + "/a.txt", "12345");
    testutil::WriteFile(src + "/sub/b.txt", "1234567890");

    CopyPlan plan;
    ASSERT_TRUE(DirectoryCopier::BuildPlan(src + "/", plan).ok);
    ASSERT_EQ(plan.tasks.size(), 2u);

    std::vector<std::string> rels;
    for (const auto& t : plan.tasks) rels.push_back(t.relative_path);
    std::sort(rels.begin(), rels.end());
    EXPECT_EQ(rels, (std::vector<std::string>{"a.txt", "sub/b.txt"}));
    EXPECT_EQ(plan.total_bytes, 15u);
}

} // namespace
} // namespace treecopy
