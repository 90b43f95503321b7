#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "core/copy_engine/copy_engine.hpp"
#include "core/counter/counter.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "test_helpers.hpp"

#include <sys/stat.h>

namespace fs = std::filesystem;
using antig::core::CopyEngine;
using antig::core::CopyOptions;
using antig::core::CopyOutcome;
using antig::testing::read_file;
using antig::testing::TempDir;
using antig::testing::write_file;

namespace {

class CopyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(tmp_ / "a/x.txt", "abc");
        write_file(tmp_ / "a/sub/y.txt", "hello");
        fs::create_directories(tmp_ / "out");
    }

    auto make_engine(CopyOptions options = {.noise = false, .progress = false, .verify = false})
        -> std::unique_ptr<CopyEngine> {
        return std::make_unique<CopyEngine>(monitor_, counter_, options);
    }

    TempDir tmp_;
    antig::infra::ProgressMonitor monitor_{false};
    std::shared_ptr<antig::core::SharedCounter> counter_ = antig::core::make_shared_counter();
};

} // namespace

TEST_F(CopyEngineTest, CopiesTreeUnderSourceBasename)
{
    auto engine = make_engine();
    auto res = engine->copy_directory(tmp_ / "a", tmp_ / "out");
    ASSERT_TRUE(res) << res.error().message;

    EXPECT_EQ(read_file(tmp_ / "out/a/x.txt"), "abc");
    EXPECT_EQ(read_file(tmp_ / "out/a/sub/y.txt"), "hello");
    EXPECT_EQ(fs::file_size(tmp_ / "out/a/x.txt"), 3u);
    EXPECT_EQ(fs::file_size(tmp_ / "out/a/sub/y.txt"), 5u);

    const auto stats = engine->stats();
    EXPECT_EQ(stats.files_copied, 2u);
    EXPECT_EQ(stats.bytes_copied, 8u);
    EXPECT_EQ(stats.directories_created, 2u);
}

TEST_F(CopyEngineTest, EmptyDirectoriesArePropagated)
{
    fs::remove(tmp_ / "a/sub/y.txt");
    fs::create_directories(tmp_ / "a/sub/leaf");

    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));

    EXPECT_TRUE(fs::is_directory(tmp_ / "out/a/sub"));
    EXPECT_TRUE(fs::is_directory(tmp_ / "out/a/sub/leaf"));
    EXPECT_TRUE(fs::is_empty(tmp_ / "out/a/sub/leaf"));
}

TEST_F(CopyEngineTest, SecondRunWritesNothing)
{
    ASSERT_TRUE(make_engine()->copy_directory(tmp_ / "a", tmp_ / "out"));

    // Старая метка времени: любая запись в файл её сдвинет
    const auto marker = fs::file_time_type::clock::now() - std::chrono::hours(24);
    fs::last_write_time(tmp_ / "out/a/x.txt", marker);
    fs::last_write_time(tmp_ / "out/a/sub/y.txt", marker);

    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));

    EXPECT_EQ(fs::last_write_time(tmp_ / "out/a/x.txt"), marker);
    EXPECT_EQ(fs::last_write_time(tmp_ / "out/a/sub/y.txt"), marker);

    const auto stats = engine->stats();
    EXPECT_EQ(stats.files_skipped, 2u);
    EXPECT_EQ(stats.files_copied, 0u);
    EXPECT_EQ(stats.bytes_copied, 0u);
    EXPECT_EQ(stats.directories_created, 0u);
}

TEST_F(CopyEngineTest, DifferentSizeDestinationIsReplaced)
{
    write_file(tmp_ / "out/a/x.txt", "a stale partial copy that is longer");

    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));

    EXPECT_EQ(read_file(tmp_ / "out/a/x.txt"), "abc");
    EXPECT_EQ(engine->stats().files_replaced, 1u);
    EXPECT_EQ(engine->stats().files_copied, 1u);
}

TEST_F(CopyEngineTest, SameSizeDestinationIsTrusted)
{
    write_file(tmp_ / "out/a/x.txt", "zzz");

    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));

    // Сравнение только по размеру: содержимое не трогаем
    EXPECT_EQ(read_file(tmp_ / "out/a/x.txt"), "zzz");
    EXPECT_EQ(engine->stats().files_skipped, 1u);
}

TEST_F(CopyEngineTest, DestinationInsideSourceIsNotCopiedIntoItself)
{
    fs::create_directories(tmp_ / "a/backup");

    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "a/backup"));

    EXPECT_EQ(read_file(tmp_ / "a/backup/a/x.txt"), "abc");
    EXPECT_EQ(read_file(tmp_ / "a/backup/a/sub/y.txt"), "hello");
    EXPECT_FALSE(fs::exists(tmp_ / "a/backup/a/backup"));
    EXPECT_EQ(engine->stats().files_copied, 2u);
}

TEST_F(CopyEngineTest, TrailingSeparatorAndDotSegmentsMirrorTheSameWay)
{
    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(fs::path((tmp_ / "a").string() + "/"), tmp_ / "out"));
    EXPECT_EQ(read_file(tmp_ / "out/a/sub/y.txt"), "hello");

    fs::remove_all(tmp_ / "out/a");
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a/sub/..", tmp_ / "out"));
    EXPECT_EQ(read_file(tmp_ / "out/a/x.txt"), "abc");
    EXPECT_FALSE(fs::exists(tmp_ / "out/.."));
}

TEST_F(CopyEngineTest, ProgressFollowsSharedCounter)
{
    ASSERT_TRUE(antig::core::count_files(tmp_ / "a", tmp_ / "out", *counter_));

    auto engine = make_engine({.noise = false, .progress = true, .verify = false});
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));

    const auto stats = monitor_.get_stats();
    EXPECT_EQ(stats.position, 2u);
    EXPECT_EQ(stats.length, 2u);
}

TEST_F(CopyEngineTest, SkippedFilesStillAdvanceProgress)
{
    ASSERT_TRUE(make_engine()->copy_directory(tmp_ / "a", tmp_ / "out"));

    auto engine = make_engine({.noise = false, .progress = true, .verify = false});
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));
    EXPECT_EQ(monitor_.get_stats().position, 2u);
}

TEST_F(CopyEngineTest, ProgressDisabledLeavesMonitorUntouched)
{
    counter_->store(42);
    auto engine = make_engine();
    ASSERT_TRUE(engine->copy_directory(tmp_ / "a", tmp_ / "out"));

    const auto stats = monitor_.get_stats();
    EXPECT_EQ(stats.position, 0u);
    EXPECT_EQ(stats.length, 0u);
}

TEST_F(CopyEngineTest, NoisePrintsOneLinePerFile)
{
    auto engine = make_engine({.noise = true, .progress = false, .verify = false});

    ::testing::internal::CaptureStdout();
    auto res = engine->copy_directory(tmp_ / "a", tmp_ / "out");
    const auto output = ::testing::internal::GetCapturedStdout();

    ASSERT_TRUE(res);
    const auto expected = "cp: " + (tmp_ / "a/x.txt").string() + " => " + (tmp_ / "out/a/x.txt").string();
    EXPECT_NE(output.find(expected), std::string::npos) << output;
    EXPECT_NE(output.find("cp: " + (tmp_ / "a/sub/y.txt").string()), std::string::npos) << output;
}

TEST_F(CopyEngineTest, VerifyAcceptsFaithfulCopy)
{
    write_file(tmp_ / "a/big.bin", std::string(2'000'000, 'q'));

    auto engine = make_engine({.noise = false, .progress = false, .verify = true});
    auto res = engine->copy_directory(tmp_ / "a", tmp_ / "out");
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(fs::file_size(tmp_ / "out/a/big.bin"), 2'000'000u);
}

TEST_F(CopyEngineTest, CopyFailureNamesBothPaths)
{
    auto engine = make_engine();
    const auto target = tmp_ / "no/such/dir/x.txt";
    auto res = engine->copy_file(tmp_ / "a/x.txt", target);

    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, antig::infra::ErrorCode::FileNotFound);
    EXPECT_NE(res.error().message.find((tmp_ / "a/x.txt").string()), std::string::npos);
    EXPECT_NE(res.error().message.find(target.string()), std::string::npos);
    EXPECT_NE(res.error().message.find("IOError"), std::string::npos);
}

TEST_F(CopyEngineTest, MirrorRootBlockedByFileFails)
{
    write_file(tmp_ / "out/a", "not a directory");

    auto res = make_engine()->copy_directory(tmp_ / "a", tmp_ / "out");
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().message.find("create a directory"), std::string::npos);
}

TEST_F(CopyEngineTest, FifoInTreeAbortsInsteadOfBlocking)
{
    ASSERT_EQ(::mkfifo((tmp_ / "a/pipe").c_str(), 0644), 0);

    auto res = make_engine()->copy_directory(tmp_ / "a", tmp_ / "out");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, antig::infra::ErrorCode::Io);
    EXPECT_NE(res.error().message.find((tmp_ / "a/pipe").string()), std::string::npos);
    EXPECT_NE(res.error().message.find((tmp_ / "out/a/pipe").string()), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp_ / "out/a/pipe"));
}

TEST_F(CopyEngineTest, ReplaceFileOverwritesSameSizeTarget)
{
    write_file(tmp_ / "new.txt", "NEW");
    write_file(tmp_ / "out/old.txt", "old");
    auto engine = make_engine();

    auto res = engine->replace_file(tmp_ / "new.txt", tmp_ / "out/old.txt");
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(*res, CopyOutcome::Replaced);
    EXPECT_EQ(read_file(tmp_ / "out/old.txt"), "NEW");

    auto fresh = engine->replace_file(tmp_ / "new.txt", tmp_ / "out/fresh.txt");
    ASSERT_TRUE(fresh);
    EXPECT_EQ(*fresh, CopyOutcome::Copied);
    EXPECT_EQ(engine->stats().files_replaced, 1u);
    EXPECT_EQ(engine->stats().files_copied, 1u);
}

TEST_F(CopyEngineTest, ReplaceFileRefusesDirectoryTarget)
{
    fs::create_directories(tmp_ / "out/x.txt");

    auto res = make_engine()->replace_file(tmp_ / "a/x.txt", tmp_ / "out/x.txt");
    ASSERT_FALSE(res);
    EXPECT_TRUE(fs::is_directory(tmp_ / "out/x.txt"));
}

TEST_F(CopyEngineTest, CopyFileReportsOutcome)
{
    auto engine = make_engine();
    const auto target = tmp_ / "out/single.txt";

    auto first = engine->copy_file(tmp_ / "a/x.txt", target);
    ASSERT_TRUE(first);
    EXPECT_EQ(*first, CopyOutcome::Copied);

    auto second = engine->copy_file(tmp_ / "a/x.txt", target);
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, CopyOutcome::Skipped);

    auto third = engine->copy_file(tmp_ / "a/sub/y.txt", target);
    ASSERT_TRUE(third);
    EXPECT_EQ(*third, CopyOutcome::Replaced);
    EXPECT_EQ(read_file(target), "hello");
}

TEST(SourceBasenameTest, ResolvesLastSegment)
{
    EXPECT_EQ(*antig::core::source_basename("/a/b"), "b");
    EXPECT_EQ(*antig::core::source_basename("a/b/"), "b");
    EXPECT_EQ(*antig::core::source_basename("a/b/."), "b");
    EXPECT_EQ(*antig::core::source_basename("."), fs::current_path().filename());
}
