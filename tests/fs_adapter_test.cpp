#include <gtest/gtest.h>

#include <string>

#include "adapters/fs.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using antig::adapters::fs::CopyStrategy;
using antig::infra::ErrorCode;
using antig::testing::read_file;
using antig::testing::TempDir;
using antig::testing::write_file;

TEST(FsAdapterTest, SelectsStrategyBySize)
{
    using antig::adapters::fs::select_strategy;
    EXPECT_EQ(select_strategy(0), CopyStrategy::Buffered);
    EXPECT_EQ(select_strategy(999'999), CopyStrategy::Buffered);
    EXPECT_EQ(select_strategy(1'000'000), CopyStrategy::MMap);
    EXPECT_EQ(select_strategy(5'000'000'000ull), CopyStrategy::MMap);
}

TEST(FsAdapterTest, BufferedCopyIsByteExact)
{
    TempDir tmp;
    std::string content;
    for (int i = 0; i < 200'000; ++i) {
        content.push_back(static_cast<char>(i % 251));
    }
    write_file(tmp / "src.bin", content);

    auto res = antig::adapters::fs::copy_file(tmp / "src.bin", tmp / "dst.bin", CopyStrategy::Buffered);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(*res, content.size());
    EXPECT_EQ(read_file(tmp / "dst.bin"), content);
}

TEST(FsAdapterTest, MMapCopyIsByteExact)
{
    TempDir tmp;
    std::string content(3'000'000, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>((i * 7) % 256);
    }
    write_file(tmp / "src.bin", content);

    auto res = antig::adapters::fs::copy_file(tmp / "src.bin", tmp / "dst.bin", CopyStrategy::MMap);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(*res, content.size());
    EXPECT_EQ(read_file(tmp / "dst.bin"), content);
}

TEST(FsAdapterTest, EmptyFileIsCopied)
{
    TempDir tmp;
    write_file(tmp / "empty", "");

    for (auto strategy : {CopyStrategy::Buffered, CopyStrategy::MMap}) {
        fs::remove(tmp / "copy");
        auto res = antig::adapters::fs::copy_file(tmp / "empty", tmp / "copy", strategy);
        ASSERT_TRUE(res);
        EXPECT_EQ(*res, 0u);
        EXPECT_TRUE(fs::exists(tmp / "copy"));
    }
}

TEST(FsAdapterTest, ExistingDestinationIsLeftAlone)
{
    TempDir tmp;
    write_file(tmp / "src.txt", "new");
    write_file(tmp / "dst.txt", "old content");

    auto res = antig::adapters::fs::copy_file(tmp / "src.txt", tmp / "dst.txt");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(read_file(tmp / "dst.txt"), "old content");
}

TEST(FsAdapterTest, MissingSourceIsReported)
{
    TempDir tmp;
    auto res = antig::adapters::fs::copy_file(tmp / "ghost", tmp / "dst");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::FileNotFound);
    EXPECT_FALSE(fs::exists(tmp / "dst"));
}
