#include "Errors.hpp"
#include "Splitter.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>

using namespace csvsort;
using namespace csvsort::test;

namespace {
class SplitterTest : public ::testing::Test {
protected:
    std::vector<std::filesystem::path> split(const std::string& text, std::uint64_t maxBytes,
                                             std::size_t keyFields = 1)
    {
        writeText(input_, text);
        RowReader rows(input_, ',', "input", &io_);
        return splitIntoChunks(rows, ws_, maxBytes, keyFields, &io_);
    }

    TempDir   dir_;
    std::filesystem::path input_ = dir_.file("in.csv");
    Workspace ws_{dir_.path()};
    IoTracker io_;
};
} // namespace

TEST_F(SplitterTest, ZeroRowsYieldNoChunks)
{
    EXPECT_TRUE(split("", 1000).empty());
    EXPECT_EQ(countEntries(ws_.path()), 0u);
}

TEST_F(SplitterTest, ZeroLimitPutsEachRowInItsOwnChunk)
{
    const auto chunks = split("e\nd\nc\nb\na\n", 0);
    ASSERT_EQ(chunks.size(), 5u);
    EXPECT_EQ(readCsv(chunks[0]), (Rows{{"e"}}));
    EXPECT_EQ(readCsv(chunks[4]), (Rows{{"a"}}));
    EXPECT_EQ(io_.files, 5u);
}

TEST_F(SplitterTest, LargeLimitKeepsEverythingInOneChunk)
{
    const auto chunks = split("b,1\na,2\n", chunkBytesFromMB(100));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(readCsv(chunks[0]), (Rows{{"b", "1"}, {"a", "2"}}));
}

TEST_F(SplitterTest, SoftCapSealsAfterTheRowThatCrossesIt)
{
    /* cada linha "aaaa" estima 4 + 32 + 24 = 60 bytes */
    ASSERT_EQ(estimateRowBytes(Row{{"aaaa"}}), 60u);

    const auto chunks = split("aaaa\nbbbb\ncccc\ndddd\neeee\n", 100);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(readCsv(chunks[0]), (Rows{{"aaaa"}, {"bbbb"}}));
    EXPECT_EQ(readCsv(chunks[1]), (Rows{{"cccc"}, {"dddd"}}));
    EXPECT_EQ(readCsv(chunks[2]), (Rows{{"eeee"}}));
}

TEST_F(SplitterTest, EveryRowLandsInExactlyOneChunkInInputOrder)
{
    std::string text;
    Rows expected;
    for (int i = 0; i < 50; ++i) {
        const std::string k = std::to_string((i * 37) % 50);
        text += k + ",\"v," + std::to_string(i) + "\"\n";
        expected.push_back({k, "v," + std::to_string(i)});
    }
    const auto chunks = split(text, 300);
    EXPECT_GT(chunks.size(), 1u);

    Rows all;
    for (const auto& c : chunks) {
        const auto part = readCsv(c);
        all.insert(all.end(), part.begin(), part.end());
    }
    EXPECT_EQ(all, expected);
    EXPECT_EQ(io_.writes, 50u);
}

TEST_F(SplitterTest, RowMissingKeyColumnIsMalformed)
{
    try {
        split("a,b,c\nd,e\n", 1000, 3);
        FAIL() << "esperava MalformedRow";
    } catch (const MalformedRow& e) {
        EXPECT_EQ(e.record(), 2u);
        EXPECT_EQ(e.file().string(), input_.string());
    }
}

TEST(ChunkSize, ConvertsMegabytes)
{
    EXPECT_EQ(chunkBytesFromMB(1), 1048576u);
    EXPECT_EQ(chunkBytesFromMB(0.5), 524288u);
    EXPECT_EQ(chunkBytesFromMB(0), 0u);
    EXPECT_THROW(chunkBytesFromMB(-1), ConfigError);
}

TEST_F(SplitterTest, InputShorterThanAtOpenIsAReadFailure)
{
    writeText(input_, "c\nb\na\n");
    RowReader rows(input_, ',', "input", &io_);
    std::filesystem::resize_file(input_, 0);

    try {
        splitIntoChunks(rows, ws_, 1000, 1, &io_);
        FAIL() << "esperava IoFailure";
    } catch (const IoFailure& e) {
        EXPECT_EQ(e.phase(), "input");
        EXPECT_EQ(e.file().string(), input_.string());
    }
}
