#include "Errors.hpp"
#include "Merger.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>

using namespace csvsort;
using namespace csvsort::test;

namespace {
class MergerTest : public ::testing::Test {
protected:
    std::filesystem::path chunk(const Rows& rows)
    {
        auto p = ws_.newChunkPath();
        writeCsv(p, rows);
        return p;
    }

    TempDir   dir_;
    Workspace ws_{dir_.path()};
};
} // namespace

TEST_F(MergerTest, CursorPeeksAndAdvances)
{
    RowCursor cur(chunk({{"a"}, {"b"}}));
    ASSERT_TRUE(cur.valid());
    EXPECT_EQ(cur.peek().cols[0], "a");
    cur.advance();
    ASSERT_TRUE(cur.valid());
    EXPECT_EQ(cur.peek().cols[0], "b");
    cur.advance();
    EXPECT_FALSE(cur.valid());
}

TEST_F(MergerTest, MergeGroupInterleavesSortedInputs)
{
    const auto a = chunk({{"a"}, {"c"}, {"e"}});
    const auto b = chunk({{"b"}, {"d"}});
    const auto c = chunk({});
    const auto out = ws_.newMergePath();

    mergeGroup({a, b, c}, out, {0});

    EXPECT_EQ(readCsv(out), (Rows{{"a"}, {"b"}, {"c"}, {"d"}, {"e"}}));
}

TEST_F(MergerTest, EqualKeysComeFromEarlierInputFirst)
{
    const auto a = chunk({{"k", "a0"}, {"k", "a1"}, {"z", "a2"}});
    const auto b = chunk({{"k", "b0"}});

    const auto out1 = ws_.newMergePath();
    mergeGroup({a, b}, out1, {0});
    EXPECT_EQ(readCsv(out1), (Rows{{"k", "a0"}, {"k", "a1"}, {"k", "b0"}, {"z", "a2"}}));

    const auto out2 = ws_.newMergePath();
    mergeGroup({b, a}, out2, {0});
    EXPECT_EQ(readCsv(out2), (Rows{{"k", "b0"}, {"k", "a0"}, {"k", "a1"}, {"z", "a2"}}));
}

TEST_F(MergerTest, NoFilesMeansNoResult)
{
    EXPECT_FALSE(mergeAll({}, {0}, ws_).has_value());
}

TEST_F(MergerTest, SingleFileIsReturnedUnchanged)
{
    const auto only = chunk({{"a"}});
    MergeStats ms;
    const auto res = mergeAll({only}, {0}, ws_, 2, nullptr, &ms);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->string(), only.string());
    EXPECT_EQ(ms.passes, 0u);
    EXPECT_EQ(readCsv(only), (Rows{{"a"}}));
}

TEST_F(MergerTest, FanInTwoRunsSeveralPassesAndDeletesInputs)
{
    std::vector<std::filesystem::path> files;
    for (const char* k : {"d", "b", "e", "a", "c"}) files.push_back(chunk({{k}}));

    MergeStats ms;
    const auto res = mergeAll(files, {0}, ws_, 2, nullptr, &ms);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(readCsv(*res), (Rows{{"a"}, {"b"}, {"c"}, {"d"}, {"e"}}));
    EXPECT_EQ(ms.passes, 3u);          // 5 -> 3 -> 2 -> 1
    EXPECT_EQ(ms.groups, 4u);
    for (const auto& f : files) EXPECT_FALSE(std::filesystem::exists(f)) << f;
    EXPECT_EQ(countEntries(ws_.path()), 1u);
}

TEST_F(MergerTest, WiderFanInNeedsFewerPasses)
{
    std::vector<std::filesystem::path> files;
    for (const char* k : {"d", "b", "e", "a", "c"}) files.push_back(chunk({{k}}));

    MergeStats ms;
    const auto res = mergeAll(files, {0}, ws_, 3, nullptr, &ms);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(readCsv(*res), (Rows{{"a"}, {"b"}, {"c"}, {"d"}, {"e"}}));
    EXPECT_EQ(ms.passes, 2u);          // 5 -> 2 -> 1
    EXPECT_EQ(ms.groups, 3u);
}

TEST_F(MergerTest, StableAcrossPassesForAnyFanIn)
{
    for (std::size_t fanIn : {2u, 3u, 4u, 7u}) {
        std::vector<std::filesystem::path> files;
        Rows expected;
        for (int c = 0; c < 7; ++c) {
            files.push_back(chunk({{"k", std::to_string(c)}, {"m", std::to_string(c)}}));
            expected.push_back({"k", std::to_string(c)});
        }
        for (int c = 0; c < 7; ++c) expected.push_back({"m", std::to_string(c)});

        const auto res = mergeAll(files, {0}, ws_, fanIn);
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ(readCsv(*res), expected) << "fan-in " << fanIn;
        std::filesystem::remove(*res);
    }
}

TEST_F(MergerTest, FanInBelowTwoIsRejected)
{
    EXPECT_THROW(mergeAll({chunk({{"a"}}), chunk({{"b"}})}, {0}, ws_, 1), ConfigError);
}
