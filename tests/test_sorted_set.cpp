/**
 * @file test_sorted_set.cpp
 * @brief Unit tests for SortedSet and range bound parsing
 */

#include <memkv/engine/sorted_set.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

using namespace memkv;

namespace {

std::vector<std::string> Names(const std::vector<ScoredMember>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) out.push_back(item.member);
    return out;
}

} // namespace

class SortedSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        zset_.Add("one", 1);
        zset_.Add("two", 2);
        zset_.Add("three", 3);
    }

    SortedSet zset_{99};
};

TEST_F(SortedSetTest, AddAndScore) {
    EXPECT_EQ(zset_.Size(), 3u);
    EXPECT_EQ(zset_.Score("two").value(), 2.0);
    EXPECT_FALSE(zset_.Score("four").has_value());
    EXPECT_TRUE(zset_.Contains("one"));
}

TEST_F(SortedSetTest, UpsertKeepsBothViewsInSync) {
    EXPECT_FALSE(zset_.Add("one", 10));
    EXPECT_EQ(zset_.Size(), 3u);
    EXPECT_EQ(zset_.RangeByRank(0, -1).size(), 3u);
    EXPECT_EQ(zset_.Score("one").value(), 10.0);
    EXPECT_EQ(Names(zset_.RangeByRank(0, -1)), (std::vector<std::string>{"two", "three", "one"}));
}

TEST_F(SortedSetTest, Remove) {
    EXPECT_TRUE(zset_.Remove("two"));
    EXPECT_FALSE(zset_.Remove("two"));
    EXPECT_EQ(zset_.Size(), 2u);
    EXPECT_EQ(zset_.RangeByRank(0, -1).size(), 2u);
    EXPECT_EQ(Names(zset_.RangeByRank(0, -1)), (std::vector<std::string>{"one", "three"}));

    zset_.Remove("one");
    zset_.Remove("three");
    EXPECT_TRUE(zset_.Empty());
}

TEST_F(SortedSetTest, Rank) {
    EXPECT_EQ(zset_.Rank("one").value(), 0u);
    EXPECT_EQ(zset_.Rank("three").value(), 2u);
    EXPECT_EQ(zset_.Rank("one", true).value(), 2u);
    EXPECT_FALSE(zset_.Rank("nope").has_value());
}

TEST_F(SortedSetTest, RangesCarryScores) {
    auto items = zset_.RangeByScore({2, 3, false, false});
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], (ScoredMember{"two", 2}));
    EXPECT_EQ(items[1], (ScoredMember{"three", 3}));

    auto rev = zset_.RangeByRank(0, 0, true);
    ASSERT_EQ(rev.size(), 1u);
    EXPECT_EQ(rev[0], (ScoredMember{"three", 3}));
}

TEST_F(SortedSetTest, EqualScoresOrderByMember) {
    SortedSet z(1);
    z.Add("b", 0);
    z.Add("c", 0);
    z.Add("a", 0);
    EXPECT_EQ(Names(z.RangeByRank(0, -1)), (std::vector<std::string>{"a", "b", "c"}));

    auto lex = ParseLexRange("[b", "+");
    ASSERT_TRUE(lex.ok());
    EXPECT_EQ(Names(z.RangeByLex(lex.value())), (std::vector<std::string>{"b", "c"}));
}

TEST(ParseScoreTest, Accepts) {
    EXPECT_EQ(ParseScore("1.5").value(), 1.5);
    EXPECT_EQ(ParseScore("-3").value(), -3.0);
    EXPECT_TRUE(std::isinf(ParseScore("+inf").value()));
    EXPECT_TRUE(std::isinf(ParseScore("-inf").value()));
}

TEST(ParseScoreTest, Rejects) {
    EXPECT_TRUE(ParseScore("").status().IsInvalidArgument());
    EXPECT_TRUE(ParseScore("abc").status().IsInvalidArgument());
    EXPECT_TRUE(ParseScore("1.5x").status().IsInvalidArgument());
    EXPECT_TRUE(ParseScore(" 1").status().IsInvalidArgument());
    EXPECT_TRUE(ParseScore("nan").status().IsInvalidArgument());
}

TEST(ParseScoreRangeTest, ExclusiveBounds) {
    auto r = ParseScoreRange("(1", "5");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r->min_exclusive);
    EXPECT_FALSE(r->max_exclusive);
    EXPECT_EQ(r->min, 1.0);
    EXPECT_EQ(r->max, 5.0);
    EXPECT_FALSE(r->Contains(1));
    EXPECT_TRUE(r->Contains(5));

    auto inf = ParseScoreRange("-inf", "(+inf");
    ASSERT_TRUE(inf.ok());
    EXPECT_TRUE(inf->Contains(1e300));

    EXPECT_TRUE(ParseScoreRange("(x", "1").status().IsInvalidArgument());
    EXPECT_TRUE(ParseScoreRange("1", "").status().IsInvalidArgument());
}

TEST(ParseLexRangeTest, Bounds) {
    auto r = ParseLexRange("(a", "[c");
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r->Contains("a"));
    EXPECT_TRUE(r->Contains("b"));
    EXPECT_TRUE(r->Contains("c"));
    EXPECT_FALSE(r->Contains("ca"));

    auto all = ParseLexRange("-", "+");
    ASSERT_TRUE(all.ok());
    EXPECT_TRUE(all->Contains(""));
    EXPECT_TRUE(all->Contains("\xff"));

}

TEST(ParseLexRangeTest, BoundsNeedPrefix) {
    EXPECT_TRUE(ParseLexRange("b", "b").status().IsInvalidArgument());
    EXPECT_TRUE(ParseLexRange("[a", "c").status().IsInvalidArgument());
    EXPECT_TRUE(ParseLexRange("", "+").status().IsInvalidArgument());
    // The empty-interval shortcut still validates the other side
    EXPECT_TRUE(ParseLexRange("+", "x").status().IsInvalidArgument());
    EXPECT_EQ(ParseLexRange("b", "+").status().message(), "min or max not valid string range item");
}

TEST(ParseLexRangeTest, InvertedInfinitiesMatchNothing) {
    auto r = ParseLexRange("+", "-");
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r->Contains(""));
    EXPECT_FALSE(r->Contains("m"));

    auto r2 = ParseLexRange("[a", "-");
    ASSERT_TRUE(r2.ok());
    EXPECT_FALSE(r2->Contains("a"));
}
