/**
 * @file test_command.cpp
 * @brief Command parsing and execution tests
 */

#include <memkv/command/command.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace memkv;

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = FromUnixMillis(1'700'000'000'000);
        StoreOptions options;
        options.num_shards = 2;
        options.clock = [this] { return now_; };
        store_ = std::make_unique<Store>(options);
    }

    Reply Run(const std::vector<std::string>& argv) {
        return Dispatch(*store_, argv);
    }

    // Error replies start with the given prefix
    void ExpectError(const std::vector<std::string>& argv, const std::string& prefix) {
        Reply r = Run(argv);
        ASSERT_TRUE(r.IsError()) << argv[0];
        EXPECT_EQ(r.str.rfind(prefix, 0), 0u) << r.str;
    }

    static Reply Bulks(std::initializer_list<const char*> items) {
        std::vector<Reply> out;
        for (const char* item : items) out.push_back(Reply::Bulk(item));
        return Reply::Array(std::move(out));
    }

    TimePoint now_;
    std::unique_ptr<Store> store_;
};

// ============================================================================
// Replies
// ============================================================================

TEST(ReplyTest, FormatDouble) {
    EXPECT_EQ(FormatDouble(1), "1");
    EXPECT_EQ(FormatDouble(2.5), "2.5");
    EXPECT_EQ(FormatDouble(-0.125), "-0.125");
    EXPECT_EQ(FormatDouble(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(FormatDouble(-std::numeric_limits<double>::infinity()), "-inf");
}

TEST(ReplyTest, FromStatus) {
    EXPECT_EQ(Reply::FromStatus(Status::WrongType("x")).str,
              "WRONGTYPE Operation against a key holding the wrong kind of value");
    EXPECT_EQ(Reply::FromStatus(Status::InvalidArgument("syntax error")).str, "ERR syntax error");
    EXPECT_TRUE(Reply::FromStatus(Status::OptionConflict("a")).IsError());
}

// ============================================================================
// Parsing
// ============================================================================

TEST(ParseCommandTest, CaseInsensitiveNames) {
    auto cmd = ParseCommand({"sEt", "k", "v", "nx", "px", "100"});
    ASSERT_TRUE(cmd.ok()) << cmd.status().ToString();
    const auto& set = std::get<SetCommand>(cmd.value());
    EXPECT_EQ(set.key, "k");
    EXPECT_EQ(set.value, "v");
    EXPECT_TRUE(set.options.IsNX());
    EXPECT_EQ(set.options.expiry_kind(), ExpiryKind::kPx);
    EXPECT_EQ(set.options.expiry_value(), 100);
}

TEST(ParseCommandTest, SetOptionErrors) {
    EXPECT_TRUE(ParseCommand({"SET", "k", "v", "NX", "XX"}).status().IsOptionConflict());
    EXPECT_TRUE(ParseCommand({"SET", "k", "v", "EX", "10", "PX", "5"}).status().IsOptionConflict());
    EXPECT_TRUE(ParseCommand({"SET", "k", "v", "EX"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"SET", "k", "v", "EX", "ten"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"SET", "k", "v", "EX", "0"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"SET", "k", "v", "BOGUS"}).status().IsUnknownOption());
}

TEST(ParseCommandTest, ZAddFlagsBeforePairs) {
    auto cmd = ParseCommand({"ZADD", "z", "XX", "CH", "1", "a", "2.5", "b"});
    ASSERT_TRUE(cmd.ok()) << cmd.status().ToString();
    const auto& zadd = std::get<ZAddCommand>(cmd.value());
    EXPECT_TRUE(zadd.options.IsXX());
    EXPECT_TRUE(zadd.options.IsCH());
    ASSERT_EQ(zadd.members.size(), 2u);
    EXPECT_EQ(zadd.members[1], (ScoredMember{"b", 2.5}));

    EXPECT_TRUE(ParseCommand({"ZADD", "z", "1"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZADD", "z", "1", "a", "2"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZADD", "z", "x", "a"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZADD", "z", "NX", "XX", "1", "a"}).status().IsOptionConflict());
    EXPECT_TRUE(ParseCommand({"ZADD", "z", "INCR", "1", "a", "2", "b"}).status().IsInvalidArgument());
}

TEST(ParseCommandTest, ZRangeBounds) {
    auto rank = ParseCommand({"ZRANGE", "z", "0", "-1"});
    ASSERT_TRUE(rank.ok());
    const auto& r = std::get<ZRangeCommand>(rank.value());
    ASSERT_TRUE(std::holds_alternative<RankRange>(r.bounds));
    EXPECT_EQ(std::get<RankRange>(r.bounds).stop, -1);

    auto rev = ParseCommand({"ZRANGE", "z", "(5", "1", "BYSCORE", "REV", "LIMIT", "0", "2"});
    ASSERT_TRUE(rev.ok()) << rev.status().ToString();
    const auto& s = std::get<ZRangeCommand>(rev.value());
    const auto& range = std::get<ScoreRange>(s.bounds);
    EXPECT_EQ(range.min, 1.0);
    EXPECT_EQ(range.max, 5.0);
    EXPECT_TRUE(range.max_exclusive);
    EXPECT_EQ(s.options.limit_count(), 2);

    EXPECT_TRUE(ParseCommand({"ZRANGE", "z", "0", "1", "LIMIT", "0", "1"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZRANGE", "z", "0", "1", "LIMIT", "0"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZRANGE", "z", "a", "1"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZRANGE", "z", "(x", "1", "BYSCORE"}).status().IsInvalidArgument());
    EXPECT_TRUE(ParseCommand({"ZRANGE", "z", "0", "1", "BYSCORE", "BYLEX"}).status().IsOptionConflict());
}

TEST(ParseCommandTest, Arity) {
    EXPECT_TRUE(ParseCommand({}).status().IsInvalidArgument());
    auto get = ParseCommand({"get"});
    EXPECT_EQ(get.status().message(), "wrong number of arguments for 'GET' command");
    EXPECT_FALSE(ParseCommand({"PING", "a", "b"}).ok());
    EXPECT_FALSE(ParseCommand({"DBSIZE", "x"}).ok());
    EXPECT_FALSE(ParseCommand({"ZSCORE", "z"}).ok());
    EXPECT_FALSE(ParseCommand({"ZRANK", "z"}).ok());
    EXPECT_FALSE(ParseCommand({"ZREVRANK", "z", "a", "b"}).ok());
    EXPECT_FALSE(ParseCommand({"ZREM", "z"}).ok());
    EXPECT_FALSE(ParseCommand({"DEL"}).ok());
}

TEST(ParseCommandTest, UnknownCommand) {
    auto cmd = ParseCommand({"FROB", "x"});
    ASSERT_FALSE(cmd.ok());
    EXPECT_EQ(cmd.status().message(), "unknown command 'FROB'");
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(CommandTest, PingEcho) {
    EXPECT_EQ(Run({"PING"}), Reply::Simple("PONG"));
    EXPECT_EQ(Run({"PING", "hi"}), Reply::Bulk("hi"));
    EXPECT_EQ(Run({"ECHO", "x y"}), Reply::Bulk("x y"));
}

TEST_F(CommandTest, SetGet) {
    EXPECT_EQ(Run({"SET", "k", "v"}), Reply::Simple("OK"));
    EXPECT_EQ(Run({"GET", "k"}), Reply::Bulk("v"));
    EXPECT_EQ(Run({"GET", "missing"}), Reply::Null());
    EXPECT_EQ(Run({"SET", "k", "v2", "NX"}), Reply::Null());
    EXPECT_EQ(Run({"SET", "k", "v3", "GET"}), Reply::Bulk("v"));
    EXPECT_EQ(Run({"SET", "new", "x", "GET"}), Reply::Null());
    EXPECT_EQ(Run({"SET", "k", "v4", "NX", "GET"}), Reply::Bulk("v3"));
    EXPECT_EQ(Run({"GET", "k"}), Reply::Bulk("v3"));
}

TEST_F(CommandTest, ExpiryCommands) {
    EXPECT_EQ(Run({"EXPIRE", "k", "10"}), Reply::Integer(0));
    Run({"SET", "k", "v"});
    EXPECT_EQ(Run({"TTL", "k"}), Reply::Integer(-1));
    EXPECT_EQ(Run({"EXPIRE", "k", "10"}), Reply::Integer(1));
    EXPECT_EQ(Run({"EXPIRE", "k", "20", "NX"}), Reply::Integer(0));
    EXPECT_EQ(Run({"TTL", "k"}), Reply::Integer(10));
    EXPECT_EQ(Run({"PEXPIRE", "k", "1500"}), Reply::Integer(1));
    EXPECT_EQ(Run({"PTTL", "k"}), Reply::Integer(1500));
    EXPECT_EQ(Run({"PERSIST", "k"}), Reply::Integer(1));
    EXPECT_EQ(Run({"TTL", "k"}), Reply::Integer(-1));
    EXPECT_EQ(Run({"TTL", "missing"}), Reply::Integer(-2));
    ExpectError({"EXPIRE", "k", "10", "NX", "XX"}, "ERR ");
    ExpectError({"EXPIRE", "k", "soon"}, "ERR value is not an integer");
}

TEST_F(CommandTest, KeyspaceCommands) {
    Run({"SET", "a", "1"});
    Run({"SET", "b", "2"});
    Run({"ZADD", "z", "1", "m"});
    EXPECT_EQ(Run({"EXISTS", "a", "b", "nope"}), Reply::Integer(2));
    EXPECT_EQ(Run({"KEYS", "*"}), Bulks({"a", "b", "z"}));
    EXPECT_EQ(Run({"TYPE", "a"}), Reply::Simple("string"));
    EXPECT_EQ(Run({"TYPE", "z"}), Reply::Simple("zset"));
    EXPECT_EQ(Run({"TYPE", "nope"}), Reply::Simple("none"));
    EXPECT_EQ(Run({"DBSIZE"}), Reply::Integer(3));
    EXPECT_EQ(Run({"DEL", "a", "nope"}), Reply::Integer(1));
    EXPECT_EQ(Run({"FLUSHALL"}), Reply::Simple("OK"));
    EXPECT_EQ(Run({"DBSIZE"}), Reply::Integer(0));
    EXPECT_EQ(Run({"COMMAND", "DOCS"}), Reply::Array());
}

TEST_F(CommandTest, WrongType) {
    Run({"ZADD", "z", "1", "m"});
    ExpectError({"GET", "z"}, "WRONGTYPE");
    Run({"SET", "s", "v"});
    ExpectError({"ZADD", "s", "1", "m"}, "WRONGTYPE");
    ExpectError({"ZRANGE", "s", "0", "-1"}, "WRONGTYPE");
    ExpectError({"ZSCORE", "s", "m"}, "WRONGTYPE");
    ExpectError({"ZRANK", "s", "m"}, "WRONGTYPE");
}

TEST_F(CommandTest, SortedSetCommands) {
    EXPECT_EQ(Run({"ZADD", "z", "1", "a", "2", "b", "3", "c"}), Reply::Integer(3));
    EXPECT_EQ(Run({"ZADD", "z", "CH", "5", "a", "2", "b"}), Reply::Integer(1));
    EXPECT_EQ(Run({"ZCARD", "z"}), Reply::Integer(3));
    EXPECT_EQ(Run({"ZSCORE", "z", "a"}), Reply::Bulk("5"));
    EXPECT_EQ(Run({"ZSCORE", "z", "nope"}), Reply::Null());
    EXPECT_EQ(Run({"ZRANK", "z", "b"}), Reply::Integer(0));
    EXPECT_EQ(Run({"zrevrank", "z", "b"}), Reply::Integer(2));
    EXPECT_EQ(Run({"ZRANK", "z", "nope"}), Reply::Null());
    EXPECT_EQ(Run({"ZRANK", "missing", "a"}), Reply::Null());

    EXPECT_EQ(Run({"ZRANGE", "z", "0", "-1"}), Bulks({"b", "c", "a"}));
    EXPECT_EQ(Run({"ZRANGE", "z", "0", "0", "WITHSCORES"}), Bulks({"b", "2"}));
    EXPECT_EQ(Run({"ZRANGE", "z", "+inf", "3", "BYSCORE", "REV"}), Bulks({"a", "c"}));
    EXPECT_EQ(Run({"ZRANGE", "z", "-inf", "+inf", "BYSCORE", "LIMIT", "1", "1"}), Bulks({"c"}));

    EXPECT_EQ(Run({"ZREM", "z", "a", "nope"}), Reply::Integer(1));
    EXPECT_EQ(Run({"ZREM", "z", "b", "c"}), Reply::Integer(2));
    EXPECT_EQ(Run({"EXISTS", "z"}), Reply::Integer(0));
    EXPECT_EQ(Run({"ZRANGE", "z", "0", "-1"}), Reply::Array());
}

TEST_F(CommandTest, ZAddIncr) {
    Run({"ZADD", "z", "1.5", "a"});
    EXPECT_EQ(Run({"ZADD", "z", "INCR", "1", "a"}), Reply::Bulk("2.5"));
    EXPECT_EQ(Run({"ZADD", "z", "INCR", "1", "nope"}), Reply::Null());
    ExpectError({"ZADD", "z", "XX", "INCR", "1", "nope"}, "ERR");
    EXPECT_EQ(Run({"ZSCORE", "z", "nope"}), Reply::Null());
    EXPECT_EQ(Run({"ZSCORE", "z", "a"}), Reply::Bulk("2.5"));
}

TEST_F(CommandTest, ZRangeByLex) {
    Run({"ZADD", "z", "0", "apple", "0", "banana", "0", "cherry"});
    EXPECT_EQ(Run({"ZRANGE", "z", "[b", "+", "BYLEX"}), Bulks({"banana", "cherry"}));
    EXPECT_EQ(Run({"ZRANGE", "z", "+", "(b", "BYLEX", "REV"}), Bulks({"cherry", "banana"}));
    EXPECT_EQ(Run({"ZRANGE", "z", "-", "+", "BYLEX", "LIMIT", "0", "1"}), Bulks({"apple"}));
    ExpectError({"ZRANGE", "z", "b", "+", "BYLEX"}, "ERR min or max not valid string range item");
}

TEST_F(CommandTest, ExpiredKeyDisappears) {
    Run({"SET", "k", "v", "PX", "50"});
    now_ += Millis(50);
    EXPECT_EQ(Run({"GET", "k"}), Reply::Null());
    EXPECT_EQ(Run({"TTL", "k"}), Reply::Integer(-2));
}

TEST_F(CommandTest, ExecuteTypedCommand) {
    Reply r = Execute(*store_, Command{SetCommand{"k", "v", SetOptions()}});
    EXPECT_EQ(r, Reply::Simple("OK"));
    EXPECT_EQ(Execute(*store_, Command{GetCommand{"k"}}), Reply::Bulk("v"));
}
