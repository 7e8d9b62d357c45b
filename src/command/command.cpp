/**
 * @file command.cpp
 * @brief Reply construction and argv parsing
 */

#include <memkv/command/command.hpp>

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <unordered_map>

namespace memkv {

// ============================================================================
// Replies
// ============================================================================

Reply Reply::Simple(std::string s) {
    Reply r;
    r.type = Type::kSimpleString;
    r.str = std::move(s);
    return r;
}

Reply Reply::Error(std::string message) {
    Reply r;
    r.type = Type::kError;
    r.str = std::move(message);
    return r;
}

Reply Reply::Integer(int64_t v) {
    Reply r;
    r.type = Type::kInteger;
    r.integer = v;
    return r;
}

Reply Reply::Bulk(std::string s) {
    Reply r;
    r.type = Type::kBulkString;
    r.str = std::move(s);
    return r;
}

Reply Reply::Array(std::vector<Reply> items) {
    Reply r;
    r.type = Type::kArray;
    r.elements = std::move(items);
    return r;
}

Reply Reply::Double(double v) {
    return Bulk(FormatDouble(v));
}

Reply Reply::FromStatus(const Status& status) {
    if (status.IsWrongType()) {
        return Error("WRONGTYPE Operation against a key holding the wrong kind of value");
    }
    return Error("ERR " + status.message());
}

std::string FormatDouble(double v) {
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    return fmt::format("{}", v);
}

// ============================================================================
// Argument helpers
// ============================================================================

namespace {

Status WrongArity(std::string_view name) {
    return Status::InvalidArgument(fmt::format("wrong number of arguments for '{}' command", ToUpper(name)));
}

Result<int64_t> ParseInt(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return Status::InvalidArgument("value is not an integer or out of range");
    }
    return value;
}

using Args = std::vector<std::string>;

Result<Command> ParsePing(const Args& argv) {
    if (argv.size() > 2) return WrongArity(argv[0]);
    PingCommand cmd;
    if (argv.size() == 2) cmd.message = argv[1];
    return Command{cmd};
}

Result<Command> ParseEcho(const Args& argv) {
    if (argv.size() != 2) return WrongArity(argv[0]);
    return Command{EchoCommand{argv[1]}};
}

// SET key value [NX | XX] [GET] [EX s | PX ms | EXAT s | PXAT ms | KEEPTTL]
Result<Command> ParseSet(const Args& argv) {
    if (argv.size() < 3) return WrongArity(argv[0]);

    SetCommand cmd{argv[1], argv[2], SetOptions()};
    for (size_t i = 3; i < argv.size(); ++i) {
        std::string opt = ToUpper(argv[i]);
        if (opt == "NX" || opt == "XX" || opt == "GET") {
            MEMKV_RETURN_IF_ERROR(cmd.options.Set(opt));
            continue;
        }
        if (opt == "KEEPTTL") {
            MEMKV_RETURN_IF_ERROR(cmd.options.SetExpiry(ExpiryKind::kKeepTtl));
            continue;
        }

        static const std::unordered_map<std::string, ExpiryKind> kExpiryKinds = {
            {"EX", ExpiryKind::kEx}, {"PX", ExpiryKind::kPx},
            {"EXAT", ExpiryKind::kExAt}, {"PXAT", ExpiryKind::kPxAt},
        };
        auto kind = kExpiryKinds.find(opt);
        if (kind == kExpiryKinds.end()) {
            return Status::UnknownOption("unknown option: " + opt);
        }
        if (i + 1 >= argv.size()) {
            return Status::InvalidArgument("missing value for " + opt + " option");
        }
        auto value = ParseInt(argv[++i]);
        if (!value.ok()) return value.status();
        MEMKV_RETURN_IF_ERROR(cmd.options.SetExpiry(kind->second, value.value()));
    }
    return Command{std::move(cmd)};
}

// EXPIRE key seconds [NX | XX | GT | LT], PEXPIRE key millis [...]
Result<Command> ParseExpire(const Args& argv, bool millis) {
    if (argv.size() < 3) return WrongArity(argv[0]);
    auto ttl = ParseInt(argv[2]);
    if (!ttl.ok()) return ttl.status();

    ExpireCommand cmd{argv[1], ttl.value(), millis, ExpireOptions()};
    for (size_t i = 3; i < argv.size(); ++i) {
        MEMKV_RETURN_IF_ERROR(cmd.options.Set(ToUpper(argv[i])));
    }
    return Command{std::move(cmd)};
}

// ZADD key [NX | XX] [GT | LT] [CH] [INCR] score member [score member ...]
Result<Command> ParseZAdd(const Args& argv) {
    if (argv.size() < 4) return WrongArity(argv[0]);

    ZAddCommand cmd{argv[1], {}, ZAddOptions()};
    size_t i = 2;
    for (; i < argv.size(); ++i) {
        if (!cmd.options.IsFlag(argv[i])) break;
        MEMKV_RETURN_IF_ERROR(cmd.options.Set(argv[i]));
    }

    const size_t remaining = argv.size() - i;
    if (remaining == 0 || remaining % 2 != 0) {
        return Status::InvalidArgument("syntax error");
    }
    if (cmd.options.IsIncr() && remaining != 2) {
        return Status::InvalidArgument("INCR option supports a single increment-element pair");
    }

    cmd.members.reserve(remaining / 2);
    for (; i < argv.size(); i += 2) {
        auto score = ParseScore(argv[i]);
        if (!score.ok()) return score.status();
        cmd.members.push_back({argv[i + 1], score.value()});
    }
    return Command{std::move(cmd)};
}

// ZRANGE key start stop [BYSCORE | BYLEX] [REV] [LIMIT offset count] [WITHSCORES]
Result<Command> ParseZRange(const Args& argv) {
    if (argv.size() < 4) return WrongArity(argv[0]);

    ZRangeOptions options;
    for (size_t i = 4; i < argv.size(); ++i) {
        std::string opt = ToUpper(argv[i]);
        if (opt == "LIMIT") {
            if (i + 2 >= argv.size()) {
                return Status::InvalidArgument("syntax error");
            }
            auto offset = ParseInt(argv[i + 1]);
            if (!offset.ok()) return offset.status();
            auto count = ParseInt(argv[i + 2]);
            if (!count.ok()) return count.status();
            MEMKV_RETURN_IF_ERROR(options.SetLimit(offset.value(), count.value()));
            i += 2;
            continue;
        }
        MEMKV_RETURN_IF_ERROR(options.Set(opt));
    }
    MEMKV_RETURN_IF_ERROR(options.Validate());

    // Under REV the score and lex arguments arrive as (max, min)
    const std::string& lo = options.IsRev() ? argv[3] : argv[2];
    const std::string& hi = options.IsRev() ? argv[2] : argv[3];

    RangeBounds bounds;
    switch (options.range_kind()) {
        case RangeKind::kScore: {
            auto range = ParseScoreRange(lo, hi);
            if (!range.ok()) return range.status();
            bounds = range.value();
            break;
        }
        case RangeKind::kLex: {
            auto range = ParseLexRange(lo, hi);
            if (!range.ok()) return range.status();
            bounds = std::move(range).value();
            break;
        }
        case RangeKind::kRank: {
            auto start = ParseInt(argv[2]);
            if (!start.ok()) return start.status();
            auto stop = ParseInt(argv[3]);
            if (!stop.ok()) return stop.status();
            bounds = RankRange{start.value(), stop.value()};
            break;
        }
    }
    return Command{ZRangeCommand{argv[1], std::move(bounds), std::move(options)}};
}

template <typename T>
Result<Command> ParseSingleKey(const Args& argv) {
    if (argv.size() != 2) return WrongArity(argv[0]);
    T cmd{};
    cmd.key = argv[1];
    return Command{std::move(cmd)};
}

Result<Command> ParseMultiKey(const Args& argv, bool exists) {
    if (argv.size() < 2) return WrongArity(argv[0]);
    std::vector<Key> keys(argv.begin() + 1, argv.end());
    if (exists) return Command{ExistsCommand{std::move(keys)}};
    return Command{DelCommand{std::move(keys)}};
}

} // anonymous namespace

// ============================================================================
// Dispatch
// ============================================================================

Result<Command> ParseCommand(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Status::InvalidArgument("empty command");
    }

    const std::string name = ToUpper(argv[0]);

    if (name == "PING") return ParsePing(argv);
    if (name == "ECHO") return ParseEcho(argv);
    if (name == "SET") return ParseSet(argv);
    if (name == "GET") return ParseSingleKey<GetCommand>(argv);
    if (name == "DEL") return ParseMultiKey(argv, false);
    if (name == "EXISTS") return ParseMultiKey(argv, true);
    if (name == "EXPIRE") return ParseExpire(argv, false);
    if (name == "PEXPIRE") return ParseExpire(argv, true);
    if (name == "PERSIST") return ParseSingleKey<PersistCommand>(argv);
    if (name == "TTL" || name == "PTTL") {
        if (argv.size() != 2) return WrongArity(argv[0]);
        return Command{TtlCommand{argv[1], name == "PTTL"}};
    }
    if (name == "KEYS") {
        if (argv.size() != 2) return WrongArity(argv[0]);
        return Command{KeysCommand{argv[1]}};
    }
    if (name == "TYPE") return ParseSingleKey<TypeCommand>(argv);
    if (name == "ZADD") return ParseZAdd(argv);
    if (name == "ZRANGE") return ParseZRange(argv);
    if (name == "ZSCORE") {
        if (argv.size() != 3) return WrongArity(argv[0]);
        return Command{ZScoreCommand{argv[1], argv[2]}};
    }
    if (name == "ZRANK" || name == "ZREVRANK") {
        if (argv.size() != 3) return WrongArity(argv[0]);
        return Command{ZRankCommand{argv[1], argv[2], name == "ZREVRANK"}};
    }
    if (name == "ZCARD") return ParseSingleKey<ZCardCommand>(argv);
    if (name == "ZREM") {
        if (argv.size() < 3) return WrongArity(argv[0]);
        return Command{ZRemCommand{argv[1], std::vector<std::string>(argv.begin() + 2, argv.end())}};
    }
    if (name == "DBSIZE") {
        if (argv.size() != 1) return WrongArity(argv[0]);
        return Command{DbSizeCommand{}};
    }
    if (name == "FLUSHALL") return Command{FlushAllCommand{}};
    // Clients send COMMAND / COMMAND DOCS on connect
    if (name == "COMMAND") return Command{CommandCommand{}};

    return Status::InvalidArgument(fmt::format("unknown command '{}'", argv[0]));
}

} // namespace memkv
