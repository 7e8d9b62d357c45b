#pragma once

// Commands: argv -> typed command -> reply

#include <memkv/common/status.hpp>
#include <memkv/common/types.hpp>
#include <memkv/engine/command_options.hpp>
#include <memkv/store.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace memkv {

// ============================================================================
// Replies
// ============================================================================

struct Reply {
    enum class Type : uint8_t { kNull, kSimpleString, kError, kInteger, kBulkString, kArray };

    Type type{Type::kNull};
    std::string str;
    int64_t integer{0};
    std::vector<Reply> elements;

    static Reply Null() { return Reply{}; }
    static Reply Simple(std::string s);
    static Reply Error(std::string message);
    static Reply Integer(int64_t v);
    static Reply Bulk(std::string s);
    static Reply Array(std::vector<Reply> items = {});
    // Shortest round-trip form: 1, 2.5, inf, -inf
    static Reply Double(double v);
    // WRONGTYPE ... for kWrongType, ERR <message> otherwise
    static Reply FromStatus(const Status& status);

    [[nodiscard]] bool IsNull() const { return type == Type::kNull; }
    [[nodiscard]] bool IsError() const { return type == Type::kError; }

    bool operator==(const Reply& o) const {
        return type == o.type && str == o.str && integer == o.integer && elements == o.elements;
    }
};

std::string FormatDouble(double v);

// ============================================================================
// Commands
// ============================================================================

struct PingCommand { std::optional<std::string> message; };
struct EchoCommand { std::string message; };
struct SetCommand { Key key; std::string value; SetOptions options; };
struct GetCommand { Key key; };
struct DelCommand { std::vector<Key> keys; };
struct ExistsCommand { std::vector<Key> keys; };
struct ExpireCommand {
    Key key;
    int64_t ttl{0};
    bool millis{false};  // PEXPIRE
    ExpireOptions options;
};
struct PersistCommand { Key key; };
struct TtlCommand { Key key; bool millis{false}; };
struct KeysCommand { std::string pattern; };
struct TypeCommand { Key key; };
struct ZAddCommand { Key key; std::vector<ScoredMember> members; ZAddOptions options; };
struct ZRangeCommand { Key key; RangeBounds bounds; ZRangeOptions options; };
struct ZScoreCommand { Key key; std::string member; };
struct ZRankCommand { Key key; std::string member; bool reverse; };
struct ZCardCommand { Key key; };
struct ZRemCommand { Key key; std::vector<std::string> members; };
struct DbSizeCommand {};
struct FlushAllCommand {};
struct CommandCommand {};

using Command = std::variant<
    PingCommand, EchoCommand, SetCommand, GetCommand, DelCommand, ExistsCommand,
    ExpireCommand, PersistCommand, TtlCommand, KeysCommand, TypeCommand,
    ZAddCommand, ZRangeCommand, ZScoreCommand, ZRankCommand, ZCardCommand, ZRemCommand,
    DbSizeCommand, FlushAllCommand, CommandCommand>;

// Case-insensitive on command and option names. Arity, numbers and option
// combinations are validated here; nothing touches the store.
Result<Command> ParseCommand(const std::vector<std::string>& argv);

// Runs a parsed command. Engine errors become error replies.
Reply Execute(Store& store, const Command& command);

// Parse + execute; parse errors become error replies
Reply Dispatch(Store& store, const std::vector<std::string>& argv);

} // namespace memkv
