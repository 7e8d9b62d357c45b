/**
 * @file executor.cpp
 * @brief Runs parsed commands against the Store
 */

#include <memkv/command/command.hpp>

#include <spdlog/spdlog.h>

#include <type_traits>

namespace memkv {

namespace {

Reply StringArray(const std::vector<std::string>& items) {
    std::vector<Reply> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(Reply::Bulk(item));
    }
    return Reply::Array(std::move(out));
}

std::string_view TypeName(ValueKind kind) {
    switch (kind) {
        case ValueKind::kString: return "string";
        case ValueKind::kSortedSet: return "zset";
        case ValueKind::kNone: break;
    }
    return "none";
}

Reply RunSet(Store& store, const SetCommand& cmd) {
    auto result = store.Set(cmd.key, cmd.value, cmd.options);
    if (!result.ok()) {
        // Unmet NX / XX is a null reply, not an error
        if (result.status().IsPreconditionFailed()) return Reply::Null();
        return Reply::FromStatus(result.status());
    }
    if (!cmd.options.IsGet()) return Reply::Simple("OK");
    const auto& previous = result.value().previous;
    return previous ? Reply::Bulk(*previous) : Reply::Null();
}

Reply RunExpire(Store& store, const ExpireCommand& cmd) {
    Status s = cmd.millis ? store.PExpire(cmd.key, cmd.ttl, cmd.options)
                          : store.Expire(cmd.key, cmd.ttl, cmd.options);
    if (s.ok()) return Reply::Integer(1);
    if (s.IsNotFound() || s.IsPreconditionFailed()) return Reply::Integer(0);
    return Reply::FromStatus(s);
}

Reply RunZAdd(Store& store, const ZAddCommand& cmd) {
    auto result = store.ZAdd(cmd.key, cmd.members, cmd.options);
    if (!result.ok()) {
        // INCR against a missing member or key
        if (result.status().IsNotFound()) return Reply::Null();
        return Reply::FromStatus(result.status());
    }
    if (cmd.options.IsIncr()) {
        const auto& score = result.value().score;
        return score ? Reply::Double(*score) : Reply::Null();
    }
    return Reply::Integer(result.value().count);
}

Reply RunZRange(Store& store, const ZRangeCommand& cmd) {
    auto result = store.ZRange(cmd.key, cmd.bounds, cmd.options);
    if (!result.ok()) return Reply::FromStatus(result.status());

    const bool with_scores = cmd.options.IsWithScores();
    std::vector<Reply> out;
    out.reserve(result.value().size() * (with_scores ? 2 : 1));
    for (const auto& item : result.value()) {
        out.push_back(Reply::Bulk(item.member));
        if (with_scores) out.push_back(Reply::Double(item.score));
    }
    return Reply::Array(std::move(out));
}

} // anonymous namespace

Reply Execute(Store& store, const Command& command) {
    return std::visit([&store](const auto& cmd) -> Reply {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, PingCommand>) {
            return cmd.message ? Reply::Bulk(*cmd.message) : Reply::Simple("PONG");
        }
        else if constexpr (std::is_same_v<T, EchoCommand>) {
            return Reply::Bulk(cmd.message);
        }
        else if constexpr (std::is_same_v<T, SetCommand>) {
            return RunSet(store, cmd);
        }
        else if constexpr (std::is_same_v<T, GetCommand>) {
            auto result = store.Get(cmd.key);
            if (!result.ok()) return Reply::FromStatus(result.status());
            return result.value() ? Reply::Bulk(*result.value()) : Reply::Null();
        }
        else if constexpr (std::is_same_v<T, DelCommand>) {
            return Reply::Integer(store.Del(cmd.keys));
        }
        else if constexpr (std::is_same_v<T, ExistsCommand>) {
            return Reply::Integer(store.Exists(cmd.keys));
        }
        else if constexpr (std::is_same_v<T, ExpireCommand>) {
            return RunExpire(store, cmd);
        }
        else if constexpr (std::is_same_v<T, PersistCommand>) {
            return Reply::Integer(store.Persist(cmd.key) ? 1 : 0);
        }
        else if constexpr (std::is_same_v<T, TtlCommand>) {
            return Reply::Integer(cmd.millis ? store.PTtl(cmd.key) : store.Ttl(cmd.key));
        }
        else if constexpr (std::is_same_v<T, KeysCommand>) {
            return StringArray(store.Keys(cmd.pattern));
        }
        else if constexpr (std::is_same_v<T, TypeCommand>) {
            return Reply::Simple(std::string(TypeName(store.Type(cmd.key))));
        }
        else if constexpr (std::is_same_v<T, ZAddCommand>) {
            return RunZAdd(store, cmd);
        }
        else if constexpr (std::is_same_v<T, ZRangeCommand>) {
            return RunZRange(store, cmd);
        }
        else if constexpr (std::is_same_v<T, ZScoreCommand>) {
            auto result = store.ZScore(cmd.key, cmd.member);
            if (!result.ok()) return Reply::FromStatus(result.status());
            return result.value() ? Reply::Double(*result.value()) : Reply::Null();
        }
        else if constexpr (std::is_same_v<T, ZRankCommand>) {
            auto result = store.ZRank(cmd.key, cmd.member, cmd.reverse);
            if (!result.ok()) return Reply::FromStatus(result.status());
            return result.value() ? Reply::Integer(*result.value()) : Reply::Null();
        }
        else if constexpr (std::is_same_v<T, ZCardCommand>) {
            auto result = store.ZCard(cmd.key);
            if (!result.ok()) return Reply::FromStatus(result.status());
            return Reply::Integer(result.value());
        }
        else if constexpr (std::is_same_v<T, ZRemCommand>) {
            auto result = store.ZRem(cmd.key, cmd.members);
            if (!result.ok()) return Reply::FromStatus(result.status());
            return Reply::Integer(result.value());
        }
        else if constexpr (std::is_same_v<T, DbSizeCommand>) {
            return Reply::Integer(static_cast<int64_t>(store.DbSize()));
        }
        else if constexpr (std::is_same_v<T, FlushAllCommand>) {
            store.FlushAll();
            return Reply::Simple("OK");
        }
        else {
            static_assert(std::is_same_v<T, CommandCommand>);
            return Reply::Array();
        }
    }, command);
}

Reply Dispatch(Store& store, const std::vector<std::string>& argv) {
    auto command = ParseCommand(argv);
    if (!command.ok()) {
        spdlog::debug("Rejected command '{}': {}", argv.empty() ? "" : argv[0], command.status().ToString());
        return Reply::FromStatus(command.status());
    }
    return Execute(store, command.value());
}

} // namespace memkv
