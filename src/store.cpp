/**
 * @file store.cpp
 * @brief Keyspace: strings, sorted sets and lazy expiry
 */

#include <memkv/store.hpp>
#include <memkv/engine/glob.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>

namespace memkv {

namespace {

constexpr std::string_view kWrongTypeMessage = "Operation against a key holding the wrong kind of value";

bool IsSortedSet(const Value& v) { return std::holds_alternative<SortedSet>(v); }

void ApplyLimit(std::vector<ScoredMember>& items, const ZRangeOptions& options) {
    if (!options.HasLimit()) return;

    const int64_t offset = options.limit_offset();
    if (offset < 0 || static_cast<size_t>(offset) >= items.size()) {
        items.clear();
        return;
    }
    items.erase(items.begin(), items.begin() + offset);

    const int64_t count = options.limit_count();
    if (count >= 0 && static_cast<size_t>(count) < items.size()) {
        items.resize(static_cast<size_t>(count));
    }
}

} // anonymous namespace

// ============================================================================
// Shards and locking
// ============================================================================

Store::Store(StoreOptions options)
    : options_(std::move(options)) {
    size_t n = options_.num_shards == 0 ? 1 : options_.num_shards;
    shards_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
    spdlog::debug("Store created with {} shards", n);
}

Store::Shard& Store::ShardFor(const Key& key) {
    size_t h = std::hash<std::string>{}(key);
    return *shards_[h % shards_.size()];
}

bool Store::IsExpired(const Shard& shard, const Key& key, TimePoint now) {
    auto it = shard.expires.find(key);
    return it != shard.expires.end() && now >= it->second;
}

bool Store::EraseKey(Shard& shard, const Key& key) {
    shard.expires.erase(key);
    return shard.values.erase(key) > 0;
}

Value* Store::LookupLive(Shard& shard, const Key& key, TimePoint now) {
    if (IsExpired(shard, key, now)) {
        EraseKey(shard, key);
        return nullptr;
    }
    auto it = shard.values.find(key);
    return it == shard.values.end() ? nullptr : &it->second;
}

template <typename Fn>
auto Store::WithReadLock(const Key& key, Fn&& fn) {
    Shard& shard = ShardFor(key);
    {
        std::shared_lock lock(shard.mutex);
        TimePoint now = Now();
        if (!IsExpired(shard, key, now)) {
            auto it = shard.values.find(key);
            const Value* value = it == shard.values.end() ? nullptr : &it->second;
            return fn(value, static_cast<const Shard&>(shard), now);
        }
    }

    // Expired under the shared lock: re-check under the exclusive lock, since
    // a writer may have replaced the key in between.
    std::unique_lock lock(shard.mutex);
    TimePoint now = Now();
    const Value* value = LookupLive(shard, key, now);
    return fn(value, static_cast<const Shard&>(shard), now);
}

// ============================================================================
// Strings
// ============================================================================

Result<std::optional<std::string>> Store::Get(const Key& key) {
    return WithReadLock(key, [](const Value* value, const Shard&, TimePoint) -> Result<std::optional<std::string>> {
        if (value == nullptr) return std::optional<std::string>{};
        if (IsSortedSet(*value)) return Status::WrongType(std::string(kWrongTypeMessage));
        return std::optional<std::string>(std::get<std::string>(*value));
    });
}

Result<SetOutcome> Store::Set(const Key& key, std::string value, const SetOptions& options) {
    Shard& shard = ShardFor(key);
    std::unique_lock lock(shard.mutex);
    const TimePoint now = Now();
    Value* current = LookupLive(shard, key, now);

    SetOutcome outcome;
    if (options.IsGet() && current != nullptr) {
        if (IsSortedSet(*current)) return Status::WrongType(std::string(kWrongTypeMessage));
        outcome.previous = std::get<std::string>(*current);
    }

    const bool guard_failed = (options.IsNX() && current != nullptr) || (options.IsXX() && current == nullptr);
    if (guard_failed) {
        if (!options.IsGet()) {
            return Status::PreconditionFailed(options.IsNX() ? "key already exists" : "key does not exist");
        }
        return outcome;
    }

    outcome.written = true;
    if (options.IsKeepTtl()) {
        shard.values.insert_or_assign(key, std::move(value));
        return outcome;
    }

    auto expiry = options.ResolveExpiry(now);
    if (expiry && *expiry <= now) {
        // Already in the past: the write is immediately expired
        EraseKey(shard, key);
        return outcome;
    }

    shard.values.insert_or_assign(key, std::move(value));
    if (expiry) {
        shard.expires[key] = *expiry;
    } else {
        shard.expires.erase(key);
    }
    return outcome;
}

// ============================================================================
// Keyspace
// ============================================================================

int64_t Store::Del(const std::vector<Key>& keys) {
    int64_t removed = 0;
    for (const auto& key : keys) {
        Shard& shard = ShardFor(key);
        std::unique_lock lock(shard.mutex);
        if (LookupLive(shard, key, Now()) != nullptr) {
            EraseKey(shard, key);
            removed++;
        }
    }
    return removed;
}

int64_t Store::Exists(const std::vector<Key>& keys) {
    int64_t found = 0;
    for (const auto& key : keys) {
        found += WithReadLock(key, [](const Value* value, const Shard&, TimePoint) {
            return value != nullptr ? 1 : 0;
        });
    }
    return found;
}

Status Store::Expire(const Key& key, int64_t seconds, const ExpireOptions& options) {
    if (seconds > kMaxExpireMillis / 1000 || seconds < -kMaxExpireMillis / 1000) {
        return Status::InvalidArgument("invalid expire time in 'expire' command");
    }
    return ExpireAfter(key, Seconds(seconds), options);
}

Status Store::PExpire(const Key& key, int64_t millis, const ExpireOptions& options) {
    if (millis > kMaxExpireMillis || millis < -kMaxExpireMillis) {
        return Status::InvalidArgument("invalid expire time in 'pexpire' command");
    }
    return ExpireAfter(key, Millis(millis), options);
}

Status Store::ExpireAfter(const Key& key, Millis ttl, const ExpireOptions& options) {
    Shard& shard = ShardFor(key);
    std::unique_lock lock(shard.mutex);
    const TimePoint now = Now();
    if (LookupLive(shard, key, now) == nullptr) {
        return Status::NotFound("no such key");
    }

    auto it = shard.expires.find(key);
    const bool has_expiry = it != shard.expires.end();

    if (options.IsNX() && has_expiry) {
        return Status::PreconditionFailed("key already has an expiry");
    }
    if (options.IsXX() && !has_expiry) {
        return Status::PreconditionFailed("key has no expiry");
    }
    if (has_expiry) {
        const auto remaining = std::chrono::ceil<Millis>(it->second - now);
        if (options.IsGT() && !(ttl > remaining)) {
            return Status::PreconditionFailed("new expiry is not greater than the current one");
        }
        if (options.IsLT() && !(ttl < remaining)) {
            return Status::PreconditionFailed("new expiry is not less than the current one");
        }
    }

    if (ttl.count() <= 0) {
        EraseKey(shard, key);
        return Status::Ok();
    }
    shard.expires[key] = now + ttl;
    return Status::Ok();
}

bool Store::Persist(const Key& key) {
    Shard& shard = ShardFor(key);
    std::unique_lock lock(shard.mutex);
    if (LookupLive(shard, key, Now()) == nullptr) return false;
    return shard.expires.erase(key) > 0;
}

int64_t Store::RemainingMillis(const Key& key) {
    return WithReadLock(key, [&key](const Value* value, const Shard& shard, TimePoint now) -> int64_t {
        if (value == nullptr) return kTtlNoKey;
        auto it = shard.expires.find(key);
        if (it == shard.expires.end()) return kTtlNoExpiry;
        // A live key has at least 1 ms left
        return std::chrono::ceil<Millis>(it->second - now).count();
    });
}

int64_t Store::PTtl(const Key& key) {
    return RemainingMillis(key);
}

int64_t Store::Ttl(const Key& key) {
    int64_t ms = RemainingMillis(key);
    if (ms < 0) return ms;
    return (ms + 500) / 1000;
}

std::vector<std::string> Store::Keys(std::string_view pattern) {
    std::vector<std::string> keys;
    const bool match_all = pattern == "*";
    for (auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        const TimePoint now = Now();
        for (const auto& [key, value] : shard->values) {
            if (IsExpired(*shard, key, now)) continue;
            if (match_all || GlobMatch(pattern, key)) keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

ValueKind Store::Type(const Key& key) {
    return WithReadLock(key, [](const Value* value, const Shard&, TimePoint) {
        if (value == nullptr) return ValueKind::kNone;
        return IsSortedSet(*value) ? ValueKind::kSortedSet : ValueKind::kString;
    });
}

size_t Store::DbSize() {
    size_t total = 0;
    for (auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        const TimePoint now = Now();
        for (const auto& [key, value] : shard->values) {
            if (!IsExpired(*shard, key, now)) total++;
        }
    }
    return total;
}

void Store::FlushAll() {
    for (auto& shard : shards_) {
        std::unique_lock lock(shard->mutex);
        shard->values.clear();
        shard->expires.clear();
    }
    spdlog::info("Keyspace flushed");
}

// ============================================================================
// Sorted sets
// ============================================================================

Result<ZAddOutcome> Store::ZAdd(const Key& key, const std::vector<ScoredMember>& members,
                                const ZAddOptions& options) {
    if (options.IsIncr() && members.size() != 1) {
        return Status::InvalidArgument("INCR option supports a single increment-element pair");
    }
    for (const auto& m : members) {
        if (std::isnan(m.score)) return Status::InvalidArgument("value is not a valid float");
    }

    Shard& shard = ShardFor(key);
    std::unique_lock lock(shard.mutex);
    Value* current = LookupLive(shard, key, Now());
    if (current != nullptr && !IsSortedSet(*current)) {
        return Status::WrongType(std::string(kWrongTypeMessage));
    }

    ZAddOutcome outcome;
    if (options.IsIncr()) {
        const auto& m = members.front();
        if (current == nullptr) return Status::NotFound("no such member");
        auto& zset = std::get<SortedSet>(*current);
        auto old = zset.Score(m.member);
        if (!old) return Status::NotFound("no such member");
        const double updated = *old + m.score;
        if (std::isnan(updated)) {
            return Status::InvalidArgument("resulting score is not a number (NaN)");
        }
        zset.Add(m.member, updated);
        outcome.count = 1;
        outcome.score = updated;
        return outcome;
    }

    bool created = false;
    if (current == nullptr) {
        current = &shard.values.emplace(key, SortedSet()).first->second;
        created = true;
    }
    auto& zset = std::get<SortedSet>(*current);

    int64_t changed = 0;
    for (const auto& m : members) {
        auto old = zset.Score(m.member);
        if (old) {
            if (options.IsNX()) continue;
            if (options.IsGT() && !(m.score > *old)) continue;
            if (options.IsLT() && !(m.score < *old)) continue;
            if (m.score != *old) {
                zset.Add(m.member, m.score);
                changed++;
            }
        } else {
            if (options.IsXX()) continue;
            zset.Add(m.member, m.score);
            changed++;
        }
    }

    if (created && zset.Empty()) {
        EraseKey(shard, key);
    }

    outcome.count = options.IsCH() ? changed : static_cast<int64_t>(members.size());
    return outcome;
}

Result<std::vector<ScoredMember>> Store::ZRange(const Key& key, const RangeBounds& bounds,
                                                const ZRangeOptions& options) {
    MEMKV_RETURN_IF_ERROR(options.Validate());

    return WithReadLock(key, [&](const Value* value, const Shard&, TimePoint) -> Result<std::vector<ScoredMember>> {
        if (value == nullptr) return std::vector<ScoredMember>{};
        if (!IsSortedSet(*value)) return Status::WrongType(std::string(kWrongTypeMessage));
        const auto& zset = std::get<SortedSet>(*value);
        const bool rev = options.IsRev();

        std::vector<ScoredMember> items;
        if (const auto* rank = std::get_if<RankRange>(&bounds)) {
            items = zset.RangeByRank(rank->start, rank->stop, rev);
        } else if (const auto* score = std::get_if<ScoreRange>(&bounds)) {
            items = zset.RangeByScore(*score, rev);
            ApplyLimit(items, options);
        } else {
            items = zset.RangeByLex(std::get<LexRange>(bounds), rev);
            ApplyLimit(items, options);
        }
        return items;
    });
}

Result<std::optional<double>> Store::ZScore(const Key& key, const std::string& member) {
    return WithReadLock(key, [&member](const Value* value, const Shard&, TimePoint) -> Result<std::optional<double>> {
        if (value == nullptr) return std::optional<double>{};
        if (!IsSortedSet(*value)) return Status::WrongType(std::string(kWrongTypeMessage));
        return std::get<SortedSet>(*value).Score(member);
    });
}

Result<std::optional<int64_t>> Store::ZRank(const Key& key, const std::string& member, bool reverse) {
    return WithReadLock(key, [&member, reverse](const Value* value, const Shard&, TimePoint)
                                 -> Result<std::optional<int64_t>> {
        if (value == nullptr) return std::optional<int64_t>{};
        if (!IsSortedSet(*value)) return Status::WrongType(std::string(kWrongTypeMessage));
        auto rank = std::get<SortedSet>(*value).Rank(member, reverse);
        if (!rank) return std::optional<int64_t>{};
        return std::optional<int64_t>(static_cast<int64_t>(*rank));
    });
}

Result<int64_t> Store::ZCard(const Key& key) {
    return WithReadLock(key, [](const Value* value, const Shard&, TimePoint) -> Result<int64_t> {
        if (value == nullptr) return int64_t{0};
        if (!IsSortedSet(*value)) return Status::WrongType(std::string(kWrongTypeMessage));
        return static_cast<int64_t>(std::get<SortedSet>(*value).Size());
    });
}

Result<int64_t> Store::ZRem(const Key& key, const std::vector<std::string>& members) {
    Shard& shard = ShardFor(key);
    std::unique_lock lock(shard.mutex);
    Value* current = LookupLive(shard, key, Now());
    if (current == nullptr) return int64_t{0};
    if (!IsSortedSet(*current)) return Status::WrongType(std::string(kWrongTypeMessage));

    auto& zset = std::get<SortedSet>(*current);
    int64_t removed = 0;
    for (const auto& member : members) {
        if (zset.Remove(member)) removed++;
    }
    if (zset.Empty()) {
        EraseKey(shard, key);
    }
    return removed;
}

} // namespace memkv
