#pragma once

// Keyspace facade - sharded, each shard guarded by one reader-writer lock

#include <memkv/common/types.hpp>
#include <memkv/common/status.hpp>
#include <memkv/engine/command_options.hpp>
#include <memkv/engine/sorted_set.hpp>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace memkv {

using Value = std::variant<std::string, SortedSet>;

struct RankRange {
    int64_t start{0};
    int64_t stop{-1};
};

using RangeBounds = std::variant<RankRange, ScoreRange, LexRange>;

struct SetOutcome {
    bool written{false};
    std::optional<std::string> previous;  // filled when GET was requested
};

struct ZAddOutcome {
    int64_t count{0};
    std::optional<double> score;  // new score under INCR
};

class Store {
public:
    explicit Store(StoreOptions options = {});
    ~Store() = default;
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Strings
    Result<std::optional<std::string>> Get(const Key& key);
    Result<SetOutcome> Set(const Key& key, std::string value, const SetOptions& options = {});

    // Keyspace
    int64_t Del(const std::vector<Key>& keys);
    int64_t Exists(const std::vector<Key>& keys);
    Status Expire(const Key& key, int64_t seconds, const ExpireOptions& options = {});
    Status PExpire(const Key& key, int64_t millis, const ExpireOptions& options = {});
    bool Persist(const Key& key);
    int64_t Ttl(const Key& key);
    int64_t PTtl(const Key& key);
    std::vector<std::string> Keys(std::string_view pattern);
    ValueKind Type(const Key& key);
    size_t DbSize();
    void FlushAll();

    // Sorted sets
    Result<ZAddOutcome> ZAdd(const Key& key, const std::vector<ScoredMember>& members,
                             const ZAddOptions& options = {});
    Result<std::vector<ScoredMember>> ZRange(const Key& key, const RangeBounds& bounds,
                                             const ZRangeOptions& options = {});
    Result<std::optional<double>> ZScore(const Key& key, const std::string& member);
    // 0-based position in ascending (or with `reverse`, descending) order
    Result<std::optional<int64_t>> ZRank(const Key& key, const std::string& member, bool reverse = false);
    Result<int64_t> ZCard(const Key& key);
    Result<int64_t> ZRem(const Key& key, const std::vector<std::string>& members);

    [[nodiscard]] size_t ShardCount() const { return shards_.size(); }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Value> values;
        std::unordered_map<Key, TimePoint> expires;
    };

    [[nodiscard]] TimePoint Now() const { return options_.clock ? options_.clock() : Clock::now(); }
    Shard& ShardFor(const Key& key);

    // Callers hold the shard lock
    static bool IsExpired(const Shard& shard, const Key& key, TimePoint now);
    static Value* LookupLive(Shard& shard, const Key& key, TimePoint now);
    static bool EraseKey(Shard& shard, const Key& key);

    // Runs fn(const Value*, const Shard&, TimePoint) under a shared lock, or under
    // the exclusive lock when the key has to be lazily expired first.
    template <typename Fn>
    auto WithReadLock(const Key& key, Fn&& fn);

    Status ExpireAfter(const Key& key, Millis ttl, const ExpireOptions& options);
    int64_t RemainingMillis(const Key& key);

    StoreOptions options_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace memkv
