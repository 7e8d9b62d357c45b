#pragma once

#include <memkv/config.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace memkv {

using Key = std::string;

// Expiry instants are wall-clock so EXAT / PXAT map directly onto them.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;
using ClockFn = std::function<TimePoint()>;

inline int64_t ToUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

inline TimePoint FromUnixMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(Millis(ms)));
}

struct ScoredMember {
    std::string member;
    double score{0.0};

    bool operator==(const ScoredMember& o) const { return member == o.member && score == o.score; }
};

enum class ValueKind : uint8_t { kNone, kString, kSortedSet };

struct StoreOptions {
    size_t num_shards = kDefaultShardCount;
    ClockFn clock;  // defaults to Clock::now when empty
};

struct ServerOptions {
    std::string bind_address{kDefaultBindAddress};
    uint16_t port = kDefaultPort;
    size_t max_connections = kMaxConnections;
};

} // namespace memkv
