#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace memkv {

// Version
inline constexpr std::string_view kVersion = "1.0.0";

// SkipList
inline constexpr int kSkipListMaxLevel = 32;
inline constexpr double kSkipListProbability = 0.25;

// Store
inline constexpr size_t kDefaultShardCount = 16;
inline constexpr int kGlobMaxNesting = 1000;

// TTL sentinels
inline constexpr int64_t kTtlNoExpiry = -1;
inline constexpr int64_t kTtlNoKey = -2;

// Longest relative expiry accepted (100 years); keeps deadlines inside the clock's range
inline constexpr int64_t kMaxExpireMillis = 100LL * 365 * 24 * 3600 * 1000;

// Network
inline constexpr uint16_t kDefaultPort = 6379;
inline constexpr std::string_view kDefaultBindAddress = "0.0.0.0";
inline constexpr size_t kMaxConnections = 1024;
inline constexpr size_t kReadBufferSize = 16 * 1024;
inline constexpr int kAcceptPollMillis = 100;
inline constexpr int kListenBacklog = 128;

// Protocol limits
namespace resp {
    inline constexpr int64_t kMaxArrayLength = 1024 * 1024;
    inline constexpr int64_t kMaxBulkLength = 512LL * 1024 * 1024;
    inline constexpr size_t kMaxInlineLength = 64 * 1024;
}

} // namespace memkv
