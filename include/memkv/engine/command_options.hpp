#pragma once

#include <memkv/common/status.hpp>
#include <memkv/common/types.hpp>
#include <memkv/engine/option_registry.hpp>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace memkv {

// Base for the per-command option objects; each owns its own registry.
class CommandOptions {
public:
    virtual ~CommandOptions() = default;

    // Activates a plain flag; options that carry a value have their own setter
    Status Set(std::string_view name);
    [[nodiscard]] bool IsSet(std::string_view name) const { return registry_.IsSet(name); }
    [[nodiscard]] bool IsFlag(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> Active() const { return registry_.Active(); }

protected:
    CommandOptions() = default;

    void RegisterValueOption(std::string_view name, std::initializer_list<std::string_view> incompatible = {});

    OptionRegistry registry_;
    std::set<std::string> value_options_;
};

// SET: NX | XX, GET, and one of EX PX EXAT PXAT KEEPTTL
enum class ExpiryKind : uint8_t { kNone, kEx, kPx, kExAt, kPxAt, kKeepTtl };

class SetOptions : public CommandOptions {
public:
    SetOptions();

    Status SetExpiry(ExpiryKind kind, int64_t value = 0);

    [[nodiscard]] bool IsNX() const { return IsSet("NX"); }
    [[nodiscard]] bool IsXX() const { return IsSet("XX"); }
    [[nodiscard]] bool IsGet() const { return IsSet("GET"); }
    [[nodiscard]] bool IsKeepTtl() const { return expiry_kind_ == ExpiryKind::kKeepTtl; }
    [[nodiscard]] ExpiryKind expiry_kind() const { return expiry_kind_; }
    [[nodiscard]] int64_t expiry_value() const { return expiry_value_; }

    // Absolute expiry for EX/PX/EXAT/PXAT, relative ones anchored at `now`
    [[nodiscard]] std::optional<TimePoint> ResolveExpiry(TimePoint now) const;

private:
    ExpiryKind expiry_kind_{ExpiryKind::kNone};
    int64_t expiry_value_{0};
};

// EXPIRE: NX | XX | GT | LT
class ExpireOptions : public CommandOptions {
public:
    ExpireOptions();

    [[nodiscard]] bool IsNX() const { return IsSet("NX"); }
    [[nodiscard]] bool IsXX() const { return IsSet("XX"); }
    [[nodiscard]] bool IsGT() const { return IsSet("GT"); }
    [[nodiscard]] bool IsLT() const { return IsSet("LT"); }
};

// ZADD: NX | XX, GT | LT, CH, INCR (alone among the guards)
class ZAddOptions : public CommandOptions {
public:
    ZAddOptions();

    [[nodiscard]] bool IsNX() const { return IsSet("NX"); }
    [[nodiscard]] bool IsXX() const { return IsSet("XX"); }
    [[nodiscard]] bool IsGT() const { return IsSet("GT"); }
    [[nodiscard]] bool IsLT() const { return IsSet("LT"); }
    [[nodiscard]] bool IsCH() const { return IsSet("CH"); }
    [[nodiscard]] bool IsIncr() const { return IsSet("INCR"); }
};

// ZRANGE: BYSCORE | BYLEX, REV, WITHSCORES, LIMIT offset count
enum class RangeKind : uint8_t { kRank, kScore, kLex };

class ZRangeOptions : public CommandOptions {
public:
    ZRangeOptions();

    Status SetLimit(int64_t offset, int64_t count);
    // LIMIT is only meaningful for BYSCORE / BYLEX
    [[nodiscard]] Status Validate() const;

    [[nodiscard]] RangeKind range_kind() const;
    [[nodiscard]] bool IsByScore() const { return IsSet("BYSCORE"); }
    [[nodiscard]] bool IsByLex() const { return IsSet("BYLEX"); }
    [[nodiscard]] bool IsRev() const { return IsSet("REV"); }
    [[nodiscard]] bool IsWithScores() const { return IsSet("WITHSCORES"); }
    [[nodiscard]] bool HasLimit() const { return IsSet("LIMIT"); }
    [[nodiscard]] int64_t limit_offset() const { return limit_offset_; }
    [[nodiscard]] int64_t limit_count() const { return limit_count_; }

private:
    int64_t limit_offset_{0};
    int64_t limit_count_{-1};
};

} // namespace memkv
