/**
 * @file command_options.cpp
 * @brief Option dialects for SET, EXPIRE, ZADD and ZRANGE
 */

#include <memkv/engine/command_options.hpp>

namespace memkv {

Status CommandOptions::Set(std::string_view name) {
    const std::string upper = ToUpper(name);
    if (value_options_.count(upper) != 0) {
        return Status::InvalidArgument("option " + upper + " requires a value");
    }
    return registry_.Activate(upper);
}

bool CommandOptions::IsFlag(std::string_view name) const {
    return registry_.IsRegistered(name) && value_options_.count(ToUpper(name)) == 0;
}

void CommandOptions::RegisterValueOption(std::string_view name,
                                         std::initializer_list<std::string_view> incompatible) {
    registry_.Register(name, incompatible);
    value_options_.insert(ToUpper(name));
}

// ============================================================================
// SET
// ============================================================================

SetOptions::SetOptions() {
    registry_.Register("NX", {"XX"});
    registry_.Register("XX", {"NX"});
    registry_.Register("GET");
    RegisterValueOption("EX", {"PX", "EXAT", "PXAT", "KEEPTTL"});
    RegisterValueOption("PX", {"EX", "EXAT", "PXAT", "KEEPTTL"});
    RegisterValueOption("EXAT", {"EX", "PX", "PXAT", "KEEPTTL"});
    RegisterValueOption("PXAT", {"EX", "PX", "EXAT", "KEEPTTL"});
    RegisterValueOption("KEEPTTL", {"EX", "PX", "EXAT", "PXAT"});
}

Status SetOptions::SetExpiry(ExpiryKind kind, int64_t value) {
    std::string_view name;
    switch (kind) {
        case ExpiryKind::kEx: name = "EX"; break;
        case ExpiryKind::kPx: name = "PX"; break;
        case ExpiryKind::kExAt: name = "EXAT"; break;
        case ExpiryKind::kPxAt: name = "PXAT"; break;
        case ExpiryKind::kKeepTtl: name = "KEEPTTL"; break;
        case ExpiryKind::kNone: return Status::InvalidArgument("invalid expiry type");
    }

    if (kind != ExpiryKind::kKeepTtl && value <= 0) {
        return Status::InvalidArgument("invalid expire time in '" + std::string(name) + "'");
    }
    const bool absolute = kind == ExpiryKind::kExAt || kind == ExpiryKind::kPxAt;
    const bool in_seconds = kind == ExpiryKind::kEx || kind == ExpiryKind::kExAt;
    const int64_t limit = absolute ? ToUnixMillis(Clock::now()) + kMaxExpireMillis : kMaxExpireMillis;
    if (value > (in_seconds ? limit / 1000 : limit)) {
        return Status::InvalidArgument("invalid expire time in '" + std::string(name) + "'");
    }
    if (expiry_kind_ == kind) {
        return Status::OptionConflict("option " + std::string(name) + " given twice");
    }

    MEMKV_RETURN_IF_ERROR(registry_.Activate(name));
    expiry_kind_ = kind;
    expiry_value_ = value;
    return Status::Ok();
}

std::optional<TimePoint> SetOptions::ResolveExpiry(TimePoint now) const {
    switch (expiry_kind_) {
        case ExpiryKind::kEx: return now + Seconds(expiry_value_);
        case ExpiryKind::kPx: return now + Millis(expiry_value_);
        case ExpiryKind::kExAt: return FromUnixMillis(expiry_value_ * 1000);
        case ExpiryKind::kPxAt: return FromUnixMillis(expiry_value_);
        case ExpiryKind::kNone:
        case ExpiryKind::kKeepTtl:
            break;
    }
    return std::nullopt;
}

// ============================================================================
// EXPIRE
// ============================================================================

ExpireOptions::ExpireOptions() {
    registry_.Register("NX", {"XX", "GT", "LT"});
    registry_.Register("XX", {"NX", "GT", "LT"});
    registry_.Register("GT", {"NX", "XX", "LT"});
    registry_.Register("LT", {"NX", "XX", "GT"});
}

// ============================================================================
// ZADD
// ============================================================================

ZAddOptions::ZAddOptions() {
    registry_.Register("NX", {"XX"});
    registry_.Register("XX", {"NX"});
    registry_.Register("GT", {"LT"});
    registry_.Register("LT", {"GT"});
    registry_.Register("CH");
    registry_.Register("INCR", {"NX", "XX", "GT", "LT"});
}

// ============================================================================
// ZRANGE
// ============================================================================

ZRangeOptions::ZRangeOptions() {
    registry_.Register("BYSCORE", {"BYLEX"});
    registry_.Register("BYLEX", {"BYSCORE"});
    registry_.Register("REV");
    registry_.Register("WITHSCORES");
    RegisterValueOption("LIMIT");
}

Status ZRangeOptions::SetLimit(int64_t offset, int64_t count) {
    MEMKV_RETURN_IF_ERROR(registry_.Activate("LIMIT"));
    limit_offset_ = offset;
    limit_count_ = count;
    return Status::Ok();
}

Status ZRangeOptions::Validate() const {
    if (HasLimit() && range_kind() == RangeKind::kRank) {
        return Status::InvalidArgument(
            "syntax error, LIMIT is only supported in combination with either BYSCORE or BYLEX");
    }
    return Status::Ok();
}

RangeKind ZRangeOptions::range_kind() const {
    if (IsByScore()) return RangeKind::kScore;
    if (IsByLex()) return RangeKind::kLex;
    return RangeKind::kRank;
}

} // namespace memkv
