#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <utility>

namespace memkv {

enum class StatusCode {
    kOk, kNotFound, kWrongType, kPreconditionFailed, kInvalidArgument,
    kOptionConflict, kUnknownOption, kProtocolError, kIOError
};

std::string_view StatusCodeName(StatusCode code);

class Status {
public:
    Status() : code_(StatusCode::kOk) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }
    static Status WrongType(std::string msg = "") { return Status(StatusCode::kWrongType, std::move(msg)); }
    static Status PreconditionFailed(std::string msg = "") { return Status(StatusCode::kPreconditionFailed, std::move(msg)); }
    static Status InvalidArgument(std::string msg = "") { return Status(StatusCode::kInvalidArgument, std::move(msg)); }
    static Status OptionConflict(std::string msg = "") { return Status(StatusCode::kOptionConflict, std::move(msg)); }
    static Status UnknownOption(std::string msg = "") { return Status(StatusCode::kUnknownOption, std::move(msg)); }
    static Status ProtocolError(std::string msg = "") { return Status(StatusCode::kProtocolError, std::move(msg)); }
    static Status IOError(std::string msg = "") { return Status(StatusCode::kIOError, std::move(msg)); }

    [[nodiscard]] bool ok() const { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool IsNotFound() const { return code_ == StatusCode::kNotFound; }
    [[nodiscard]] bool IsWrongType() const { return code_ == StatusCode::kWrongType; }
    [[nodiscard]] bool IsPreconditionFailed() const { return code_ == StatusCode::kPreconditionFailed; }
    [[nodiscard]] bool IsInvalidArgument() const { return code_ == StatusCode::kInvalidArgument; }
    [[nodiscard]] bool IsOptionConflict() const { return code_ == StatusCode::kOptionConflict; }
    [[nodiscard]] bool IsUnknownOption() const { return code_ == StatusCode::kUnknownOption; }
    [[nodiscard]] bool IsProtocolError() const { return code_ == StatusCode::kProtocolError; }
    [[nodiscard]] StatusCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    [[nodiscard]] std::string ToString() const;

    explicit operator bool() const { return ok(); }

private:
    Status(StatusCode code, std::string msg) : code_(code), message_(std::move(msg)) {}
    StatusCode code_;
    std::string message_;
};

// Result<T> - value or error Status
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Status status) : data_(std::move(status)) {
        if (std::get<Status>(data_).ok())
            data_ = Status::InvalidArgument("Result with Ok but no value");
    }

    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Error(Status status) { return Result(std::move(status)); }

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }
    [[nodiscard]] const T* operator->() const { return &std::get<T>(data_); }
    [[nodiscard]] T* operator->() { return &std::get<T>(data_); }
    [[nodiscard]] const T& operator*() const& { return std::get<T>(data_); }
    [[nodiscard]] T& operator*() & { return std::get<T>(data_); }

    [[nodiscard]] Status status() const {
        return ok() ? Status::Ok() : std::get<Status>(data_);
    }

    [[nodiscard]] T value_or(T def) const& { return ok() ? std::get<T>(data_) : def; }

private:
    std::variant<T, Status> data_;
};

#define MEMKV_RETURN_IF_ERROR(expr) \
    do { auto _s = (expr); if (!_s.ok()) return _s; } while (0)

#define MEMKV_ASSIGN_OR_RETURN(var, expr) \
    auto _r_##var = (expr); \
    if (!_r_##var.ok()) return _r_##var.status(); \
    var = std::move(_r_##var.value())

} // namespace memkv
