/**
 * @file status.cpp
 * @brief Status code names and formatting
 */

#include <memkv/common/status.hpp>

namespace memkv {

std::string_view StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::kOk: return "OK";
        case StatusCode::kNotFound: return "NotFound";
        case StatusCode::kWrongType: return "WrongType";
        case StatusCode::kPreconditionFailed: return "PreconditionFailed";
        case StatusCode::kInvalidArgument: return "InvalidArgument";
        case StatusCode::kOptionConflict: return "OptionConflict";
        case StatusCode::kUnknownOption: return "UnknownOption";
        case StatusCode::kProtocolError: return "ProtocolError";
        case StatusCode::kIOError: return "IOError";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    std::string result(StatusCodeName(code_));
    if (!message_.empty()) result += ": " + message_;
    return result;
}

} // namespace memkv
