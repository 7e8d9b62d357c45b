#pragma once

// RESP framing: requests are arrays of bulk strings (or an inline line),
// replies are the five RESP2 types.

#include <memkv/command/command.hpp>
#include <memkv/common/status.hpp>
#include <memkv/config.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memkv {

struct ParsedRequest {
    std::vector<std::string> argv;
    size_t consumed{0};  // bytes taken from the front of the buffer
};

struct ParsedReply {
    Reply reply;
    size_t consumed{0};
};

class Resp {
public:
    // nullopt while the buffer holds only part of a request
    static Result<std::optional<ParsedRequest>> ParseRequest(std::string_view data);
    static Result<std::optional<ParsedReply>> ParseReply(std::string_view data);

    static std::string EncodeReply(const Reply& reply);
    static std::string EncodeRequest(const std::vector<std::string>& argv);

    // Splits an inline command line on blanks; "double quoted" words may hold
    // blanks and the escapes \" \\ \n \r \t
    static Result<std::vector<std::string>> SplitArgs(std::string_view line);

private:
    static void AppendReply(std::string& out, const Reply& reply);

    // Finds the CRLF-terminated line at `offset`; nullopt if not yet complete
    static std::optional<std::string_view> ReadLine(std::string_view data, size_t& offset);
    static Result<int64_t> ParseLength(std::string_view line);
    static Result<std::optional<ParsedReply>> ParseReplyAt(std::string_view data, size_t offset, int depth);
    static Result<std::optional<ParsedRequest>> ParseInline(std::string_view data);
};

} // namespace memkv
