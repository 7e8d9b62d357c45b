/**
 * @file resp.cpp
 * @brief RESP request/reply framing
 */

#include <memkv/network/resp.hpp>

#include <spdlog/fmt/fmt.h>

#include <charconv>

namespace memkv {

namespace {

constexpr int kMaxReplyDepth = 64;

using RequestResult = Result<std::optional<ParsedRequest>>;
using ReplyResult = Result<std::optional<ParsedReply>>;

RequestResult NeedMoreRequest() { return std::optional<ParsedRequest>{}; }
ReplyResult NeedMoreReply() { return std::optional<ParsedReply>{}; }

bool IsBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Simple strings and errors are single-line on the wire
void AppendLine(std::string& out, char prefix, std::string_view text) {
    out.push_back(prefix);
    for (char c : text) {
        out.push_back(c == '\r' || c == '\n' ? ' ' : c);
    }
    out.append("\r\n");
}

void AppendBulk(std::string& out, std::string_view data) {
    out.push_back('$');
    out.append(std::to_string(data.size()));
    out.append("\r\n");
    out.append(data);
    out.append("\r\n");
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

std::optional<std::string_view> Resp::ReadLine(std::string_view data, size_t& offset) {
    size_t pos = data.find("\r\n", offset);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view line = data.substr(offset, pos - offset);
    offset = pos + 2;
    return line;
}

Result<int64_t> Resp::ParseLength(std::string_view line) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
    if (line.empty() || ec != std::errc() || ptr != line.data() + line.size()) {
        return Status::ProtocolError(fmt::format("invalid length '{}'", line));
    }
    return value;
}

Result<std::vector<std::string>> Resp::SplitArgs(std::string_view line) {
    std::vector<std::string> args;
    size_t i = 0;
    while (true) {
        while (i < line.size() && IsBlank(line[i])) i++;
        if (i >= line.size()) break;

        std::string word;
        if (line[i] == '"') {
            i++;
            bool closed = false;
            while (i < line.size()) {
                char c = line[i++];
                if (c == '"') {
                    closed = true;
                    break;
                }
                if (c == '\\' && i < line.size()) {
                    char e = line[i++];
                    switch (e) {
                        case 'n': word.push_back('\n'); break;
                        case 'r': word.push_back('\r'); break;
                        case 't': word.push_back('\t'); break;
                        default: word.push_back(e); break;
                    }
                    continue;
                }
                word.push_back(c);
            }
            // A closing quote must end the word
            if (!closed || (i < line.size() && !IsBlank(line[i]))) {
                return Status::ProtocolError("unbalanced quotes in request");
            }
        } else {
            while (i < line.size() && !IsBlank(line[i])) word.push_back(line[i++]);
        }
        args.push_back(std::move(word));
    }
    return args;
}

// ============================================================================
// Request Parsing
// ============================================================================

Result<std::optional<ParsedRequest>> Resp::ParseInline(std::string_view data) {
    size_t newline = data.find('\n');
    if (newline == std::string_view::npos) {
        if (data.size() > resp::kMaxInlineLength) {
            return Status::ProtocolError("too big inline request");
        }
        return NeedMoreRequest();
    }

    std::string_view line = data.substr(0, newline);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    auto args = SplitArgs(line);
    if (!args.ok()) return args.status();
    return std::optional<ParsedRequest>(ParsedRequest{std::move(args).value(), newline + 1});
}

Result<std::optional<ParsedRequest>> Resp::ParseRequest(std::string_view data) {
    if (data.empty()) return NeedMoreRequest();
    if (data.front() != '*') return ParseInline(data);

    size_t offset = 1;
    auto header = ReadLine(data, offset);
    if (!header) {
        if (data.size() > resp::kMaxInlineLength) {
            return Status::ProtocolError("multibulk header too long");
        }
        return NeedMoreRequest();
    }

    auto count = ParseLength(*header);
    if (!count.ok()) return Status::ProtocolError("invalid multibulk length");
    if (count.value() > resp::kMaxArrayLength) {
        return Status::ProtocolError("invalid multibulk length");
    }

    ParsedRequest request;
    if (count.value() <= 0) {
        // *0 and *-1 carry no command; the caller skips them
        request.consumed = offset;
        return std::optional<ParsedRequest>(std::move(request));
    }

    request.argv.reserve(static_cast<size_t>(count.value()));
    for (int64_t i = 0; i < count.value(); ++i) {
        if (offset >= data.size()) return NeedMoreRequest();
        if (data[offset] != '$') {
            return Status::ProtocolError(fmt::format("expected '$', got '{}'", data[offset]));
        }
        offset++;

        auto len_line = ReadLine(data, offset);
        if (!len_line) return NeedMoreRequest();
        auto len = ParseLength(*len_line);
        if (!len.ok() || len.value() < 0 || len.value() > resp::kMaxBulkLength) {
            return Status::ProtocolError("invalid bulk length");
        }

        const auto n = static_cast<size_t>(len.value());
        if (data.size() - offset < n + 2) return NeedMoreRequest();
        if (data[offset + n] != '\r' || data[offset + n + 1] != '\n') {
            return Status::ProtocolError("bulk string not terminated by CRLF");
        }
        request.argv.emplace_back(data.substr(offset, n));
        offset += n + 2;
    }

    request.consumed = offset;
    return std::optional<ParsedRequest>(std::move(request));
}

// ============================================================================
// Reply Parsing
// ============================================================================

Result<std::optional<ParsedReply>> Resp::ParseReply(std::string_view data) {
    return ParseReplyAt(data, 0, 0);
}

Result<std::optional<ParsedReply>> Resp::ParseReplyAt(std::string_view data, size_t offset, int depth) {
    if (depth > kMaxReplyDepth) {
        return Status::ProtocolError("reply nested too deeply");
    }
    if (offset >= data.size()) return NeedMoreReply();

    const char type = data[offset++];
    auto line = ReadLine(data, offset);
    if (!line) return NeedMoreReply();

    ParsedReply parsed;
    switch (type) {
        case '+':
            parsed.reply = Reply::Simple(std::string(*line));
            break;
        case '-':
            parsed.reply = Reply::Error(std::string(*line));
            break;
        case ':': {
            auto value = ParseLength(*line);
            if (!value.ok()) return value.status();
            parsed.reply = Reply::Integer(value.value());
            break;
        }
        case '$': {
            auto len = ParseLength(*line);
            if (!len.ok()) return len.status();
            if (len.value() < 0) {
                parsed.reply = Reply::Null();
                break;
            }
            const auto n = static_cast<size_t>(len.value());
            if (data.size() - offset < n + 2) return NeedMoreReply();
            parsed.reply = Reply::Bulk(std::string(data.substr(offset, n)));
            offset += n + 2;
            break;
        }
        case '*': {
            auto count = ParseLength(*line);
            if (!count.ok()) return count.status();
            if (count.value() < 0) {
                parsed.reply = Reply::Null();
                break;
            }
            std::vector<Reply> items;
            for (int64_t i = 0; i < count.value(); ++i) {
                auto item = ParseReplyAt(data, offset, depth + 1);
                if (!item.ok()) return item.status();
                if (!item.value()) return NeedMoreReply();
                items.push_back(std::move(item.value()->reply));
                offset = item.value()->consumed;
            }
            parsed.reply = Reply::Array(std::move(items));
            break;
        }
        default:
            return Status::ProtocolError(fmt::format("unknown reply type '{}'", type));
    }

    parsed.consumed = offset;
    return std::optional<ParsedReply>(std::move(parsed));
}

// ============================================================================
// Encoding
// ============================================================================

void Resp::AppendReply(std::string& out, const Reply& reply) {
    switch (reply.type) {
        case Reply::Type::kNull:
            out.append("$-1\r\n");
            break;
        case Reply::Type::kSimpleString:
            AppendLine(out, '+', reply.str);
            break;
        case Reply::Type::kError:
            AppendLine(out, '-', reply.str);
            break;
        case Reply::Type::kInteger:
            out.push_back(':');
            out.append(std::to_string(reply.integer));
            out.append("\r\n");
            break;
        case Reply::Type::kBulkString:
            AppendBulk(out, reply.str);
            break;
        case Reply::Type::kArray:
            out.push_back('*');
            out.append(std::to_string(reply.elements.size()));
            out.append("\r\n");
            for (const auto& element : reply.elements) {
                AppendReply(out, element);
            }
            break;
    }
}

std::string Resp::EncodeReply(const Reply& reply) {
    std::string out;
    AppendReply(out, reply);
    return out;
}

std::string Resp::EncodeRequest(const std::vector<std::string>& argv) {
    std::string out;
    out.push_back('*');
    out.append(std::to_string(argv.size()));
    out.append("\r\n");
    for (const auto& arg : argv) {
        AppendBulk(out, arg);
    }
    return out;
}

} // namespace memkv
