/**
 * @file memkv-cli.cpp
 * @brief Interactive RESP client
 */

#include <memkv/network/resp.hpp>
#include <memkv/config.hpp>

#include <iostream>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace {

int connect_to_server(const std::string& host, uint16_t port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close(sock);
        return -1;
    }

    if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(sock);
        return -1;
    }
    return sock;
}

bool send_request(int sock, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(sock, data.data() + sent, data.size() - sent, 0);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Reads until one whole reply is buffered
memkv::Result<memkv::Reply> receive_reply(int sock, std::string& buffer) {
    std::vector<char> chunk(4096);
    while (true) {
        auto parsed = memkv::Resp::ParseReply(buffer);
        if (!parsed.ok()) return parsed.status();
        if (parsed.value()) {
            buffer.erase(0, parsed.value()->consumed);
            return std::move(parsed.value()->reply);
        }

        ssize_t received = recv(sock, chunk.data(), chunk.size(), 0);
        if (received <= 0) {
            return memkv::Status::IOError("connection closed by server");
        }
        buffer.append(chunk.data(), static_cast<size_t>(received));
    }
}

// redis-cli layout: numbered array entries, (nil), (integer), (error)
void print_reply(const memkv::Reply& reply, const std::string& indent = "") {
    using Type = memkv::Reply::Type;
    switch (reply.type) {
        case Type::kNull:
            std::cout << "(nil)" << std::endl;
            break;
        case Type::kSimpleString:
            std::cout << reply.str << std::endl;
            break;
        case Type::kError:
            std::cout << "(error) " << reply.str << std::endl;
            break;
        case Type::kInteger:
            std::cout << "(integer) " << reply.integer << std::endl;
            break;
        case Type::kBulkString:
            std::cout << '"' << reply.str << '"' << std::endl;
            break;
        case Type::kArray:
            if (reply.elements.empty()) {
                std::cout << "(empty array)" << std::endl;
                break;
            }
            for (size_t i = 0; i < reply.elements.size(); ++i) {
                std::string prefix = std::to_string(i + 1) + ") ";
                std::cout << (i == 0 ? "" : indent) << prefix;
                print_reply(reply.elements[i], indent + std::string(prefix.size(), ' '));
            }
            break;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    uint16_t port = memkv::kDefaultPort;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--help") {
            std::cout << "Usage: memkv-cli [options]" << std::endl;
            std::cout << "  -h, --host <host>  Server address (default: 127.0.0.1)" << std::endl;
            std::cout << "  -p, --port <port>  Server port (default: " << memkv::kDefaultPort << ")" << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    int sock = connect_to_server(host, port);
    if (sock < 0) {
        std::cerr << "Could not connect to " << host << ":" << port << std::endl;
        return 1;
    }

    const std::string prompt = host + ":" + std::to_string(port) + "> ";
    std::string buffer;
    std::string line;
    while (true) {
        std::cout << prompt << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        auto words = memkv::Resp::SplitArgs(line);
        if (!words.ok()) {
            std::cout << "Invalid argument(s)" << std::endl;
            continue;
        }
        if (words.value().empty()) {
            continue;
        }

        std::string cmd = memkv::ToUpper(words.value()[0]);
        if (cmd == "QUIT" || cmd == "EXIT") {
            break;
        }

        if (!send_request(sock, memkv::Resp::EncodeRequest(words.value()))) {
            std::cerr << "Failed to send request" << std::endl;
            break;
        }

        auto reply = receive_reply(sock, buffer);
        if (!reply.ok()) {
            std::cerr << reply.status().ToString() << std::endl;
            break;
        }
        print_reply(reply.value());
    }

    close(sock);
    return 0;
}
