/**
 * @file server.cpp
 * @brief Thread-per-connection TCP server speaking RESP
 */

#include <memkv/network/server.hpp>
#include <memkv/network/resp.hpp>
#include <memkv/command/command.hpp>
#include <memkv/store.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include <sys/select.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace memkv {

namespace {

// Waits up to kAcceptPollMillis for `fd` to become readable
int WaitReadable(int fd) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);

    timeval timeout;
    timeout.tv_sec = 0;
    timeout.tv_usec = kAcceptPollMillis * 1000;

    return select(fd + 1, &read_fds, nullptr, nullptr, &timeout);
}

std::string PeerAddress(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

Server::Server(ServerOptions options, Store* store)
    : options_(std::move(options))
    , store_(store)
    , port_(options_.port) {
}

Server::~Server() {
    Stop();
}

Status Server::Start() {
    if (running_.load()) {
        return Status::InvalidArgument("server already running");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (inet_pton(AF_INET, options_.bind_address.c_str(), &addr.sin_addr) != 1) {
        return Status::InvalidArgument("invalid bind address: " + options_.bind_address);
    }

    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return Status::IOError(std::string("failed to create socket: ") + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return Status::IOError("failed to bind " + options_.bind_address + ":" +
                               std::to_string(options_.port) + ": " + err);
    }

    if (listen(listen_fd_, kListenBacklog) < 0) {
        std::string err = std::strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return Status::IOError("failed to listen: " + err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    accept_thread_ = std::thread([this] { AcceptLoop(); });

    spdlog::info("Server listening on {}:{}", options_.bind_address, port_);
    return Status::Ok();
}

void Server::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }

    // Clients notice running_ within one poll interval, after the batch in hand
    std::list<std::unique_ptr<Connection>> draining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        draining.swap(connections_);
    }
    for (auto& conn : draining) {
        if (conn->thread.joinable()) conn->thread.join();
    }

    spdlog::info("Server stopped ({} connections served, {} commands)",
                 stats_.connections_accepted.load(), stats_.commands_processed.load());
}

Server::Stats Server::GetStats() const {
    Stats s;
    s.connections_accepted = stats_.connections_accepted.load();
    s.connections_rejected = stats_.connections_rejected.load();
    s.active_connections = stats_.active_connections.load();
    s.commands_processed = stats_.commands_processed.load();
    s.bytes_received = stats_.bytes_received.load();
    s.bytes_sent = stats_.bytes_sent.load();
    return s;
}

// ============================================================================
// Accept loop
// ============================================================================

void Server::ReapFinished() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->finished.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void Server::AcceptLoop() {
    while (running_.load()) {
        ReapFinished();

        if (WaitReadable(listen_fd_) <= 0) {
            continue;
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int fd = accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (fd < 0) {
            spdlog::debug("Accept failed: {}", std::strerror(errno));
            continue;
        }

        std::string peer = PeerAddress(client_addr);

        if (stats_.active_connections.load() >= options_.max_connections) {
            spdlog::warn("Rejecting {}: max number of clients reached", peer);
            stats_.connections_rejected++;
            SendAll(fd, Resp::EncodeReply(Reply::Error("ERR max number of clients reached")));
            close(fd);
            continue;
        }

        stats_.connections_accepted++;
        stats_.active_connections++;
        spdlog::debug("Accepted connection from {} (fd={})", peer, fd);

        auto conn = std::make_unique<Connection>();
        conn->fd = fd;
        conn->peer = std::move(peer);
        Connection* raw = conn.get();

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(std::move(conn));
        raw->thread = std::thread([this, raw] { HandleClient(raw); });
    }
}

// ============================================================================
// Connection handling
// ============================================================================

bool Server::SendAll(int fd, std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    stats_.bytes_sent += sent;
    return true;
}

void Server::HandleClient(Connection* conn) {
    std::vector<char> buffer(kReadBufferSize);
    std::string pending;
    bool open = true;

    while (open && running_.load()) {
        int ready = WaitReadable(conn->fd);
        if (ready < 0 && errno != EINTR) break;
        if (ready <= 0) continue;

        ssize_t received = recv(conn->fd, buffer.data(), buffer.size(), 0);
        if (received <= 0) {
            spdlog::debug("Client {} disconnected", conn->peer);
            break;
        }
        stats_.bytes_received += static_cast<uint64_t>(received);
        pending.append(buffer.data(), static_cast<size_t>(received));

        // Execute every complete request in the buffer, reply in one write
        std::string out;
        size_t offset = 0;
        while (offset < pending.size()) {
            auto parsed = Resp::ParseRequest(std::string_view(pending).substr(offset));
            if (!parsed.ok()) {
                spdlog::warn("Protocol error from {}: {}", conn->peer, parsed.status().message());
                out += Resp::EncodeReply(Reply::Error("ERR Protocol error: " + parsed.status().message()));
                open = false;
                break;
            }
            if (!parsed.value()) break;

            const ParsedRequest& request = *parsed.value();
            offset += request.consumed;
            if (request.argv.empty()) continue;

            out += Resp::EncodeReply(Dispatch(*store_, request.argv));
            stats_.commands_processed++;
        }
        pending.erase(0, offset);

        if (!out.empty() && !SendAll(conn->fd, out)) {
            spdlog::debug("Failed to write to {}", conn->peer);
            break;
        }
    }

    close(conn->fd);
    stats_.active_connections--;
    conn->finished.store(true);
}

} // namespace memkv
