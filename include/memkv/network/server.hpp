#pragma once

#include <memkv/common/status.hpp>
#include <memkv/common/types.hpp>
#include <memkv/config.hpp>
#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace memkv {

class Store;

// TCP front end: one accept thread polling with a short select() timeout,
// one thread per client connection.
class Server {
public:
    Server(ServerOptions options, Store* store);
    ~Server();
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and starts accepting. Port 0 picks an ephemeral port, see Port().
    Status Start();
    // Stops accepting, lets in-flight requests finish, joins all connections.
    void Stop();

    [[nodiscard]] bool IsRunning() const { return running_.load(); }
    [[nodiscard]] uint16_t Port() const { return port_; }
    [[nodiscard]] size_t NumConnections() const { return stats_.active_connections.load(); }

    struct Stats {
        uint64_t connections_accepted{0};
        uint64_t connections_rejected{0};
        uint64_t active_connections{0};
        uint64_t commands_processed{0};
        uint64_t bytes_received{0};
        uint64_t bytes_sent{0};
    };
    [[nodiscard]] Stats GetStats() const;

private:
    struct Connection {
        int fd{-1};
        std::string peer;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void AcceptLoop();
    void HandleClient(Connection* conn);
    bool SendAll(int fd, std::string_view data);
    void ReapFinished();

    ServerOptions options_;
    Store* store_;
    uint16_t port_;
    int listen_fd_{-1};
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;

    struct AtomicStats {
        std::atomic<uint64_t> connections_accepted{0};
        std::atomic<uint64_t> connections_rejected{0};
        std::atomic<uint64_t> active_connections{0};
        std::atomic<uint64_t> commands_processed{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> bytes_sent{0};
    };
    AtomicStats stats_;
};

} // namespace memkv
