/**
 * @file main.cpp
 * @brief memkv server entry point
 */

#include <memkv/store.hpp>
#include <memkv/network/server.hpp>
#include <memkv/config.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};

    void SignalHandler(int) {
        g_running.store(false);
    }
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --port <port>            Listen port (default: " << memkv::kDefaultPort << ")" << std::endl;
    std::cout << "  --bind <addr>            Bind address (default: " << memkv::kDefaultBindAddress << ")" << std::endl;
    std::cout << "  --shards <n>             Keyspace shards (default: " << memkv::kDefaultShardCount << ")" << std::endl;
    std::cout << "  --max-connections <n>    Client limit (default: " << memkv::kMaxConnections << ")" << std::endl;
    std::cout << "  --log-level <level>      trace, debug, info, warn, error (default: info)" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    try {
        memkv::StoreOptions store_options;
        memkv::ServerOptions server_options;
        std::string log_level = "info";

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            const bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return 0;
            }
            else if (arg == "--port" && has_value) {
                server_options.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--bind" && has_value) {
                server_options.bind_address = argv[++i];
            }
            else if (arg == "--shards" && has_value) {
                store_options.num_shards = std::stoul(argv[++i]);
            }
            else if (arg == "--max-connections" && has_value) {
                server_options.max_connections = std::stoul(argv[++i]);
            }
            else if (arg == "--log-level" && has_value) {
                log_level = argv[++i];
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                PrintUsage(argv[0]);
                return 1;
            }
        }

        auto console = spdlog::stdout_color_mt("memkv");
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        auto level = spdlog::level::from_str(log_level);
        if (level == spdlog::level::off && log_level != "off") {
            spdlog::warn("Unknown log level '{}', using info", log_level);
            level = spdlog::level::info;
        }
        spdlog::set_level(level);

        std::signal(SIGINT, SignalHandler);
        std::signal(SIGTERM, SignalHandler);

        spdlog::info("memkv v{} starting ({} shards)", memkv::kVersion, store_options.num_shards);

        memkv::Store store(store_options);
        memkv::Server server(server_options, &store);

        memkv::Status s = server.Start();
        if (!s.ok()) {
            spdlog::error("Failed to start server: {}", s.ToString());
            return 1;
        }
        spdlog::info("Press Ctrl+C to stop");

        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(memkv::kAcceptPollMillis));
        }

        spdlog::info("Shutting down...");
        server.Stop();

        auto stats = server.GetStats();
        spdlog::info("Final stats: {} keys, {} connections, {} commands, {} bytes in, {} bytes out",
                     store.DbSize(), stats.connections_accepted, stats.commands_processed,
                     stats.bytes_received, stats.bytes_sent);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
