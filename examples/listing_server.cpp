// listing_server: authoritative sync server over TCP
//
// Usage: listing_server [--port N] [--data-file PATH] [--workers N]
//                       [--persistence best_effort|durable]

#include <listing-sync/listing_sync.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <exception>
#include <optional>
#include <thread>
#include <vector>

namespace ls = listing_sync;
namespace asio = boost::asio;

int main(int argc, char* argv[]) {
    auto config = std::optional<ls::ServerConfig>{};
    try {
        config = ls::parse_server_config(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "listing_server: %s\n", e.what());
        return 2;
    }
    if (!config) return 0;

    ls::setup_logging(config->log);

    try {
        // Declared first so every socket is destroyed before it.
        auto io = asio::io_context{static_cast<int>(config->workers)};

        auto backend = ls::JsonFileBackend{config->data_file};
        auto coordinator = ls::ServerCoordinator{backend, {
            .persistence_policy = config->persistence_policy,
            .fanout_threads = config->workers,
        }};
        coordinator.start();

        auto server = ls::net::TcpServer{io, coordinator, {
            .host = config->host,
            .port = config->port,
            .max_frame_bytes = config->max_frame_bytes,
            .max_queued_bytes = config->max_queued_bytes,
        }};
        server.start();

        auto signals = asio::signal_set{io, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            spdlog::info("Received signal {}, shutting down", signal);
            server.stop();
            io.stop();
        });

        auto threads = std::vector<std::jthread>{};
        for (unsigned int i = 1; i < config->workers; ++i) {
            threads.emplace_back([&io] { io.run(); });
        }
        io.run();
        threads.clear();

        spdlog::info("Server stopped with {} listings", coordinator.snapshot().size());
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
