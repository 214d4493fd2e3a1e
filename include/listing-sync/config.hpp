/// @file config.hpp
/// @brief Command-line and environment configuration for the server and client tools.

#pragma once

#include <listing-sync/backoff.hpp>
#include <listing-sync/channel.hpp>
#include <listing-sync/coordinator.hpp>
#include <listing-sync/logging.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace listing_sync {

/// Environment variable overriding the default port of both tools.
inline constexpr const char* port_env = "LISTING_SYNC_PORT";
/// Environment variable overriding the default server data file.
inline constexpr const char* data_file_env = "LISTING_SYNC_DATA_FILE";

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{3000};
    std::string data_file{"listings.json"};
    unsigned int workers{1};  ///< io_context threads, also used for fanout.
    PersistencePolicy persistence_policy{PersistencePolicy::best_effort};
    std::size_t max_frame_bytes{default_max_frame_bytes};
    std::size_t max_queued_bytes{4 * default_max_frame_bytes};
    LogConfig log{};
};

struct ClientConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{3000};
    std::string queue_file{"offline-queue.json"};
    std::string replica_file{"listings-cache.json"};
    std::chrono::milliseconds sync_timeout{10000};
    BackoffOptions backoff{};
    LogConfig log{};
};

/// Parse server options. Environment variables supply defaults that the
/// command line overrides.
///
/// @return nullopt if `--help` was given (usage is written to `out`).
/// @throws std::runtime_error on unknown options or invalid values.
auto parse_server_config(int argc, const char* const argv[], std::ostream& out)
    -> std::optional<ServerConfig>;
auto parse_server_config(int argc, const char* const argv[]) -> std::optional<ServerConfig>;

/// Parse client options. See parse_server_config().
auto parse_client_config(int argc, const char* const argv[], std::ostream& out)
    -> std::optional<ClientConfig>;
auto parse_client_config(int argc, const char* const argv[]) -> std::optional<ClientConfig>;

/// Parse a persistence policy name ("best_effort" or "durable").
/// @throws std::runtime_error on any other name.
auto parse_persistence_policy(const std::string& name) -> PersistencePolicy;

}  // namespace listing_sync
