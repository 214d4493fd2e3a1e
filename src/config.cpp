#include <listing-sync/config.hpp>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace po = boost::program_options;

namespace listing_sync {

namespace {

auto env_or(const char* name, const std::string& fallback) -> std::string {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? std::string{value} : fallback;
}

auto parse_port(const std::string& text, const char* source) -> std::uint16_t {
    auto value = 0UL;
    auto consumed = std::size_t{0};
    try {
        value = std::stoul(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size() || value > std::numeric_limits<std::uint16_t>::max()) {
        throw std::runtime_error{std::string{"invalid port '"} + text + "' from " + source};
    }
    return static_cast<std::uint16_t>(value);
}

auto default_port() -> std::uint16_t {
    const char* value = std::getenv(port_env);
    if (value == nullptr || *value == '\0') return 3000;
    return parse_port(value, port_env);
}

void add_log_options(po::options_description& options) {
    options.add_options()
        ("log-level", po::value<std::string>()->default_value("info"),
         "log level: trace, debug, info, warn or error")
        ("log-file", po::value<std::string>()->default_value(""),
         "rotating log file (console only if empty)");
}

auto read_log_options(const po::variables_map& vm) -> LogConfig {
    return LogConfig{
        .level = vm["log-level"].as<std::string>(),
        .file = vm["log-file"].as<std::string>(),
    };
}

// Parse argv into a variables_map, converting Boost's errors.
// @return false if --help was given.
auto parse_into(int argc, const char* const argv[], const po::options_description& options,
                po::variables_map& vm, std::ostream& out) -> bool {
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error{e.what()};
    }
    if (vm.count("help")) {
        out << options << '\n';
        return false;
    }
    return true;
}

}  // anonymous namespace

auto parse_persistence_policy(const std::string& name) -> PersistencePolicy {
    if (name == "best_effort") return PersistencePolicy::best_effort;
    if (name == "durable") return PersistencePolicy::durable;
    throw std::runtime_error{"unknown persistence policy '" + name + "'"};
}

// -- Server -------------------------------------------------------------------

auto parse_server_config(int argc, const char* const argv[], std::ostream& out)
    -> std::optional<ServerConfig> {
    auto config = ServerConfig{};
    const auto hardware = std::thread::hardware_concurrency();

    auto options = po::options_description{"listing_server options"};
    options.add_options()
        ("help,h", "show this help")
        ("host", po::value<std::string>(&config.host)->default_value(config.host),
         "address to listen on")
        ("port,p", po::value<std::string>()->default_value(std::to_string(default_port())),
         "TCP port (default from LISTING_SYNC_PORT)")
        ("data-file", po::value<std::string>(&config.data_file)
             ->default_value(env_or(data_file_env, config.data_file)),
         "JSON file holding the authoritative listings (default from LISTING_SYNC_DATA_FILE)")
        ("workers", po::value<unsigned int>(&config.workers)
             ->default_value(hardware > 0 ? hardware : 1),
         "I/O and broadcast threads")
        ("persistence", po::value<std::string>()->default_value("best_effort"),
         "on write failure: best_effort (broadcast anyway) or durable (drop the change)")
        ("max-frame-bytes", po::value<std::size_t>(&config.max_frame_bytes)
             ->default_value(config.max_frame_bytes),
         "largest accepted message body")
        ("max-queued-bytes", po::value<std::size_t>(&config.max_queued_bytes)
             ->default_value(config.max_queued_bytes),
         "unwritten output allowed per connection before a slow reader is dropped");
    add_log_options(options);

    auto vm = po::variables_map{};
    if (!parse_into(argc, argv, options, vm, out)) return std::nullopt;

    config.port = parse_port(vm["port"].as<std::string>(), "--port");
    config.persistence_policy = parse_persistence_policy(vm["persistence"].as<std::string>());
    config.log = read_log_options(vm);

    if (config.workers == 0) throw std::runtime_error{"--workers must be at least 1"};
    if (config.max_frame_bytes == 0) throw std::runtime_error{"--max-frame-bytes must be positive"};
    if (config.max_queued_bytes == 0) throw std::runtime_error{"--max-queued-bytes must be positive"};
    if (config.data_file.empty()) throw std::runtime_error{"--data-file must not be empty"};
    return config;
}

auto parse_server_config(int argc, const char* const argv[]) -> std::optional<ServerConfig> {
    return parse_server_config(argc, argv, std::cout);
}

// -- Client -------------------------------------------------------------------

auto parse_client_config(int argc, const char* const argv[], std::ostream& out)
    -> std::optional<ClientConfig> {
    auto config = ClientConfig{};

    auto sync_timeout_ms = std::int64_t{config.sync_timeout.count()};
    auto initial_ms = std::int64_t{config.backoff.initial.count()};
    auto max_ms = std::int64_t{config.backoff.max.count()};

    auto options = po::options_description{"listing_client options"};
    options.add_options()
        ("help,h", "show this help")
        ("host", po::value<std::string>(&config.host)->default_value(config.host),
         "server address")
        ("port,p", po::value<std::string>()->default_value(std::to_string(default_port())),
         "server port (default from LISTING_SYNC_PORT)")
        ("queue-file", po::value<std::string>(&config.queue_file)->default_value(config.queue_file),
         "file holding changes made while offline")
        ("replica-file", po::value<std::string>(&config.replica_file)
             ->default_value(config.replica_file),
         "file caching the last known listings between runs")
        ("sync-timeout-ms", po::value<std::int64_t>(&sync_timeout_ms)->default_value(sync_timeout_ms),
         "how long to wait for the server's full listing set after reconnecting")
        ("backoff-initial-ms", po::value<std::int64_t>(&initial_ms)->default_value(initial_ms),
         "first reconnect delay")
        ("backoff-max-ms", po::value<std::int64_t>(&max_ms)->default_value(max_ms),
         "longest reconnect delay")
        ("backoff-multiplier", po::value<double>(&config.backoff.multiplier)
             ->default_value(config.backoff.multiplier),
         "reconnect delay growth per attempt")
        ("backoff-jitter", po::value<double>(&config.backoff.jitter)
             ->default_value(config.backoff.jitter),
         "fraction of each delay randomized away, 0 to 1");
    add_log_options(options);

    auto vm = po::variables_map{};
    if (!parse_into(argc, argv, options, vm, out)) return std::nullopt;

    config.port = parse_port(vm["port"].as<std::string>(), "--port");
    config.log = read_log_options(vm);

    if (sync_timeout_ms <= 0) throw std::runtime_error{"--sync-timeout-ms must be positive"};
    if (initial_ms <= 0 || max_ms <= 0) {
        throw std::runtime_error{"backoff delays must be positive"};
    }
    if (config.backoff.jitter < 0.0 || config.backoff.jitter > 1.0) {
        throw std::runtime_error{"--backoff-jitter must be between 0 and 1"};
    }
    if (config.queue_file.empty()) throw std::runtime_error{"--queue-file must not be empty"};
    if (config.replica_file.empty()) throw std::runtime_error{"--replica-file must not be empty"};

    config.sync_timeout = std::chrono::milliseconds{sync_timeout_ms};
    config.backoff.initial = std::chrono::milliseconds{initial_ms};
    config.backoff.max = std::chrono::milliseconds{max_ms};
    return config;
}

auto parse_client_config(int argc, const char* const argv[]) -> std::optional<ClientConfig> {
    return parse_client_config(argc, argv, std::cout);
}

}  // namespace listing_sync
