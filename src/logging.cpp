#include <listing-sync/logging.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace listing_sync {

namespace {

constexpr std::size_t max_log_file_size = 5 * 1024 * 1024;
constexpr std::size_t max_log_files = 3;

auto parse_level(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

}  // anonymous namespace

void setup_logging(const LogConfig& config) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
    auto file_error = std::string{};

    if (!config.file.empty()) {
        try {
            auto path = std::filesystem::path{config.file};
            if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, max_log_file_size, max_log_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("listing_sync", sinks.begin(), sinks.end());
    logger->set_level(parse_level(config.level));
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("Failed to open log file {}: {}; logging to console only",
                     config.file, file_error);
    } else if (!config.file.empty()) {
        spdlog::info("Log file: {}", config.file);
    }
    spdlog::debug("Logging initialized at level {}", config.level);
}

}  // namespace listing_sync
