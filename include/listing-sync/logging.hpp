/// @file logging.hpp
/// @brief spdlog setup shared by the server and client tools.

#pragma once

#include <string>

namespace listing_sync {

/// Logging options.
struct LogConfig {
    std::string level{"info"};  ///< trace, debug, info, warn or error.
    std::string file;           ///< Rotating log file; empty for console only.
};

/// Install a default logger named "listing_sync" with a colored console
/// sink and, if configured, a rotating file sink (5 MiB x 3 files).
///
/// Unknown levels fall back to info. If the log file cannot be opened the
/// logger keeps the console sink only.
void setup_logging(const LogConfig& config);

}  // namespace listing_sync
