#pragma once

// Whole-file JSON read/write helpers shared by the file backend and the
// file queue store.
// Internal header, not installed.

#include <listing-sync/error.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace listing_sync::detail {

// Read and parse a JSON file. A missing file yields nullopt silently;
// an unreadable or malformed one is logged and yields nullopt.
inline auto read_json_file(const std::filesystem::path& path) -> std::optional<nlohmann::json> {
    auto ec = std::error_code{};
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        spdlog::error("Failed to open {}", path.string());
        return std::nullopt;
    }
    auto document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        spdlog::error("Malformed JSON in {}", path.string());
        return std::nullopt;
    }
    return document;
}

// Write `document` to a sibling temporary file and rename it over `path`,
// so readers never observe a half-written file.
inline auto write_json_file(const std::filesystem::path& path, const nlohmann::json& document,
                            int indent = -1) -> std::optional<Error> {
    auto tmp = path;
    tmp += ".tmp";

    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!out) {
            return Error{ErrorKind::persistence_error, "cannot open " + tmp.string()};
        }
        out << document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
        out.flush();
        if (!out) {
            return Error{ErrorKind::persistence_error, "write failed: " + tmp.string()};
        }
    }

    auto ec = std::error_code{};
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return Error{ErrorKind::persistence_error,
                     "rename to " + path.string() + " failed: " + ec.message()};
    }
    return std::nullopt;
}

}  // namespace listing_sync::detail
