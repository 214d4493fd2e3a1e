/// @file error.hpp
/// @brief Error types for the listing-sync library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace listing_sync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    transport_error,    ///< The channel is down or a send failed.
    persistence_error,  ///< A backend or queue-store write failed.
    decoding_error,     ///< A message or frame could not be decoded.
    invalid_listing,    ///< A listing or delete arrived without an id.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::transport_error:   return "transport_error";
        case ErrorKind::persistence_error: return "persistence_error";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::invalid_listing:   return "invalid_listing";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

}  // namespace listing_sync
