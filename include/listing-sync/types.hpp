/// @file types.hpp
/// @brief Identity and time types shared by every component.

#pragma once

#include <cstdint>
#include <string>

namespace listing_sync {

/// Milliseconds since the Unix epoch, from the local wall clock.
///
/// Used for diagnostics and for ordering within a single offline queue.
/// There is no logical clock: timestamps from different replicas are
/// never compared.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// Read the wall clock.
auto now() -> Timestamp;

/// Identifies one server-side channel (one connected client).
using ChannelId = std::uint64_t;

/// Generate a new listing id: millisecond timestamp plus a random suffix.
///
/// Ids are assigned once by the creating client and never reassigned.
auto make_listing_id() -> std::string;

/// Generate a locally-unique offline-queue intent id.
///
/// Timestamp plus random jitter keeps intents roughly chronological
/// without any global uniqueness guarantee.
auto make_intent_id() -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace listing_sync
