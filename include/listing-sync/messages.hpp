/// @file messages.hpp
/// @brief The closed set of events carried by a Sync Channel.

#pragma once

#include <listing-sync/listing.hpp>
#include <listing-sync/types.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace listing_sync {

// -- Client -> server ---------------------------------------------------------

/// Full-state reconciliation request carrying a client's entire replica.
struct SyncListings {
    std::vector<Listing> listings;
    auto operator==(const SyncListings&) const -> bool = default;
};

/// Everything a client may send.
///
/// Alternatives: listing-added, listing-updated, listing-deleted,
/// sync-listings.
using ClientMessage = std::variant<
    ListingAdded,
    ListingUpdated,
    ListingDeleted,
    SyncListings
>;

// -- Server -> client ---------------------------------------------------------

/// A normalized mutation broadcast to every connected channel.
struct UpdateListings {
    Mutation mutation;
    Timestamp timestamp;
    auto operator==(const UpdateListings&) const -> bool = default;
};

/// The complete authoritative replica. Clients replace theirs with it.
struct SyncAllListings {
    std::vector<Listing> listings;
    auto operator==(const SyncAllListings&) const -> bool = default;
};

/// Number of currently connected clients.
struct UsersCount {
    std::size_t count{0};
    auto operator==(const UsersCount&) const -> bool = default;
};

/// Everything the server may send.
///
/// Alternatives: update-listings, sync-all-listings, users-count.
using ServerMessage = std::variant<
    UpdateListings,
    SyncAllListings,
    UsersCount
>;

/// Wrap a mutation as the client message that carries it.
auto to_client_message(Mutation mutation) -> ClientMessage;

/// The mutation a client message carries; nullopt for sync-listings.
auto to_mutation(const ClientMessage& message) -> std::optional<Mutation>;

/// Event name on the wire, e.g. "listing-added" or "users-count".
auto event_name(const ClientMessage& message) -> std::string_view;
auto event_name(const ServerMessage& message) -> std::string_view;

}  // namespace listing_sync
