/// @file listing.hpp
/// @brief The Listing entity and the Mutation variant.

#pragma once

#include <listing-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace listing_sync {

/// The synchronized entity.
///
/// The engine only cares about `id`; every other field (title,
/// description, media references, pricing, ...) is an opaque JSON
/// payload. Writes replace the whole value, never individual fields.
struct Listing {
    std::string id;                                   ///< Globally unique, never reassigned.
    nlohmann::json fields = nlohmann::json::object(); ///< Payload fields, without `id`.

    auto operator==(const Listing&) const -> bool = default;

    /// The `title` field, if present and a string.
    auto title() const -> std::optional<std::string>;
};

/// Create a listing with a freshly generated id.
/// @param fields A JSON object; an `id` member in it is ignored.
auto make_listing(nlohmann::json fields) -> Listing;

// -- Mutations ----------------------------------------------------------------

/// A listing was created.
struct ListingAdded {
    Listing listing;
    auto operator==(const ListingAdded&) const -> bool = default;
};

/// A listing was replaced.
struct ListingUpdated {
    Listing listing;
    auto operator==(const ListingUpdated&) const -> bool = default;
};

/// A listing was removed.
struct ListingDeleted {
    std::string id;
    auto operator==(const ListingDeleted&) const -> bool = default;
};

/// A single create/update/delete change to a replica.
using Mutation = std::variant<ListingAdded, ListingUpdated, ListingDeleted>;

/// A recorded mutation awaiting delivery from a client's offline queue.
struct MutationIntent {
    std::string id;       ///< Locally-unique; used to remove the intent once sent.
    Mutation mutation;    ///< The change to deliver.
    Timestamp queued_at;  ///< When it was recorded. Diagnostics only.

    auto operator==(const MutationIntent&) const -> bool = default;
};

/// The id a mutation targets.
auto target_id(const Mutation& mutation) -> const std::string&;

/// The broadcast action name: "added", "updated" or "deleted".
auto action_name(const Mutation& mutation) -> std::string_view;

}  // namespace listing_sync
