/// @file replica.hpp
/// @brief Replica: an insertion-ordered collection of listings keyed by id.

#pragma once

#include <listing-sync/listing.hpp>

#include <cstddef>
#include <functional>
#include <list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace listing_sync {

/// One participant's copy of the listing collection.
///
/// At most one listing exists per id. New listings are inserted at the
/// front (newest first); a replaced listing keeps its position.
///
/// Replica is not synchronized. The server guards its authoritative
/// replica with the coordinator's mutex; each client touches its own
/// replica from a single thread.
class Replica {
public:
    Replica() = default;

    /// Build a replica from a list, keeping the first occurrence of each id.
    explicit Replica(const std::vector<Listing>& listings);

    Replica(const Replica& other);
    auto operator=(const Replica& other) -> Replica&;
    Replica(Replica&&) noexcept = default;
    auto operator=(Replica&&) noexcept -> Replica& = default;

    // -- Reading --------------------------------------------------------------

    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    auto contains(std::string_view id) const -> bool;

    /// Look up a listing by id. The pointer is invalidated by the next write.
    auto find(std::string_view id) const -> const Listing*;

    /// All listings in replica order.
    auto listings() const -> std::vector<Listing>;

    /// All ids in replica order.
    auto ids() const -> std::vector<std::string>;

    // -- Writing --------------------------------------------------------------

    /// Insert if no listing with this id exists. First occurrence wins.
    /// @return true if the listing was inserted.
    auto insert(Listing listing) -> bool;

    /// Insert or replace by id.
    /// @return true if the listing was new.
    auto upsert(Listing listing) -> bool;

    /// Replace an existing listing; never inserts.
    /// @return true if a listing was replaced.
    auto replace(Listing listing) -> bool;

    /// Remove by id.
    /// @return true if a listing was removed.
    auto erase(std::string_view id) -> bool;

    /// Discard everything and adopt the given list wholesale.
    void reset(const std::vector<Listing>& listings);

    /// Apply a broadcast mutation: added inserts only when absent,
    /// updated replaces or inserts at the front, deleted removes when present.
    /// @return true if the replica changed.
    auto apply(const Mutation& mutation) -> bool;

    /// Insert every candidate whose id is not yet present. Existing
    /// entries are never overwritten. Candidates with an empty id are skipped.
    ///
    /// @param admit Called for each candidate about to be inserted; a
    ///        false return skips it. Empty admits everything.
    /// @return The listings that were inserted, in candidate order.
    auto merge_missing(const std::vector<Listing>& candidates,
                       const std::function<bool(const Listing&)>& admit = {})
        -> std::vector<Listing>;

    auto operator==(const Replica& other) const -> bool;

private:
    void rebuild_index();

    std::list<Listing> entries_;
    std::unordered_map<std::string, std::list<Listing>::iterator> index_;
};

}  // namespace listing_sync
