/// @file replica_store.hpp
/// @brief ReplicaStore: keeps a client's last known listing set across restarts.

#pragma once

#include <listing-sync/error.hpp>
#include <listing-sync/listing.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

namespace listing_sync {

/// Durable storage for a client's replica.
///
/// A restarted client seeds its replica from here, so its first
/// reconciliation offers the server what it held before going down.
class ReplicaStore {
public:
    virtual ~ReplicaStore() = default;

    /// Load the persisted listings, newest first. A missing or
    /// unreadable store yields an empty set.
    virtual auto load() -> std::vector<Listing> = 0;

    /// Replace the persisted listings with `listings`.
    /// @return nullopt on success, or the failure.
    virtual auto store(const std::vector<Listing>& listings) -> std::optional<Error> = 0;
};

/// Stores the replica as a JSON array file, written through a temporary
/// sibling file that is renamed over the target.
class JsonFileReplicaStore final : public ReplicaStore {
public:
    explicit JsonFileReplicaStore(std::filesystem::path path);

    auto load() -> std::vector<Listing> override;
    auto store(const std::vector<Listing>& listings) -> std::optional<Error> override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/// In-memory store. Two agents sharing one model a client restart.
class MemoryReplicaStore final : public ReplicaStore {
public:
    MemoryReplicaStore() = default;
    explicit MemoryReplicaStore(std::vector<Listing> initial) : listings_{std::move(initial)} {}

    auto load() -> std::vector<Listing> override;
    auto store(const std::vector<Listing>& listings) -> std::optional<Error> override;

    void set_failing(bool failing) { failing_ = failing; }
    auto store_calls() const -> std::size_t { return store_calls_; }

private:
    std::vector<Listing> listings_;
    bool failing_{false};
    std::size_t store_calls_{0};
};

}  // namespace listing_sync
