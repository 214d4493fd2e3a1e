/// @file coordinator.hpp
/// @brief ServerCoordinator: owns the authoritative replica and fans out changes.

#pragma once

#include <listing-sync/channel.hpp>
#include <listing-sync/messages.hpp>
#include <listing-sync/persistence.hpp>
#include <listing-sync/presence.hpp>
#include <listing-sync/replica.hpp>
#include <listing-sync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace listing_sync {

namespace detail {
class FanoutPool;
}  // namespace detail

/// What to do when the backend rejects a write.
enum class PersistencePolicy : std::uint8_t {
    best_effort,  ///< Log it; still update the replica and broadcast.
    durable,      ///< Log it; leave the replica unchanged and skip the broadcast.
};

/// Convert a PersistencePolicy to its string representation.
constexpr auto to_string_view(PersistencePolicy policy) noexcept -> std::string_view {
    switch (policy) {
        case PersistencePolicy::best_effort: return "best_effort";
        case PersistencePolicy::durable:     return "durable";
    }
    return "unknown";
}

/// Construction options for ServerCoordinator.
struct CoordinatorOptions {
    PersistencePolicy persistence_policy{PersistencePolicy::best_effort};
    /// Threads used to fan a broadcast out across channels.
    /// 0 or 1 = fan out on the calling thread.
    unsigned int fanout_threads{0};
};

/// The server side of the synchronization engine.
///
/// ServerCoordinator owns the authoritative replica and the persistence
/// backend. Transports register each connection with attach(), forward
/// every inbound message to handle(), and call detach() when the
/// connection closes.
///
/// All entry points are thread-safe. Mutations of the replica and the
/// backend are serialized by one mutex, and each broadcast completes
/// before the mutex is released, so every channel sees broadcasts in the
/// order the server processed them.
///
/// @code
/// auto backend = JsonFileBackend{"listings.json"};
/// auto coordinator = ServerCoordinator{backend};
/// coordinator.start();
/// coordinator.attach(channel);
/// coordinator.handle(channel->id(), ListingAdded{listing});
/// @endcode
class ServerCoordinator {
public:
    explicit ServerCoordinator(Backend& backend, CoordinatorOptions options = {});
    ~ServerCoordinator();

    ServerCoordinator(const ServerCoordinator&) = delete;
    auto operator=(const ServerCoordinator&) -> ServerCoordinator& = delete;

    /// Load the backend into the authoritative replica. Call once.
    void start();

    // -- Connections ----------------------------------------------------------

    /// Register a connected channel, broadcast the new users-count, then
    /// send the full authoritative replica to the new channel.
    void attach(std::shared_ptr<Channel> channel);

    /// Unregister a channel and broadcast the new users-count.
    /// Unknown ids are ignored.
    void detach(ChannelId id);

    // -- Inbound events -------------------------------------------------------

    /// Apply one inbound event from the given channel.
    ///
    /// @return nullopt on success. invalid_listing for an event without an
    ///         id. persistence_error if the backend rejected a write; the
    ///         change was still applied and broadcast unless the policy is
    ///         durable.
    auto handle(ChannelId from, const ClientMessage& message) -> std::optional<Error>;

    // -- Inspection -----------------------------------------------------------

    /// A copy of the authoritative replica, in replica order.
    auto snapshot() const -> std::vector<Listing>;

    auto users_count() const -> std::size_t;

    auto options() const -> const CoordinatorOptions& { return options_; }

private:
    auto on_saved(ChannelId from, const Listing& listing, bool is_update) -> std::optional<Error>;
    auto on_deleted(ChannelId from, const ListingDeleted& deleted) -> std::optional<Error>;
    auto on_sync(ChannelId from, const SyncListings& sync) -> std::optional<Error>;

    // Callers hold mutex_.
    void broadcast(const ServerMessage& message);

    Backend& backend_;
    CoordinatorOptions options_;
    Replica replica_;
    PresenceTracker presence_;
    std::map<ChannelId, std::shared_ptr<Channel>> channels_;
    std::unique_ptr<detail::FanoutPool> pool_;
    mutable std::mutex mutex_;
};

}  // namespace listing_sync
