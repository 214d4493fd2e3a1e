/// @file agent.hpp
/// @brief ClientAgent: a client's local replica, offline queue and connection state.

#pragma once

#include <listing-sync/channel.hpp>
#include <listing-sync/error.hpp>
#include <listing-sync/listing.hpp>
#include <listing-sync/messages.hpp>
#include <listing-sync/offline_queue.hpp>
#include <listing-sync/replica.hpp>
#include <listing-sync/replica_store.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace listing_sync {

/// Client connection states.
///
/// disconnected -> connecting -> connected -> (disconnected | error),
/// and from disconnected or error back to connecting, forever.
enum class ConnectionStatus : std::uint8_t {
    disconnected,
    connecting,
    connected,
    error,
};

/// Convert a ConnectionStatus to its string representation.
constexpr auto to_string_view(ConnectionStatus status) noexcept -> std::string_view {
    switch (status) {
        case ConnectionStatus::disconnected: return "disconnected";
        case ConnectionStatus::connecting:   return "connecting";
        case ConnectionStatus::connected:    return "connected";
        case ConnectionStatus::error:        return "error";
    }
    return "unknown";
}

/// Callbacks the agent invokes on its own thread. Any may be empty.
struct AgentObserver {
    std::function<void(ConnectionStatus)> on_status;
    /// After reconnect-time sync: the number of offline intents delivered.
    std::function<void(std::size_t)> on_synced;
    std::function<void(const Replica&)> on_replica_changed;
    std::function<void(std::size_t)> on_users_count;
    std::function<void(const Error&)> on_error;
};

/// The client side of the synchronization engine.
///
/// Every local mutation is applied to the local replica first, then sent
/// right away when connected or recorded in the offline queue when not.
/// On each transition to connected the agent sends its whole replica for
/// reconciliation and drains the queue.
///
/// Single-threaded: the owning transport calls every method from one
/// thread. The agent does not own the transport.
class ClientAgent {
public:
    explicit ClientAgent(std::shared_ptr<QueueStore> store, AgentObserver observer = {});

    /// Seed the local replica from `replicas` and write every later
    /// replica change back to it.
    ClientAgent(std::shared_ptr<QueueStore> store, std::shared_ptr<ReplicaStore> replicas,
                AgentObserver observer = {});

    ClientAgent(const ClientAgent&) = delete;
    auto operator=(const ClientAgent&) -> ClientAgent& = delete;

    /// Attach the transport used for sends. May be nullptr.
    void set_transport(Transport* transport) { transport_ = transport; }

    // -- Local mutations ------------------------------------------------------

    /// Create a listing with a new id from the given fields.
    auto create(nlohmann::json fields) -> Listing;

    /// Replace a listing by id (inserting it if unknown).
    /// A listing without an id is reported through on_error and dropped.
    void update(Listing listing);

    /// Delete a listing by id. The delete propagates even if the id is unknown locally.
    void remove(std::string_view id);

    /// Put back mutations the transport accepted but never wrote.
    /// They are queued in order and go out with the next drain.
    void requeue(std::vector<Mutation> mutations);

    // -- Connection events (from the transport) -------------------------------

    void on_connecting();
    void on_connected();
    void on_disconnected();
    void on_error(const Error& error);

    /// Apply a message received from the server.
    void receive(const ServerMessage& message);

    // -- Inspection -----------------------------------------------------------

    auto status() const -> ConnectionStatus { return status_; }
    auto replica() const -> const Replica& { return replica_; }
    auto queue() const -> const OfflineQueue& { return queue_; }
    auto users_count() const -> std::size_t { return users_count_; }

    /// Drain the offline queue now (e.g. on a periodic timer).
    /// Does nothing unless connected. @return What the drain did.
    auto flush_queue() -> DrainReport;

private:
    void dispatch(Mutation mutation);
    auto try_send(const ClientMessage& message) -> bool;
    auto can_send() const -> bool;
    void set_status(ConnectionStatus status);
    void replica_changed();
    void reject(std::string message);

    Replica replica_;
    std::shared_ptr<ReplicaStore> replica_store_;
    OfflineQueue queue_;
    AgentObserver observer_;
    Transport* transport_{nullptr};
    ConnectionStatus status_{ConnectionStatus::disconnected};
    std::size_t users_count_{0};
};

}  // namespace listing_sync
