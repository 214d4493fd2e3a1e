#include <listing-sync/agent.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace listing_sync {

ClientAgent::ClientAgent(std::shared_ptr<QueueStore> store, AgentObserver observer)
    : queue_{std::move(store)}, observer_{std::move(observer)} {}

ClientAgent::ClientAgent(std::shared_ptr<QueueStore> store,
                         std::shared_ptr<ReplicaStore> replicas, AgentObserver observer)
    : replica_store_{std::move(replicas)}, queue_{std::move(store)}, observer_{std::move(observer)} {
    if (replica_store_) replica_.reset(replica_store_->load());
}

// -- Local mutations ----------------------------------------------------------

auto ClientAgent::create(nlohmann::json fields) -> Listing {
    auto listing = make_listing(std::move(fields));
    replica_.insert(listing);
    replica_changed();
    dispatch(ListingAdded{listing});
    return listing;
}

void ClientAgent::update(Listing listing) {
    if (listing.id.empty()) {
        reject("update without a listing id");
        return;
    }
    replica_.upsert(listing);
    replica_changed();
    dispatch(ListingUpdated{std::move(listing)});
}

void ClientAgent::remove(std::string_view id) {
    if (id.empty()) {
        reject("delete without a listing id");
        return;
    }
    if (replica_.erase(id)) replica_changed();
    dispatch(ListingDeleted{std::string{id}});
}

void ClientAgent::requeue(std::vector<Mutation> mutations) {
    if (mutations.empty()) return;
    spdlog::warn("Requeueing {} changes that were not written before the link dropped",
                 mutations.size());
    for (auto& mutation : mutations) queue_.enqueue(std::move(mutation));
}

void ClientAgent::reject(std::string message) {
    spdlog::warn("Rejected local change: {}", message);
    if (observer_.on_error) observer_.on_error(Error{ErrorKind::invalid_listing, std::move(message)});
}

void ClientAgent::dispatch(Mutation mutation) {
    // No rollback if a send later turns out to have been lost: the next
    // reconciliation round repairs the divergence.
    if (can_send() && try_send(to_client_message(mutation))) return;
    queue_.enqueue(std::move(mutation));
}

auto ClientAgent::can_send() const -> bool {
    return status_ == ConnectionStatus::connected && transport_ != nullptr &&
           transport_->connected();
}

auto ClientAgent::try_send(const ClientMessage& message) -> bool {
    auto sent = false;
    try {
        sent = transport_->send(message);
    } catch (const std::exception& e) {
        spdlog::error("Send of {} threw: {}", event_name(message), e.what());
    }
    if (!sent) {
        spdlog::warn("Send of {} failed", event_name(message));
        if (observer_.on_error) {
            observer_.on_error(Error{ErrorKind::transport_error,
                                     "send failed: " + std::string{event_name(message)}});
        }
    }
    return sent;
}

// -- Connection events --------------------------------------------------------

void ClientAgent::on_connecting() {
    set_status(ConnectionStatus::connecting);
}

void ClientAgent::on_connected() {
    spdlog::info("Connected to sync server");
    set_status(ConnectionStatus::connected);

    if (!can_send()) return;
    try_send(SyncListings{replica_.listings()});

    const auto report = flush_queue();
    if (report.attempted > 0) {
        spdlog::info("{} offline changes synced", report.delivered);
    }
    if (observer_.on_synced) observer_.on_synced(report.delivered);
}

void ClientAgent::on_disconnected() {
    if (status_ == ConnectionStatus::disconnected) return;
    spdlog::warn("Disconnected from sync server");
    set_status(ConnectionStatus::disconnected);
}

void ClientAgent::on_error(const Error& error) {
    spdlog::error("Sync channel error: {}", error.message);
    set_status(ConnectionStatus::error);
    if (observer_.on_error) observer_.on_error(error);
}

auto ClientAgent::flush_queue() -> DrainReport {
    if (!can_send()) return {};
    return queue_.drain([this](const MutationIntent& intent) {
        return can_send() && try_send(to_client_message(intent.mutation));
    });
}

// -- Inbound ------------------------------------------------------------------

void ClientAgent::receive(const ServerMessage& message) {
    std::visit(overload{
        [&](const UpdateListings& m) {
            spdlog::debug("Received update: {} {}", action_name(m.mutation), target_id(m.mutation));
            if (replica_.apply(m.mutation)) replica_changed();
        },
        [&](const SyncAllListings& m) {
            spdlog::info("Synced {} listings from server", m.listings.size());
            replica_.reset(m.listings);
            replica_changed();
        },
        [&](const UsersCount& m) {
            users_count_ = m.count;
            if (observer_.on_users_count) observer_.on_users_count(m.count);
        },
    }, message);
}

void ClientAgent::set_status(ConnectionStatus status) {
    if (status_ == status) return;
    status_ = status;
    if (observer_.on_status) observer_.on_status(status);
}

void ClientAgent::replica_changed() {
    if (replica_store_) {
        if (auto error = replica_store_->store(replica_.listings())) {
            spdlog::error("Failed to persist cached listings: {}", error->message);
        }
    }
    if (observer_.on_replica_changed) observer_.on_replica_changed(replica_);
}

}  // namespace listing_sync
