#include <listing-sync/coordinator.hpp>

#include "fanout_pool.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace listing_sync {

namespace {

auto make_pool(unsigned int fanout_threads) -> std::unique_ptr<detail::FanoutPool> {
    // The broadcasting thread is one of the fanout threads.
    if (fanout_threads <= 1) return nullptr;
    return std::make_unique<detail::FanoutPool>(fanout_threads - 1);
}

auto send_to(Channel& channel, const ServerMessage& message) -> bool {
    try {
        return channel.send(message);
    } catch (const std::exception& e) {
        spdlog::error("Channel {} threw on {}: {}", channel.id(), event_name(message), e.what());
        return false;
    }
}

}  // anonymous namespace

ServerCoordinator::ServerCoordinator(Backend& backend, CoordinatorOptions options)
    : backend_{backend},
      options_{options},
      pool_{make_pool(options.fanout_threads)} {}

ServerCoordinator::~ServerCoordinator() = default;

void ServerCoordinator::start() {
    auto lock = std::scoped_lock{mutex_};
    replica_.reset(backend_.load_all());
    spdlog::info("Coordinator started with {} listings ({} persistence)",
                 replica_.size(), to_string_view(options_.persistence_policy));
}

// -- Connections --------------------------------------------------------------

void ServerCoordinator::attach(std::shared_ptr<Channel> channel) {
    if (!channel) return;
    auto lock = std::scoped_lock{mutex_};

    const auto id = channel->id();
    if (!channels_.emplace(id, channel).second) {
        spdlog::warn("Channel {} attached twice", id);
        return;
    }
    const auto count = presence_.connect();
    spdlog::info("Client connected: {} ({} online)", id, count);

    broadcast(UsersCount{count});
    send_to(*channel, SyncAllListings{replica_.listings()});
}

void ServerCoordinator::detach(ChannelId id) {
    auto lock = std::scoped_lock{mutex_};
    if (channels_.erase(id) == 0) return;

    const auto count = presence_.disconnect();
    spdlog::info("Client disconnected: {} ({} online)", id, count);
    broadcast(UsersCount{count});
}

// -- Inbound events -----------------------------------------------------------

auto ServerCoordinator::handle(ChannelId from, const ClientMessage& message)
    -> std::optional<Error> {
    return std::visit(overload{
        [&](const ListingAdded& m) { return on_saved(from, m.listing, false); },
        [&](const ListingUpdated& m) { return on_saved(from, m.listing, true); },
        [&](const ListingDeleted& m) { return on_deleted(from, m); },
        [&](const SyncListings& m) { return on_sync(from, m); },
    }, message);
}

auto ServerCoordinator::on_saved(ChannelId from, const Listing& listing, bool is_update)
    -> std::optional<Error> {
    if (listing.id.empty()) {
        spdlog::warn("Channel {} sent a listing without an id; ignored", from);
        return Error{ErrorKind::invalid_listing, "listing without an id"};
    }

    auto lock = std::scoped_lock{mutex_};
    spdlog::info("Listing {}: {}", is_update ? "updated" : "added",
                 listing.title().value_or(listing.id));

    auto error = backend_.save(listing);
    if (error) {
        spdlog::error("Failed to save listing {}: {}", listing.id, error->message);
        if (options_.persistence_policy == PersistencePolicy::durable) return error;
    }

    // A repeated add for a known id is an idempotent upsert, never a
    // second entry.
    replica_.upsert(listing);

    auto mutation = is_update ? Mutation{ListingUpdated{listing}} : Mutation{ListingAdded{listing}};
    broadcast(UpdateListings{std::move(mutation), now()});
    return error;
}

auto ServerCoordinator::on_deleted(ChannelId from, const ListingDeleted& deleted)
    -> std::optional<Error> {
    if (deleted.id.empty()) {
        spdlog::warn("Channel {} sent a delete without an id; ignored", from);
        return Error{ErrorKind::invalid_listing, "delete without an id"};
    }

    auto lock = std::scoped_lock{mutex_};
    spdlog::info("Listing deleted: {}", deleted.id);

    auto error = backend_.remove(deleted.id);
    if (error) {
        spdlog::error("Failed to delete listing {}: {}", deleted.id, error->message);
        if (options_.persistence_policy == PersistencePolicy::durable) return error;
    }

    replica_.erase(deleted.id);
    broadcast(UpdateListings{ListingDeleted{deleted.id}, now()});
    return error;
}

auto ServerCoordinator::on_sync(ChannelId from, const SyncListings& sync)
    -> std::optional<Error> {
    auto lock = std::scoped_lock{mutex_};

    // Adopt only ids the server has never seen. A client's copy of a
    // known id is never allowed to overwrite the authoritative one.
    auto failures = std::size_t{0};
    const auto merged = replica_.merge_missing(sync.listings, [&](const Listing& candidate) {
        auto error = backend_.save(candidate);
        if (!error) return true;
        spdlog::error("Failed to save listing {}: {}", candidate.id, error->message);
        ++failures;
        return options_.persistence_policy == PersistencePolicy::best_effort;
    });
    if (!merged.empty()) {
        spdlog::info("Merged {} listings from channel {}", merged.size(), from);
    }

    broadcast(SyncAllListings{replica_.listings()});
    if (failures == 0) return std::nullopt;
    return Error{ErrorKind::persistence_error,
                 std::to_string(failures) + " merged listings could not be saved"};
}

// -- Internals ----------------------------------------------------------------

void ServerCoordinator::broadcast(const ServerMessage& message) {
    if (channels_.empty()) return;

    auto jobs = std::vector<detail::FanoutPool::Job>{};
    jobs.reserve(channels_.size());
    for (const auto& [id, channel] : channels_) {
        jobs.emplace_back([&message, target = channel.get()] {
            if (!send_to(*target, message)) {
                spdlog::warn("Broadcast of {} to channel {} failed",
                             event_name(message), target->id());
            }
        });
    }

    if (pool_) {
        pool_->run(jobs);
    } else {
        for (const auto& job : jobs) job();
    }
}

// -- Inspection ---------------------------------------------------------------

auto ServerCoordinator::snapshot() const -> std::vector<Listing> {
    auto lock = std::scoped_lock{mutex_};
    return replica_.listings();
}

auto ServerCoordinator::users_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return presence_.count();
}

}  // namespace listing_sync
