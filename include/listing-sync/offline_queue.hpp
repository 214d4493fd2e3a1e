/// @file offline_queue.hpp
/// @brief OfflineQueue: a client's durable log of undelivered mutations.

#pragma once

#include <listing-sync/error.hpp>
#include <listing-sync/listing.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace listing_sync {

/// Durable storage for the offline queue.
class QueueStore {
public:
    virtual ~QueueStore() = default;

    /// Load the persisted queue. A missing or unreadable store yields
    /// an empty queue.
    virtual auto load() -> std::vector<MutationIntent> = 0;

    /// Replace the persisted queue with `intents`.
    /// @return nullopt on success, or the failure.
    virtual auto store(const std::vector<MutationIntent>& intents) -> std::optional<Error> = 0;
};

/// Stores the queue as a JSON array file. Writes go to a temporary
/// sibling file which is then renamed over the target.
class JsonFileQueueStore final : public QueueStore {
public:
    explicit JsonFileQueueStore(std::filesystem::path path);

    auto load() -> std::vector<MutationIntent> override;
    auto store(const std::vector<MutationIntent>& intents) -> std::optional<Error> override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/// Keeps the "persisted" queue in memory. Two queues sharing one
/// MemoryQueueStore model a client restart.
class MemoryQueueStore final : public QueueStore {
public:
    auto load() -> std::vector<MutationIntent> override;
    auto store(const std::vector<MutationIntent>& intents) -> std::optional<Error> override;

    /// Make every subsequent store() fail (or succeed again).
    void set_failing(bool failing) { failing_ = failing; }

    auto store_calls() const -> std::size_t { return store_calls_; }

private:
    std::vector<MutationIntent> intents_;
    bool failing_{false};
    std::size_t store_calls_{0};
};

/// Outcome of one OfflineQueue::drain() pass.
struct DrainReport {
    std::size_t attempted{0};  ///< Intents handed to the sender.
    std::size_t delivered{0};  ///< Intents the sender confirmed and that were removed.
    std::size_t failed{0};     ///< Intents left in place for a later drain.

    auto operator==(const DrainReport&) const -> bool = default;
};

/// Ordered, durable list of pending mutation intents.
///
/// Every structural change is flushed to the QueueStore before the call
/// returns, so an abrupt termination loses at most the in-flight send,
/// never a recorded intent. Delivery is at-least-once.
///
/// Single-threaded: only the owning ClientAgent touches it.
class OfflineQueue {
public:
    /// Delivers one intent. Returns true once the send is confirmed.
    using Sender = std::function<bool(const MutationIntent&)>;

    /// Construct over a store and load whatever it already holds.
    explicit OfflineQueue(std::shared_ptr<QueueStore> store);

    /// Append a mutation, persist the queue, and return the new intent.
    /// Never blocks on the network.
    auto enqueue(Mutation mutation) -> MutationIntent;

    /// Deliver a snapshot of the queue taken at call start.
    ///
    /// Each delivered intent is removed by id; failed ones stay. Intents
    /// enqueued during the pass are left for the next drain. A drain
    /// started while another is running returns an empty report.
    auto drain(const Sender& sender) -> DrainReport;

    auto pending() const -> const std::vector<MutationIntent>& { return intents_; }
    auto size() const -> std::size_t { return intents_.size(); }
    auto empty() const -> bool { return intents_.empty(); }
    auto draining() const -> bool { return draining_; }

private:
    auto remove(const std::string& intent_id) -> bool;
    void persist();

    std::shared_ptr<QueueStore> store_;
    std::vector<MutationIntent> intents_;
    bool draining_{false};
};

}  // namespace listing_sync
