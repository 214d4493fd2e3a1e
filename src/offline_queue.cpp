#include <listing-sync/offline_queue.hpp>
#include <listing-sync/json.hpp>

#include "file_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace listing_sync {

// =============================================================================
// Queue stores
// =============================================================================

JsonFileQueueStore::JsonFileQueueStore(std::filesystem::path path)
    : path_{std::move(path)} {}

auto JsonFileQueueStore::load() -> std::vector<MutationIntent> {
    auto document = detail::read_json_file(path_);
    if (!document) return {};
    if (!document->is_array()) {
        spdlog::error("Offline queue {} is not a JSON array; starting empty", path_.string());
        return {};
    }

    auto intents = std::vector<MutationIntent>{};
    intents.reserve(document->size());
    for (const auto& element : *document) {
        try {
            intents.push_back(element.get<MutationIntent>());
        } catch (const std::exception& e) {
            spdlog::warn("Dropping unreadable queued intent in {}: {}", path_.string(), e.what());
        }
    }
    return intents;
}

auto JsonFileQueueStore::store(const std::vector<MutationIntent>& intents) -> std::optional<Error> {
    return detail::write_json_file(path_, nlohmann::json(intents));
}

auto MemoryQueueStore::load() -> std::vector<MutationIntent> {
    return intents_;
}

auto MemoryQueueStore::store(const std::vector<MutationIntent>& intents) -> std::optional<Error> {
    ++store_calls_;
    if (failing_) return Error{ErrorKind::persistence_error, "queue store rejected write"};
    intents_ = intents;
    return std::nullopt;
}

// =============================================================================
// OfflineQueue
// =============================================================================

OfflineQueue::OfflineQueue(std::shared_ptr<QueueStore> store)
    : store_{std::move(store)} {
    if (store_) intents_ = store_->load();
    if (!intents_.empty()) {
        spdlog::info("Restored {} queued offline changes", intents_.size());
    }
}

auto OfflineQueue::enqueue(Mutation mutation) -> MutationIntent {
    auto intent = MutationIntent{
        .id = make_intent_id(),
        .mutation = std::move(mutation),
        .queued_at = now(),
    };
    intents_.push_back(intent);
    persist();
    spdlog::info("Change queued while offline: {} {}",
                 action_name(intent.mutation), target_id(intent.mutation));
    return intent;
}

auto OfflineQueue::drain(const Sender& sender) -> DrainReport {
    auto report = DrainReport{};
    if (draining_ || intents_.empty()) return report;

    draining_ = true;
    const auto snapshot = intents_;
    spdlog::info("Processing {} queued changes", snapshot.size());

    for (const auto& intent : snapshot) {
        ++report.attempted;
        auto sent = false;
        try {
            sent = sender(intent);
        } catch (const std::exception& e) {
            spdlog::error("Error sending queued change {}: {}", intent.id, e.what());
        }

        if (sent && remove(intent.id)) {
            ++report.delivered;
            persist();
        } else if (!sent) {
            ++report.failed;
            spdlog::warn("Queued change {} not delivered; will retry", intent.id);
        }
    }

    draining_ = false;
    return report;
}

auto OfflineQueue::remove(const std::string& intent_id) -> bool {
    auto it = std::ranges::find(intents_, intent_id, &MutationIntent::id);
    if (it == intents_.end()) return false;
    intents_.erase(it);
    return true;
}

void OfflineQueue::persist() {
    if (!store_) return;
    if (auto error = store_->store(intents_)) {
        spdlog::error("Failed to persist offline queue: {}", error->message);
    }
}

}  // namespace listing_sync
