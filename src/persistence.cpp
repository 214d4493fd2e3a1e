#include <listing-sync/persistence.hpp>
#include <listing-sync/json.hpp>

#include "file_util.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace listing_sync {

// =============================================================================
// JsonFileBackend
// =============================================================================

JsonFileBackend::JsonFileBackend(std::filesystem::path path)
    : path_{std::move(path)} {}

auto JsonFileBackend::load_all() -> std::vector<Listing> {
    auto document = detail::read_json_file(path_);
    if (!document) {
        contents_ = Replica{};
        return {};
    }

    try {
        contents_ = Replica{decode_listings_lenient(*document)};
    } catch (const std::exception& e) {
        spdlog::error("Failed to load listings from {}: {}", path_.string(), e.what());
        contents_ = Replica{};
    }
    spdlog::info("Loaded {} listings from {}", contents_.size(), path_.string());
    return contents_.listings();
}

auto JsonFileBackend::save(const Listing& listing) -> std::optional<Error> {
    auto next = contents_;
    next.upsert(listing);
    return commit(std::move(next));
}

auto JsonFileBackend::remove(std::string_view id) -> std::optional<Error> {
    if (!contents_.contains(id)) return std::nullopt;
    auto next = contents_;
    next.erase(id);
    return commit(std::move(next));
}

auto JsonFileBackend::commit(Replica next) -> std::optional<Error> {
    // The cache only moves forward once the file holds the new state, so a
    // rejected write never reaches disk later with someone else's save.
    if (auto error = detail::write_json_file(path_, nlohmann::json(next.listings()), 2)) {
        return error;
    }
    contents_ = std::move(next);
    return std::nullopt;
}

// =============================================================================
// MemoryBackend
// =============================================================================

MemoryBackend::MemoryBackend(std::vector<Listing> initial)
    : contents_{initial} {}

auto MemoryBackend::load_all() -> std::vector<Listing> {
    auto lock = std::scoped_lock{mutex_};
    return contents_.listings();
}

auto MemoryBackend::save(const Listing& listing) -> std::optional<Error> {
    auto lock = std::scoped_lock{mutex_};
    ++save_calls_;
    if (failing_) {
        return Error{ErrorKind::persistence_error, "save rejected: " + listing.id};
    }
    contents_.upsert(listing);
    return std::nullopt;
}

auto MemoryBackend::remove(std::string_view id) -> std::optional<Error> {
    auto lock = std::scoped_lock{mutex_};
    ++remove_calls_;
    if (failing_) {
        return Error{ErrorKind::persistence_error, "remove rejected: " + std::string{id}};
    }
    contents_.erase(id);
    return std::nullopt;
}

void MemoryBackend::set_failing(bool failing) {
    auto lock = std::scoped_lock{mutex_};
    failing_ = failing;
}

auto MemoryBackend::stored() const -> std::vector<Listing> {
    auto lock = std::scoped_lock{mutex_};
    return contents_.listings();
}

auto MemoryBackend::save_calls() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return save_calls_;
}

auto MemoryBackend::remove_calls() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return remove_calls_;
}

}  // namespace listing_sync
