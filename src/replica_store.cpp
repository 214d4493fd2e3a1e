#include <listing-sync/replica_store.hpp>
#include <listing-sync/json.hpp>

#include "file_util.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace listing_sync {

JsonFileReplicaStore::JsonFileReplicaStore(std::filesystem::path path)
    : path_{std::move(path)} {}

auto JsonFileReplicaStore::load() -> std::vector<Listing> {
    auto document = detail::read_json_file(path_);
    if (!document) return {};

    try {
        auto listings = decode_listings_lenient(*document);
        spdlog::info("Restored {} cached listings from {}", listings.size(), path_.string());
        return listings;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load cached listings from {}: {}", path_.string(), e.what());
        return {};
    }
}

auto JsonFileReplicaStore::store(const std::vector<Listing>& listings) -> std::optional<Error> {
    return detail::write_json_file(path_, nlohmann::json(listings));
}

auto MemoryReplicaStore::load() -> std::vector<Listing> {
    return listings_;
}

auto MemoryReplicaStore::store(const std::vector<Listing>& listings) -> std::optional<Error> {
    ++store_calls_;
    if (failing_) return Error{ErrorKind::persistence_error, "replica store rejected write"};
    listings_ = listings;
    return std::nullopt;
}

}  // namespace listing_sync
