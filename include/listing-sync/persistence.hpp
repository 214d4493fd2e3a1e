/// @file persistence.hpp
/// @brief Persistence backends for the server's authoritative replica.

#pragma once

#include <listing-sync/error.hpp>
#include <listing-sync/listing.hpp>
#include <listing-sync/replica.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace listing_sync {

/// The durability layer behind a ServerCoordinator.
///
/// Only the coordinator calls a backend, and always under its own
/// mutex, so implementations need no locking of their own.
class Backend {
public:
    virtual ~Backend() = default;

    /// Load every stored listing. Called once at startup.
    /// A backend that cannot read its store returns an empty list.
    virtual auto load_all() -> std::vector<Listing> = 0;

    /// Insert or replace a listing by id.
    /// @return nullopt on success, or the failure.
    virtual auto save(const Listing& listing) -> std::optional<Error> = 0;

    /// Remove a listing by id. Removing an unknown id succeeds.
    /// @return nullopt on success, or the failure.
    virtual auto remove(std::string_view id) -> std::optional<Error> = 0;
};

/// Keeps the whole collection in a single pretty-printed JSON array file,
/// rewritten on every change. A failed write leaves both the file and the
/// in-memory copy as they were.
class JsonFileBackend final : public Backend {
public:
    explicit JsonFileBackend(std::filesystem::path path);

    auto load_all() -> std::vector<Listing> override;
    auto save(const Listing& listing) -> std::optional<Error> override;
    auto remove(std::string_view id) -> std::optional<Error> override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    auto commit(Replica next) -> std::optional<Error>;

    std::filesystem::path path_;
    Replica contents_;
};

/// In-memory backend with failure injection, for tests and demos.
class MemoryBackend final : public Backend {
public:
    MemoryBackend() = default;
    explicit MemoryBackend(std::vector<Listing> initial);

    auto load_all() -> std::vector<Listing> override;
    auto save(const Listing& listing) -> std::optional<Error> override;
    auto remove(std::string_view id) -> std::optional<Error> override;

    /// Make every subsequent save/remove fail (or succeed again).
    void set_failing(bool failing);

    /// What has been durably stored so far.
    auto stored() const -> std::vector<Listing>;

    auto save_calls() const -> std::size_t;
    auto remove_calls() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    Replica contents_;
    bool failing_{false};
    std::size_t save_calls_{0};
    std::size_t remove_calls_{0};
};

}  // namespace listing_sync
