#include <listing-sync/replica.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace listing_sync {

Replica::Replica(const std::vector<Listing>& listings) {
    reset(listings);
}

Replica::Replica(const Replica& other)
    : entries_{other.entries_} {
    rebuild_index();
}

auto Replica::operator=(const Replica& other) -> Replica& {
    if (this != &other) {
        entries_ = other.entries_;
        rebuild_index();
    }
    return *this;
}

void Replica::rebuild_index() {
    index_.clear();
    index_.reserve(entries_.size());
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        index_.emplace(it->id, it);
    }
}

// -- Reading ------------------------------------------------------------------

auto Replica::contains(std::string_view id) const -> bool {
    return index_.contains(std::string{id});
}

auto Replica::find(std::string_view id) const -> const Listing* {
    auto it = index_.find(std::string{id});
    if (it == index_.end()) return nullptr;
    return &*it->second;
}

auto Replica::listings() const -> std::vector<Listing> {
    return {entries_.begin(), entries_.end()};
}

auto Replica::ids() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& listing : entries_) result.push_back(listing.id);
    return result;
}

// -- Writing ------------------------------------------------------------------

auto Replica::insert(Listing listing) -> bool {
    if (index_.contains(listing.id)) return false;
    entries_.push_front(std::move(listing));
    index_.emplace(entries_.front().id, entries_.begin());
    return true;
}

auto Replica::upsert(Listing listing) -> bool {
    if (replace(listing)) return false;
    return insert(std::move(listing));
}

auto Replica::replace(Listing listing) -> bool {
    auto it = index_.find(listing.id);
    if (it == index_.end()) return false;
    *it->second = std::move(listing);
    return true;
}

auto Replica::erase(std::string_view id) -> bool {
    auto it = index_.find(std::string{id});
    if (it == index_.end()) return false;
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

void Replica::reset(const std::vector<Listing>& listings) {
    entries_.clear();
    index_.clear();
    for (const auto& listing : listings) {
        if (index_.contains(listing.id)) continue;
        entries_.push_back(listing);
        index_.emplace(listing.id, std::prev(entries_.end()));
    }
}

auto Replica::apply(const Mutation& mutation) -> bool {
    return std::visit(overload{
        [&](const ListingAdded& m) { return insert(m.listing); },
        [&](const ListingUpdated& m) {
            upsert(m.listing);
            return true;
        },
        [&](const ListingDeleted& m) { return erase(m.id); },
    }, mutation);
}

auto Replica::merge_missing(const std::vector<Listing>& candidates,
                            const std::function<bool(const Listing&)>& admit)
    -> std::vector<Listing> {
    auto added = std::vector<Listing>{};
    for (const auto& candidate : candidates) {
        if (candidate.id.empty() || contains(candidate.id)) continue;
        if (admit && !admit(candidate)) continue;
        insert(candidate);
        added.push_back(candidate);
    }
    return added;
}

auto Replica::operator==(const Replica& other) const -> bool {
    return entries_ == other.entries_;
}

}  // namespace listing_sync
