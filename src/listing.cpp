#include <listing-sync/listing.hpp>
#include <listing-sync/messages.hpp>

#include <utility>

namespace listing_sync {

auto Listing::title() const -> std::optional<std::string> {
    if (!fields.is_object()) return std::nullopt;
    auto it = fields.find("title");
    if (it == fields.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

auto make_listing(nlohmann::json fields) -> Listing {
    if (!fields.is_object()) fields = nlohmann::json::object();
    fields.erase("id");
    return Listing{.id = make_listing_id(), .fields = std::move(fields)};
}

auto target_id(const Mutation& mutation) -> const std::string& {
    return std::visit(overload{
        [](const ListingAdded& m) -> const std::string& { return m.listing.id; },
        [](const ListingUpdated& m) -> const std::string& { return m.listing.id; },
        [](const ListingDeleted& m) -> const std::string& { return m.id; },
    }, mutation);
}

auto action_name(const Mutation& mutation) -> std::string_view {
    return std::visit(overload{
        [](const ListingAdded&) { return std::string_view{"added"}; },
        [](const ListingUpdated&) { return std::string_view{"updated"}; },
        [](const ListingDeleted&) { return std::string_view{"deleted"}; },
    }, mutation);
}

// -- Messages -----------------------------------------------------------------

auto to_client_message(Mutation mutation) -> ClientMessage {
    return std::visit([](auto&& m) -> ClientMessage { return std::move(m); },
                      std::move(mutation));
}

auto to_mutation(const ClientMessage& message) -> std::optional<Mutation> {
    return std::visit(overload{
        [](const SyncListings&) -> std::optional<Mutation> { return std::nullopt; },
        [](const auto& m) -> std::optional<Mutation> { return Mutation{m}; },
    }, message);
}

auto event_name(const ClientMessage& message) -> std::string_view {
    return std::visit(overload{
        [](const ListingAdded&) { return std::string_view{"listing-added"}; },
        [](const ListingUpdated&) { return std::string_view{"listing-updated"}; },
        [](const ListingDeleted&) { return std::string_view{"listing-deleted"}; },
        [](const SyncListings&) { return std::string_view{"sync-listings"}; },
    }, message);
}

auto event_name(const ServerMessage& message) -> std::string_view {
    return std::visit(overload{
        [](const UpdateListings&) { return std::string_view{"update-listings"}; },
        [](const SyncAllListings&) { return std::string_view{"sync-all-listings"}; },
        [](const UsersCount&) { return std::string_view{"users-count"}; },
    }, message);
}

}  // namespace listing_sync
