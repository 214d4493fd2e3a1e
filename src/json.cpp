#include <listing-sync/json.hpp>

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace listing_sync {

namespace {

auto require_member(const nlohmann::json& j, std::string_view key) -> const nlohmann::json& {
    if (!j.is_object()) {
        throw std::runtime_error{"expected a JSON object"};
    }
    auto it = j.find(std::string{key});
    if (it == j.end()) {
        throw std::runtime_error{"missing member '" + std::string{key} + "'"};
    }
    return *it;
}

auto require_string(const nlohmann::json& j, std::string_view key) -> std::string {
    const auto& member = require_member(j, key);
    if (!member.is_string()) {
        throw std::runtime_error{"member '" + std::string{key} + "' must be a string"};
    }
    return member.get<std::string>();
}

auto require_id(const nlohmann::json& j) -> std::string {
    if (!j.is_string()) throw std::runtime_error{"listing id must be a string"};
    auto id = j.get<std::string>();
    if (id.empty()) throw std::runtime_error{"listing id must not be empty"};
    return id;
}

auto listings_from(const nlohmann::json& j) -> std::vector<Listing> {
    if (!j.is_array()) throw std::runtime_error{"expected an array of listings"};
    auto result = std::vector<Listing>{};
    result.reserve(j.size());
    for (const auto& element : j) {
        result.push_back(element.get<Listing>());
    }
    return result;
}

auto message(std::string_view event, nlohmann::json data) -> nlohmann::json {
    return nlohmann::json{{"event", std::string{event}}, {"data", std::move(data)}};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = t.millis_since_epoch;
}

void from_json(const nlohmann::json& j, Timestamp& t) {
    if (!j.is_number_integer()) throw std::runtime_error{"timestamp must be an integer"};
    t.millis_since_epoch = j.get<std::int64_t>();
}

void to_json(nlohmann::json& j, const Listing& listing) {
    j = listing.fields.is_object() ? listing.fields : nlohmann::json::object();
    j["id"] = listing.id;
}

void from_json(const nlohmann::json& j, Listing& listing) {
    if (!j.is_object()) throw std::runtime_error{"listing must be a JSON object"};
    listing.id = require_id(require_member(j, "id"));
    listing.fields = j;
    listing.fields.erase("id");
}

void to_json(nlohmann::json& j, const Mutation& mutation) {
    std::visit(overload{
        [&](const ListingAdded& m) {
            j = nlohmann::json{{"action", "added"}, {"listing", m.listing}};
        },
        [&](const ListingUpdated& m) {
            j = nlohmann::json{{"action", "updated"}, {"listing", m.listing}};
        },
        [&](const ListingDeleted& m) {
            j = nlohmann::json{{"action", "deleted"}, {"listingId", m.id}};
        },
    }, mutation);
}

void from_json(const nlohmann::json& j, Mutation& mutation) {
    auto action = require_string(j, "action");
    if (action == "added") {
        mutation = ListingAdded{require_member(j, "listing").get<Listing>()};
    } else if (action == "updated") {
        mutation = ListingUpdated{require_member(j, "listing").get<Listing>()};
    } else if (action == "deleted") {
        mutation = ListingDeleted{require_id(require_member(j, "listingId"))};
    } else {
        throw std::runtime_error{"unknown mutation action '" + action + "'"};
    }
}

void to_json(nlohmann::json& j, const MutationIntent& intent) {
    j = nlohmann::json{
        {"id", intent.id},
        {"mutation", intent.mutation},
        {"queuedAt", intent.queued_at},
    };
}

void from_json(const nlohmann::json& j, MutationIntent& intent) {
    intent.id = require_string(j, "id");
    intent.mutation = require_member(j, "mutation").get<Mutation>();
    intent.queued_at = require_member(j, "queuedAt").get<Timestamp>();
}

// =============================================================================
// Channel messages
// =============================================================================

auto encode(const ClientMessage& msg) -> nlohmann::json {
    auto data = std::visit(overload{
        [](const ListingAdded& m) { return nlohmann::json(m.listing); },
        [](const ListingUpdated& m) { return nlohmann::json(m.listing); },
        [](const ListingDeleted& m) { return nlohmann::json(m.id); },
        [](const SyncListings& m) { return nlohmann::json(m.listings); },
    }, msg);
    return message(event_name(msg), std::move(data));
}

auto encode(const ServerMessage& msg) -> nlohmann::json {
    auto data = std::visit(overload{
        [](const UpdateListings& m) {
            auto j = nlohmann::json(m.mutation);
            j["timestamp"] = m.timestamp;
            return j;
        },
        [](const SyncAllListings& m) { return nlohmann::json(m.listings); },
        [](const UsersCount& m) { return nlohmann::json(m.count); },
    }, msg);
    return message(event_name(msg), std::move(data));
}

auto decode_client_message(const nlohmann::json& j) -> ClientMessage {
    auto event = require_string(j, "event");
    const auto& data = require_member(j, "data");

    if (event == "listing-added") return ListingAdded{data.get<Listing>()};
    if (event == "listing-updated") return ListingUpdated{data.get<Listing>()};
    if (event == "listing-deleted") return ListingDeleted{require_id(data)};
    if (event == "sync-listings") return SyncListings{decode_listings_lenient(data)};
    throw std::runtime_error{"unknown client event '" + event + "'"};
}

auto decode_server_message(const nlohmann::json& j) -> ServerMessage {
    auto event = require_string(j, "event");
    const auto& data = require_member(j, "data");

    if (event == "update-listings") {
        auto timestamp = Timestamp{};
        if (data.is_object() && data.contains("timestamp")) {
            timestamp = data.at("timestamp").get<Timestamp>();
        }
        return UpdateListings{data.get<Mutation>(), timestamp};
    }
    if (event == "sync-all-listings") return SyncAllListings{listings_from(data)};
    if (event == "users-count") {
        if (!data.is_number_integer()) {
            throw std::runtime_error{"users-count must be an integer"};
        }
        auto count = data.get<std::int64_t>();
        if (count < 0) throw std::runtime_error{"users-count must not be negative"};
        return UsersCount{static_cast<std::size_t>(count)};
    }
    throw std::runtime_error{"unknown server event '" + event + "'"};
}

auto try_decode_client_message(const nlohmann::json& j) -> std::variant<ClientMessage, Error> {
    try {
        return decode_client_message(j);
    } catch (const std::exception& e) {
        return Error{ErrorKind::decoding_error, e.what()};
    }
}

auto try_decode_server_message(const nlohmann::json& j) -> std::variant<ServerMessage, Error> {
    try {
        return decode_server_message(j);
    } catch (const std::exception& e) {
        return Error{ErrorKind::decoding_error, e.what()};
    }
}

auto decode_listings_lenient(const nlohmann::json& j) -> std::vector<Listing> {
    if (!j.is_array()) throw std::runtime_error{"expected an array of listings"};
    auto result = std::vector<Listing>{};
    result.reserve(j.size());
    for (const auto& element : j) {
        if (!element.is_object()) continue;
        auto id = element.find("id");
        if (id == element.end() || !id->is_string() || id->get_ref<const std::string&>().empty()) {
            continue;
        }
        result.push_back(element.get<Listing>());
    }
    return result;
}

}  // namespace listing_sync
