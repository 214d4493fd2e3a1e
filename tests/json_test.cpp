// json_test.cpp: Tests for the nlohmann/json encoding of listings,
// queued intents and channel messages

#include <listing-sync/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace ls = listing_sync;
using json = nlohmann::json;

// =============================================================================
// Listing
// =============================================================================

TEST(ListingJson, id_is_merged_into_fields) {
    const auto listing = ls::Listing{"x1", {{"title", "Flat"}, {"price", 900}}};
    const auto j = json(listing);
    EXPECT_EQ(j, (json{{"id", "x1"}, {"title", "Flat"}, {"price", 900}}));
}

TEST(ListingJson, from_json_splits_id_from_fields) {
    const auto listing = json{{"id", "x1"}, {"title", "Flat"}}.get<ls::Listing>();
    EXPECT_EQ(listing.id, "x1");
    EXPECT_EQ(listing.fields, (json{{"title", "Flat"}}));
}

TEST(ListingJson, nested_payload_survives) {
    const auto source = json{
        {"id", "x1"},
        {"images", {"a.jpg", "b.jpg"}},
        {"pricing", {{"weekly", 100}, {"monthly", 350}}},
    };
    EXPECT_EQ(json(source.get<ls::Listing>()), source);
}

TEST(ListingJson, rejects_missing_or_bad_id) {
    EXPECT_THROW((json{{"title", "Flat"}}.get<ls::Listing>()), std::runtime_error);
    EXPECT_THROW((json{{"id", 7}}.get<ls::Listing>()), std::runtime_error);
    EXPECT_THROW((json{{"id", ""}}.get<ls::Listing>()), std::runtime_error);
    EXPECT_THROW(json::array().get<ls::Listing>(), std::runtime_error);
}

// =============================================================================
// Mutation and MutationIntent
// =============================================================================

TEST(MutationJson, added_and_updated_carry_listing) {
    const auto listing = ls::Listing{"x1", {{"title", "Flat"}}};
    const auto added = json(ls::Mutation{ls::ListingAdded{listing}});
    EXPECT_EQ(added["action"], "added");
    EXPECT_EQ(added["listing"]["id"], "x1");

    const auto updated = json(ls::Mutation{ls::ListingUpdated{listing}});
    EXPECT_EQ(updated["action"], "updated");
}

TEST(MutationJson, deleted_carries_listing_id) {
    const auto j = json(ls::Mutation{ls::ListingDeleted{"x1"}});
    EXPECT_EQ(j, (json{{"action", "deleted"}, {"listingId", "x1"}}));
}

TEST(MutationJson, unknown_action_throws) {
    EXPECT_THROW((json{{"action", "moved"}, {"listingId", "x"}}.get<ls::Mutation>()),
                 std::runtime_error);
}

TEST(IntentJson, round_trip) {
    const auto intent = ls::MutationIntent{
        .id = "1700000000000.000042",
        .mutation = ls::ListingDeleted{"x1"},
        .queued_at = ls::Timestamp{1700000000000},
    };
    const auto j = json(intent);
    EXPECT_EQ(j["queuedAt"], 1700000000000);
    EXPECT_EQ(j.get<ls::MutationIntent>(), intent);
}

// =============================================================================
// Client messages
// =============================================================================

TEST(ClientMessageJson, envelope_has_event_and_data) {
    const auto j = ls::encode(ls::ClientMessage{ls::ListingDeleted{"x1"}});
    EXPECT_EQ(j, (json{{"event", "listing-deleted"}, {"data", "x1"}}));
}

TEST(ClientMessageJson, listing_added_decodes) {
    const auto j = json{{"event", "listing-added"}, {"data", {{"id", "x1"}, {"title", "Flat"}}}};
    const auto message = ls::decode_client_message(j);
    ASSERT_TRUE(std::holds_alternative<ls::ListingAdded>(message));
    EXPECT_EQ(std::get<ls::ListingAdded>(message).listing.title(), "Flat");
}

TEST(ClientMessageJson, sync_listings_skips_invalid_entries) {
    const auto j = json{
        {"event", "sync-listings"},
        {"data", json::array({
            {{"id", "a"}},
            {{"title", "no id"}},
            {{"id", ""}},
            42,
            {{"id", "b"}},
        })},
    };
    const auto message = ls::decode_client_message(j);
    const auto& sync = std::get<ls::SyncListings>(message);
    ASSERT_EQ(sync.listings.size(), 2u);
    EXPECT_EQ(sync.listings[0].id, "a");
    EXPECT_EQ(sync.listings[1].id, "b");
}

TEST(ClientMessageJson, unknown_event_throws) {
    EXPECT_THROW(ls::decode_client_message(json{{"event", "chat"}, {"data", 1}}),
                 std::runtime_error);
}

TEST(ClientMessageJson, missing_members_throw) {
    EXPECT_THROW(ls::decode_client_message(json{{"event", "listing-added"}}), std::runtime_error);
    EXPECT_THROW(ls::decode_client_message(json{{"data", 1}}), std::runtime_error);
    EXPECT_THROW(ls::decode_client_message(json::array()), std::runtime_error);
}

TEST(ClientMessageJson, try_decode_reports_decoding_error) {
    auto result = ls::try_decode_client_message(json{{"event", "listing-deleted"}, {"data", 5}});
    ASSERT_TRUE(std::holds_alternative<ls::Error>(result));
    EXPECT_EQ(std::get<ls::Error>(result).kind, ls::ErrorKind::decoding_error);
}

TEST(ClientMessageJson, every_event_survives_encode_decode) {
    const auto listing = ls::Listing{"x1", {{"title", "Flat"}}};
    const auto messages = std::vector<ls::ClientMessage>{
        ls::ListingAdded{listing},
        ls::ListingUpdated{listing},
        ls::ListingDeleted{"x1"},
        ls::SyncListings{{listing, ls::Listing{"x2"}}},
    };
    for (const auto& message : messages) {
        EXPECT_EQ(ls::decode_client_message(ls::encode(message)), message)
            << ls::event_name(message);
    }
}

// =============================================================================
// Server messages
// =============================================================================

TEST(ServerMessageJson, update_listings_carries_timestamp) {
    const auto message = ls::ServerMessage{ls::UpdateListings{
        ls::ListingAdded{ls::Listing{"x1"}}, ls::Timestamp{1234}}};
    const auto j = ls::encode(message);
    EXPECT_EQ(j["event"], "update-listings");
    EXPECT_EQ(j["data"]["action"], "added");
    EXPECT_EQ(j["data"]["listing"]["id"], "x1");
    EXPECT_EQ(j["data"]["timestamp"], 1234);
    EXPECT_EQ(ls::decode_server_message(j), message);
}

TEST(ServerMessageJson, update_listings_without_timestamp_decodes) {
    const auto j = json{{"event", "update-listings"},
                        {"data", {{"action", "deleted"}, {"listingId", "x1"}}}};
    const auto message = ls::decode_server_message(j);
    const auto& update = std::get<ls::UpdateListings>(message);
    EXPECT_EQ(update.mutation, ls::Mutation{ls::ListingDeleted{"x1"}});
    EXPECT_EQ(update.timestamp, ls::Timestamp{});
}

TEST(ServerMessageJson, sync_all_is_strict) {
    const auto j = json{{"event", "sync-all-listings"}, {"data", json::array({{{"title", "x"}}})}};
    EXPECT_THROW(ls::decode_server_message(j), std::runtime_error);
}

TEST(ServerMessageJson, users_count) {
    const auto j = ls::encode(ls::ServerMessage{ls::UsersCount{3}});
    EXPECT_EQ(j, (json{{"event", "users-count"}, {"data", 3}}));
    EXPECT_EQ(ls::decode_server_message(j), ls::ServerMessage{ls::UsersCount{3}});
}

TEST(ServerMessageJson, negative_or_fractional_users_count_rejected) {
    EXPECT_THROW(ls::decode_server_message(json{{"event", "users-count"}, {"data", -1}}),
                 std::runtime_error);
    EXPECT_THROW(ls::decode_server_message(json{{"event", "users-count"}, {"data", 1.5}}),
                 std::runtime_error);
}

TEST(ServerMessageJson, try_decode_reports_unknown_event) {
    auto result = ls::try_decode_server_message(json{{"event", "nope"}, {"data", nullptr}});
    ASSERT_TRUE(std::holds_alternative<ls::Error>(result));
    EXPECT_NE(std::get<ls::Error>(result).message.find("nope"), std::string::npos);
}
