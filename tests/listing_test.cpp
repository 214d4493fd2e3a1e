#include <listing-sync/listing.hpp>
#include <listing-sync/messages.hpp>
#include <listing-sync/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

using namespace listing_sync;

// -- Timestamp ----------------------------------------------------------------

TEST(Timestamp, default_is_epoch) {
    EXPECT_EQ(Timestamp{}.millis_since_epoch, 0);
}

TEST(Timestamp, ordering) {
    EXPECT_LT(Timestamp{1}, Timestamp{2});
    EXPECT_EQ(Timestamp{5}, Timestamp{5});
}

TEST(Timestamp, now_is_after_2020) {
    EXPECT_GT(now().millis_since_epoch, 1577836800000);
}

// -- Id generation ------------------------------------------------------------

TEST(ListingId, has_timestamp_and_random_suffix) {
    const auto id = make_listing_id();
    const auto dash = id.find('-');
    ASSERT_NE(dash, std::string::npos);

    const auto prefix = id.substr(0, dash);
    const auto suffix = id.substr(dash + 1);
    EXPECT_TRUE(std::ranges::all_of(prefix, [](unsigned char c) { return std::isdigit(c); }));
    EXPECT_EQ(suffix.size(), 8u);
    EXPECT_TRUE(std::ranges::all_of(suffix, [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'z');
    }));
}

TEST(ListingId, unique_across_many_calls) {
    auto ids = std::set<std::string>{};
    for (int i = 0; i < 1000; ++i) ids.insert(make_listing_id());
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(IntentId, has_six_digits_of_jitter) {
    const auto id = make_intent_id();
    const auto dot = id.find('.');
    ASSERT_NE(dot, std::string::npos);
    EXPECT_EQ(id.size() - dot - 1, 6u);
}

// -- Listing ------------------------------------------------------------------

TEST(Listing, title_reads_string_field) {
    const auto listing = Listing{"a", {{"title", "Flat"}}};
    EXPECT_EQ(listing.title(), "Flat");
}

TEST(Listing, title_absent_or_not_a_string) {
    EXPECT_FALSE((Listing{"a", {{"price", 3}}}.title().has_value()));
    EXPECT_FALSE((Listing{"a", {{"title", 3}}}.title().has_value()));
    EXPECT_FALSE((Listing{"a", nullptr}.title().has_value()));
}

TEST(Listing, make_listing_assigns_fresh_id_and_strips_id_field) {
    const auto listing = make_listing({{"id", "forged"}, {"title", "Flat"}});
    EXPECT_NE(listing.id, "forged");
    EXPECT_FALSE(listing.id.empty());
    EXPECT_FALSE(listing.fields.contains("id"));
    EXPECT_EQ(listing.title(), "Flat");
}

TEST(Listing, make_listing_with_non_object_gives_empty_fields) {
    const auto listing = make_listing(nlohmann::json::array());
    EXPECT_TRUE(listing.fields.is_object());
    EXPECT_TRUE(listing.fields.empty());
}

TEST(Listing, equality_compares_whole_value) {
    EXPECT_EQ((Listing{"a", {{"t", 1}}}), (Listing{"a", {{"t", 1}}}));
    EXPECT_NE((Listing{"a", {{"t", 1}}}), (Listing{"a", {{"t", 2}}}));
    EXPECT_NE((Listing{"a", {{"t", 1}}}), (Listing{"b", {{"t", 1}}}));
}

// -- Mutations and messages ---------------------------------------------------

TEST(Mutation, target_id_and_action_name) {
    const auto listing = Listing{"x1", {}};
    EXPECT_EQ(target_id(ListingAdded{listing}), "x1");
    EXPECT_EQ(target_id(ListingUpdated{listing}), "x1");
    EXPECT_EQ(target_id(ListingDeleted{"x2"}), "x2");

    EXPECT_EQ(action_name(ListingAdded{listing}), "added");
    EXPECT_EQ(action_name(ListingUpdated{listing}), "updated");
    EXPECT_EQ(action_name(ListingDeleted{"x2"}), "deleted");
}

TEST(Messages, to_client_message_keeps_alternative) {
    const auto listing = Listing{"x1", {}};
    EXPECT_TRUE(std::holds_alternative<ListingAdded>(to_client_message(ListingAdded{listing})));
    EXPECT_TRUE(std::holds_alternative<ListingUpdated>(to_client_message(ListingUpdated{listing})));
    EXPECT_TRUE(std::holds_alternative<ListingDeleted>(to_client_message(ListingDeleted{"x1"})));
}

TEST(Messages, event_names) {
    EXPECT_EQ(event_name(ClientMessage{ListingAdded{}}), "listing-added");
    EXPECT_EQ(event_name(ClientMessage{ListingUpdated{}}), "listing-updated");
    EXPECT_EQ(event_name(ClientMessage{ListingDeleted{}}), "listing-deleted");
    EXPECT_EQ(event_name(ClientMessage{SyncListings{}}), "sync-listings");

    EXPECT_EQ(event_name(ServerMessage{UpdateListings{ListingDeleted{"x"}, Timestamp{}}}),
              "update-listings");
    EXPECT_EQ(event_name(ServerMessage{SyncAllListings{}}), "sync-all-listings");
    EXPECT_EQ(event_name(ServerMessage{UsersCount{2}}), "users-count");
}
