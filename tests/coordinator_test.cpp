#include <listing-sync/coordinator.hpp>
#include <listing-sync/loopback.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace listing_sync;

namespace {

auto make(const std::string& id, const std::string& title = "t") -> Listing {
    return Listing{id, {{"title", title}}};
}

// Channel whose send always fails or throws.
class BrokenChannel final : public Channel {
public:
    BrokenChannel(ChannelId id, bool throws) : id_{id}, throws_{throws} {}
    auto id() const -> ChannelId override { return id_; }
    auto send(const ServerMessage&) -> bool override {
        ++attempts;
        if (throws_) throw std::runtime_error{"socket exploded"};
        return false;
    }
    std::atomic<int> attempts{0};

private:
    ChannelId id_;
    bool throws_;
};

class CoordinatorTest : public ::testing::Test {
protected:
    auto connect(ChannelId id) -> std::shared_ptr<LoopbackChannel> {
        auto channel = std::make_shared<LoopbackChannel>(id);
        coordinator_.attach(channel);
        return channel;
    }

    MemoryBackend backend_{{make("seed", "seeded")}};
    ServerCoordinator coordinator_{backend_};

    void SetUp() override { coordinator_.start(); }
};

template <typename T>
auto only(const std::vector<ServerMessage>& messages) -> std::vector<T> {
    auto result = std::vector<T>{};
    for (const auto& message : messages) {
        if (auto* m = std::get_if<T>(&message)) result.push_back(*m);
    }
    return result;
}

}  // anonymous namespace

// -- start / attach / detach --------------------------------------------------

TEST_F(CoordinatorTest, start_loads_backend) {
    ASSERT_EQ(coordinator_.snapshot().size(), 1u);
    EXPECT_EQ(coordinator_.snapshot()[0].id, "seed");
}

TEST_F(CoordinatorTest, attach_broadcasts_count_then_sends_full_state) {
    auto channel = connect(1);
    const auto messages = channel->take();

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], ServerMessage{UsersCount{1}});
    ASSERT_TRUE(std::holds_alternative<SyncAllListings>(messages[1]));
    EXPECT_EQ(std::get<SyncAllListings>(messages[1]).listings, coordinator_.snapshot());
}

TEST_F(CoordinatorTest, full_state_on_attach_goes_to_new_channel_only) {
    auto first = connect(1);
    first->take();
    auto second = connect(2);

    const auto to_first = first->take();
    ASSERT_EQ(to_first.size(), 1u);
    EXPECT_EQ(to_first[0], ServerMessage{UsersCount{2}});
    EXPECT_EQ(only<SyncAllListings>(second->take()).size(), 1u);
}

TEST_F(CoordinatorTest, detach_broadcasts_new_count) {
    auto first = connect(1);
    auto second = connect(2);
    first->take();

    coordinator_.detach(2);
    EXPECT_EQ(coordinator_.users_count(), 1u);
    EXPECT_EQ(first->take(), (std::vector<ServerMessage>{UsersCount{1}}));
}

TEST_F(CoordinatorTest, detach_unknown_channel_is_ignored) {
    auto channel = connect(1);
    channel->take();
    coordinator_.detach(42);
    EXPECT_EQ(coordinator_.users_count(), 1u);
    EXPECT_TRUE(channel->take().empty());
}

TEST_F(CoordinatorTest, duplicate_attach_is_ignored) {
    auto channel = connect(1);
    coordinator_.attach(std::make_shared<LoopbackChannel>(1));
    EXPECT_EQ(coordinator_.users_count(), 1u);
}

// -- Mutations ----------------------------------------------------------------

TEST_F(CoordinatorTest, added_is_persisted_and_broadcast_to_every_channel) {
    auto channels = std::vector{connect(1), connect(2), connect(3)};
    for (auto& channel : channels) channel->take();

    const auto listing = make("x1", "Loft");
    coordinator_.handle(1, ListingAdded{listing});

    for (auto& channel : channels) {
        const auto updates = only<UpdateListings>(channel->take());
        ASSERT_EQ(updates.size(), 1u) << "channel " << channel->id();
        EXPECT_EQ(updates[0].mutation, Mutation{ListingAdded{listing}});
        EXPECT_GT(updates[0].timestamp.millis_since_epoch, 0);
    }
    EXPECT_EQ(backend_.stored().size(), 2u);
    EXPECT_EQ(coordinator_.snapshot().front().id, "x1");
}

TEST_F(CoordinatorTest, repeated_add_is_an_idempotent_upsert) {
    coordinator_.handle(1, ListingAdded{make("x1", "v1")});
    coordinator_.handle(1, ListingAdded{make("x1", "v2")});

    const auto snapshot = coordinator_.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot.front().title(), "v2");
}

TEST_F(CoordinatorTest, updated_for_unknown_id_inserts) {
    coordinator_.handle(1, ListingUpdated{make("new")});
    EXPECT_EQ(coordinator_.snapshot().size(), 2u);
}

TEST_F(CoordinatorTest, updated_is_broadcast_as_updated) {
    auto channel = connect(1);
    channel->take();
    coordinator_.handle(1, ListingUpdated{make("seed", "renamed")});

    const auto updates = only<UpdateListings>(channel->take());
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ListingUpdated>(updates[0].mutation));
    EXPECT_EQ(coordinator_.snapshot()[0].title(), "renamed");
}

TEST_F(CoordinatorTest, deleted_removes_and_broadcasts) {
    auto channel = connect(1);
    channel->take();
    coordinator_.handle(1, ListingDeleted{"seed"});

    EXPECT_TRUE(coordinator_.snapshot().empty());
    EXPECT_TRUE(backend_.stored().empty());
    const auto updates = only<UpdateListings>(channel->take());
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].mutation, Mutation{ListingDeleted{"seed"}});
}

TEST_F(CoordinatorTest, deleted_unknown_id_still_broadcasts) {
    auto channel = connect(1);
    channel->take();
    coordinator_.handle(1, ListingDeleted{"ghost"});
    EXPECT_EQ(only<UpdateListings>(channel->take()).size(), 1u);
    EXPECT_EQ(coordinator_.snapshot().size(), 1u);
}

TEST_F(CoordinatorTest, empty_ids_are_rejected) {
    auto channel = connect(1);
    channel->take();

    for (const auto& message : std::vector<ClientMessage>{
             ListingAdded{Listing{""}}, ListingUpdated{Listing{""}}, ListingDeleted{""}}) {
        const auto error = coordinator_.handle(1, message);
        ASSERT_TRUE(error.has_value());
        EXPECT_EQ(error->kind, ErrorKind::invalid_listing);
    }

    EXPECT_TRUE(channel->take().empty());
    EXPECT_EQ(backend_.save_calls(), 0u);
    EXPECT_EQ(backend_.remove_calls(), 0u);
}

// -- Reconciliation -----------------------------------------------------------

TEST_F(CoordinatorTest, accepted_events_return_no_error) {
    EXPECT_FALSE(coordinator_.handle(1, ListingAdded{make("a")}));
    EXPECT_FALSE(coordinator_.handle(1, ListingUpdated{make("a", "v2")}));
    EXPECT_FALSE(coordinator_.handle(1, ListingDeleted{"a"}));
    EXPECT_FALSE(coordinator_.handle(1, SyncListings{{make("b")}}));
}

TEST_F(CoordinatorTest, sync_merges_missing_ids_only) {
    EXPECT_FALSE(coordinator_.handle(
        1, SyncListings{{make("seed", "client copy"), make("c1", "client")}}));

    const auto replica = Replica{coordinator_.snapshot()};
    EXPECT_EQ(replica.size(), 2u);
    EXPECT_EQ(replica.find("seed")->title(), "seeded");
    EXPECT_EQ(replica.find("c1")->title(), "client");
    EXPECT_EQ(backend_.save_calls(), 1u);
}

TEST_F(CoordinatorTest, sync_broadcasts_full_state_to_every_channel) {
    auto first = connect(1);
    auto second = connect(2);
    first->take();
    second->take();

    coordinator_.handle(2, SyncListings{{make("c1")}});

    for (auto* channel : {first.get(), second.get()}) {
        const auto syncs = only<SyncAllListings>(channel->take());
        ASSERT_EQ(syncs.size(), 1u);
        EXPECT_EQ(syncs[0].listings, coordinator_.snapshot());
    }
}

TEST_F(CoordinatorTest, sync_skips_invalid_entries) {
    coordinator_.handle(1, SyncListings{{Listing{""}, make("ok")}});
    EXPECT_EQ(coordinator_.snapshot().size(), 2u);
}

TEST_F(CoordinatorTest, empty_sync_still_answers) {
    auto channel = connect(1);
    channel->take();
    coordinator_.handle(1, SyncListings{});
    EXPECT_EQ(only<SyncAllListings>(channel->take()).size(), 1u);
}

// -- Persistence policy -------------------------------------------------------

TEST_F(CoordinatorTest, best_effort_broadcasts_despite_backend_failure) {
    auto channel = connect(1);
    channel->take();
    backend_.set_failing(true);

    const auto error = coordinator_.handle(1, ListingAdded{make("x1")});
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::persistence_error);

    EXPECT_EQ(only<UpdateListings>(channel->take()).size(), 1u);
    EXPECT_EQ(coordinator_.snapshot().size(), 2u);
    EXPECT_EQ(backend_.stored().size(), 1u);
}

TEST(CoordinatorDurable, failed_write_leaves_replica_and_suppresses_broadcast) {
    auto backend = MemoryBackend{};
    auto coordinator = ServerCoordinator{backend, {.persistence_policy = PersistencePolicy::durable}};
    coordinator.start();
    auto channel = std::make_shared<LoopbackChannel>(1);
    coordinator.attach(channel);
    channel->take();

    backend.set_failing(true);
    EXPECT_EQ(coordinator.handle(1, ListingAdded{make("x1")}).value().kind,
              ErrorKind::persistence_error);
    EXPECT_EQ(coordinator.handle(1, SyncListings{{make("x2")}}).value().kind,
              ErrorKind::persistence_error);

    EXPECT_TRUE(coordinator.snapshot().empty());
    const auto messages = channel->take();
    EXPECT_TRUE(only<UpdateListings>(messages).empty());
    // The reconciliation answer is still sent, without the unsaved entry.
    ASSERT_EQ(only<SyncAllListings>(messages).size(), 1u);
    EXPECT_TRUE(only<SyncAllListings>(messages)[0].listings.empty());
}

TEST_F(CoordinatorTest, best_effort_sync_keeps_unsaved_entries_and_reports) {
    backend_.set_failing(true);

    const auto error = coordinator_.handle(1, SyncListings{{make("c1"), make("c2")}});

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::persistence_error);
    EXPECT_EQ(coordinator_.snapshot().size(), 3u);
    EXPECT_EQ(backend_.save_calls(), 2u);
}

TEST(PersistencePolicy, names) {
    EXPECT_EQ(to_string_view(PersistencePolicy::best_effort), "best_effort");
    EXPECT_EQ(to_string_view(PersistencePolicy::durable), "durable");
}

// -- Fanout -------------------------------------------------------------------

TEST_F(CoordinatorTest, failing_channel_does_not_block_others) {
    auto broken = std::make_shared<BrokenChannel>(7, false);
    auto throwing = std::make_shared<BrokenChannel>(8, true);
    coordinator_.attach(broken);
    coordinator_.attach(throwing);
    auto healthy = connect(1);
    healthy->take();

    coordinator_.handle(1, ListingAdded{make("x1")});

    EXPECT_EQ(only<UpdateListings>(healthy->take()).size(), 1u);
    EXPECT_GT(broken->attempts.load(), 0);
    EXPECT_GT(throwing->attempts.load(), 0);
}

TEST(CoordinatorFanout, parallel_fanout_reaches_every_channel_in_order) {
    auto backend = MemoryBackend{};
    auto coordinator = ServerCoordinator{backend, {.fanout_threads = 4}};
    coordinator.start();

    auto channels = std::vector<std::shared_ptr<LoopbackChannel>>{};
    for (ChannelId id = 1; id <= 32; ++id) {
        channels.push_back(std::make_shared<LoopbackChannel>(id));
        coordinator.attach(channels.back());
    }
    for (auto& channel : channels) channel->take();

    for (int i = 0; i < 20; ++i) {
        coordinator.handle(1, ListingAdded{make("x" + std::to_string(i))});
    }

    for (auto& channel : channels) {
        const auto updates = only<UpdateListings>(channel->take());
        ASSERT_EQ(updates.size(), 20u);
        for (int i = 0; i < 20; ++i) {
            EXPECT_EQ(target_id(updates[static_cast<std::size_t>(i)].mutation), "x" + std::to_string(i));
        }
    }
}

TEST(CoordinatorFanout, concurrent_handlers_are_serialized) {
    auto backend = MemoryBackend{};
    auto coordinator = ServerCoordinator{backend, {.fanout_threads = 2}};
    coordinator.start();
    auto channel = std::make_shared<LoopbackChannel>(1);
    coordinator.attach(channel);
    channel->take();

    {
        auto writers = std::vector<std::jthread>{};
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&coordinator, t] {
                for (int i = 0; i < 50; ++i) {
                    coordinator.handle(1, ListingAdded{
                        make("t" + std::to_string(t) + "-" + std::to_string(i))});
                }
            });
        }
    }

    EXPECT_EQ(coordinator.snapshot().size(), 200u);
    EXPECT_EQ(backend.stored().size(), 200u);
    EXPECT_EQ(only<UpdateListings>(channel->take()).size(), 200u);
}
