// offline_demo: a client edits while offline, then reconnects
//
// Demonstrates: ClientAgent, OfflineQueue, ServerCoordinator,
//               LoopbackHub reconciliation and broadcast fanout

#include <listing-sync/listing_sync.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <memory>
#include <string>

namespace ls = listing_sync;

static void print_replica(const char* who, const ls::Replica& replica) {
    std::printf("%s has %zu listings:", who, replica.size());
    for (const auto& listing : replica.listings()) {
        std::printf(" [%s]", listing.title().value_or(listing.id).c_str());
    }
    std::printf("\n");
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    auto backend = ls::MemoryBackend{{
        ls::Listing{"seed-1", {{"title", "Sunny studio"}}},
    }};
    auto server = ls::ServerCoordinator{backend};
    server.start();
    auto hub = ls::LoopbackHub{server};

    auto alice = ls::ClientAgent{std::make_shared<ls::MemoryQueueStore>()};
    auto bob = ls::ClientAgent{std::make_shared<ls::MemoryQueueStore>()};
    auto& alice_link = hub.add_client(alice);
    auto& bob_link = hub.add_client(bob);

    // --- Scenario 1: Both online ---
    std::printf("=== Scenario 1: Both clients online ===\n");

    alice_link.connect();
    bob_link.connect();
    hub.pump();
    std::printf("Users online: %zu\n", server.users_count());
    print_replica("Alice", alice.replica());
    print_replica("Bob", bob.replica());

    // --- Scenario 2: Alice edits offline ---
    std::printf("\n=== Scenario 2: Alice goes offline and edits ===\n");

    alice_link.disconnect();
    hub.pump();
    auto loft = alice.create({{"title", "Loft by the river"}, {"price", 1200}});
    alice.remove("seed-1");

    std::printf("Alice status: %s, queued changes: %zu\n",
                std::string{ls::to_string_view(alice.status())}.c_str(), alice.queue().size());
    print_replica("Alice", alice.replica());
    print_replica("Bob", bob.replica());

    // --- Scenario 3: Reconnect ---
    std::printf("\n=== Scenario 3: Alice reconnects ===\n");

    alice_link.connect();
    hub.pump();

    std::printf("Alice queued changes after drain: %zu\n", alice.queue().size());
    print_replica("Server", ls::Replica{server.snapshot()});
    print_replica("Alice", alice.replica());
    print_replica("Bob", bob.replica());

    // --- Scenario 4: Bob edits the new listing online ---
    std::printf("\n=== Scenario 4: Bob updates Alice's listing ===\n");

    loft.fields["price"] = 1100;
    bob.update(loft);
    hub.pump();

    const auto* seen = alice.replica().find(loft.id);
    std::printf("Alice sees price %s\n", seen ? seen->fields.at("price").dump().c_str() : "(missing)");
    std::printf("Replicas converged: %s\n",
                alice.replica() == bob.replica() ? "yes" : "no");

    return 0;
}
