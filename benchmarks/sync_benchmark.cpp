// listing-sync benchmarks: measures throughput of core operations.

#include <listing-sync/listing_sync.hpp>

#include "wire/frame.hpp"

#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace listing_sync;

static auto make_listings(std::size_t n, const std::string& prefix = "id-") -> std::vector<Listing> {
    auto listings = std::vector<Listing>{};
    listings.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        listings.push_back(Listing{prefix + std::to_string(i), {
            {"title", "Listing " + std::to_string(i)},
            {"description", "A bright two-bedroom flat close to the station."},
            {"price", 1000 + static_cast<std::int64_t>(i)},
        }});
    }
    return listings;
}

// Counts deliveries without queueing anything.
class CountingChannel final : public Channel {
public:
    explicit CountingChannel(ChannelId id) : id_{id} {}
    auto id() const -> ChannelId override { return id_; }
    auto send(const ServerMessage&) -> bool override {
        benchmark::DoNotOptimize(++sent_);
        return true;
    }

private:
    ChannelId id_;
    std::int64_t sent_{0};
};

// =============================================================================
// Replica
// =============================================================================

static void bm_replica_apply_added(benchmark::State& state) {
    const auto listings = make_listings(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto replica = Replica{};
        for (const auto& listing : listings) {
            replica.apply(ListingAdded{listing});
        }
        benchmark::DoNotOptimize(replica.size());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_replica_apply_added)->Range(10, 10000);

static void bm_replica_merge_missing(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto authoritative = make_listings(n, "server-");
    auto candidates = make_listings(n / 2, "server-");
    for (auto& listing : make_listings(n / 2, "client-")) candidates.push_back(std::move(listing));

    for (auto _ : state) {
        auto replica = Replica{authoritative};
        benchmark::DoNotOptimize(replica.merge_missing(candidates));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(candidates.size()));
}
BENCHMARK(bm_replica_merge_missing)->Range(10, 10000);

// =============================================================================
// Codec
// =============================================================================

static void bm_encode_sync_all(benchmark::State& state) {
    const auto message = ServerMessage{SyncAllListings{make_listings(static_cast<std::size_t>(state.range(0)))}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(wire::encode_frame(encode(message)));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_encode_sync_all)->Range(10, 10000);

static void bm_decode_sync_all(benchmark::State& state) {
    const auto message = ServerMessage{SyncAllListings{make_listings(static_cast<std::size_t>(state.range(0)))}};
    const auto frame = wire::encode_frame(encode(message));
    for (auto _ : state) {
        auto reader = wire::FrameReader{};
        reader.append(frame);
        benchmark::DoNotOptimize(decode_server_message(*reader.next()));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(frame.size()));
}
BENCHMARK(bm_decode_sync_all)->Range(10, 10000);

// =============================================================================
// Coordinator fanout
// =============================================================================

static void bm_coordinator_broadcast(benchmark::State& state) {
    spdlog::set_level(spdlog::level::off);
    const auto channels = static_cast<ChannelId>(state.range(0));
    const auto threads = static_cast<unsigned int>(state.range(1));

    auto backend = MemoryBackend{};
    auto coordinator = ServerCoordinator{backend, {.fanout_threads = threads}};
    coordinator.start();
    for (ChannelId id = 1; id <= channels; ++id) {
        coordinator.attach(std::make_shared<CountingChannel>(id));
    }

    auto listing = make_listings(1).front();
    for (auto _ : state) {
        coordinator.handle(1, ListingUpdated{listing});
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_coordinator_broadcast)
    ->Args({8, 1})
    ->Args({64, 1})
    ->Args({64, 4})
    ->Args({512, 4});
