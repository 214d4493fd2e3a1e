#include <listing-sync/backoff.hpp>

#include <algorithm>
#include <cmath>
#include <random>

namespace listing_sync {

Backoff::Backoff(BackoffOptions options)
    : Backoff{options, std::random_device{}()} {}

Backoff::Backoff(BackoffOptions options, std::uint64_t seed)
    : options_{options}, rng_{seed} {
    options_.jitter = std::clamp(options_.jitter, 0.0, 1.0);
    options_.multiplier = std::max(options_.multiplier, 1.0);
    options_.max = std::max(options_.max, options_.initial);
}

auto Backoff::next_delay() -> std::chrono::milliseconds {
    const auto initial = static_cast<double>(options_.initial.count());
    const auto cap = static_cast<double>(options_.max.count());

    // Saturate the exponent so long outages don't overflow.
    const auto exponent = static_cast<double>(std::min<std::uint64_t>(attempts_, 63));
    const auto base = std::min(initial * std::pow(options_.multiplier, exponent), cap);
    ++attempts_;

    auto dist = std::uniform_real_distribution<double>{0.0, options_.jitter};
    const auto delay = base * (1.0 - dist(rng_));
    return std::chrono::milliseconds{static_cast<std::int64_t>(delay)};
}

}  // namespace listing_sync
