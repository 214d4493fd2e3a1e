/// @file backoff.hpp
/// @brief Exponential reconnect backoff with jitter and no retry limit.

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace listing_sync {

/// Tuning for Backoff.
struct BackoffOptions {
    std::chrono::milliseconds initial{1000};  ///< Delay before the first retry.
    std::chrono::milliseconds max{5000};      ///< Upper bound on any delay.
    double multiplier{2.0};                   ///< Growth per failed attempt.
    double jitter{0.5};                       ///< Fraction of the delay randomized away, in [0, 1].
};

/// Computes reconnect delays. There is no attempt limit: a client keeps
/// retrying for as long as it runs.
///
/// The n-th delay is `min(initial * multiplier^n, max)`, reduced by a
/// uniformly random fraction of up to `jitter` of itself.
class Backoff {
public:
    explicit Backoff(BackoffOptions options = {});
    Backoff(BackoffOptions options, std::uint64_t seed);

    /// The delay before the next attempt. Advances the attempt counter.
    auto next_delay() -> std::chrono::milliseconds;

    /// Forget past failures (called after a successful connection).
    void reset() { attempts_ = 0; }

    auto attempts() const -> std::uint64_t { return attempts_; }
    auto options() const -> const BackoffOptions& { return options_; }

private:
    BackoffOptions options_;
    std::uint64_t attempts_{0};
    std::mt19937_64 rng_;
};

}  // namespace listing_sync
