#include <listing-sync/types.hpp>

#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace listing_sync {

namespace {

auto thread_rng() -> std::mt19937_64& {
    thread_local auto rng = std::mt19937_64{std::random_device{}()};
    return rng;
}

auto random_suffix(std::size_t length) -> std::string {
    static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    auto dist = std::uniform_int_distribution<std::size_t>{0, sizeof(alphabet) - 2};
    auto result = std::string{};
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(alphabet[dist(thread_rng())]);
    }
    return result;
}

}  // anonymous namespace

auto now() -> Timestamp {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()};
}

auto make_listing_id() -> std::string {
    return std::to_string(now().millis_since_epoch) + "-" + random_suffix(8);
}

auto make_intent_id() -> std::string {
    // Six digits of jitter after the timestamp, so ids from the same
    // millisecond still sort close to their creation order.
    auto jitter = std::uniform_int_distribution<int>{0, 999999}(thread_rng());
    auto digits = std::to_string(jitter);
    return std::to_string(now().millis_since_epoch) + "." +
           std::string(6 - digits.size(), '0') + digits;
}

}  // namespace listing_sync
