/// @file presence.hpp
/// @brief PresenceTracker: how many channels are currently open.

#pragma once

#include <cstddef>

namespace listing_sync {

/// Counter of open channels. Not persisted; starts at zero.
class PresenceTracker {
public:
    /// Record a new connection. @return The updated count.
    auto connect() -> std::size_t { return ++count_; }

    /// Record a disconnection. Never goes below zero. @return The updated count.
    auto disconnect() -> std::size_t {
        if (count_ > 0) --count_;
        return count_;
    }

    auto count() const -> std::size_t { return count_; }

private:
    std::size_t count_{0};
};

}  // namespace listing_sync
