/// @file channel.hpp
/// @brief Transport seams between clients and the server.

#pragma once

#include <listing-sync/messages.hpp>
#include <listing-sync/types.hpp>

#include <cstddef>

namespace listing_sync {

/// Largest message body a network transport accepts by default (64 MiB).
inline constexpr std::size_t default_max_frame_bytes = std::size_t{64} * 1024 * 1024;

/// The server's end of one client connection.
///
/// send() may be called from any thread, including several threads at
/// once during a broadcast fanout.
class Channel {
public:
    virtual ~Channel() = default;

    virtual auto id() const -> ChannelId = 0;

    /// Queue a message for this client.
    /// @return false if the channel is closed or the send failed.
    virtual auto send(const ServerMessage& message) -> bool = 0;
};

/// The client's end of its single logical connection.
class Transport {
public:
    virtual ~Transport() = default;

    /// Whether the connection is currently usable.
    virtual auto connected() const -> bool = 0;

    /// Send a message to the server.
    /// @return false if the connection is down or the send failed.
    virtual auto send(const ClientMessage& message) -> bool = 0;
};

}  // namespace listing_sync
