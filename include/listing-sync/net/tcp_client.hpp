/// @file tcp_client.hpp
/// @brief Reconnecting TCP transport for a ClientAgent, built on Boost.Asio.

#pragma once

#include <listing-sync/agent.hpp>
#include <listing-sync/backoff.hpp>
#include <listing-sync/channel.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace listing_sync::wire {
class FrameReader;
}  // namespace listing_sync::wire

namespace listing_sync::net {

/// Where a TcpClient connects and how it retries.
struct TcpClientOptions {
    std::string host{"127.0.0.1"};
    std::uint16_t port{3000};
    BackoffOptions backoff{};
    /// How long to wait for sync-all-listings after sending sync-listings.
    std::chrono::milliseconds sync_timeout{10000};
    std::size_t max_frame_bytes{default_max_frame_bytes};
};

/// Connects a ClientAgent to a TcpServer and keeps it connected.
///
/// Failed or dropped connections are retried forever with exponential
/// backoff; the backoff resets after every successful connect. If the
/// server does not answer a reconciliation request within sync_timeout
/// the connection is dropped and retried. The full-state push the server
/// sends on every new connection does not count as that answer.
///
/// A send is only queued on the socket. Mutations whose frames were
/// still unwritten when the connection closes are handed back to the
/// agent's offline queue.
///
/// Not thread-safe: run the io_context on one thread and call every
/// member from it. The io_context must not run handlers after the
/// client is destroyed.
class TcpClient final : public Transport {
public:
    TcpClient(boost::asio::io_context& io, ClientAgent& agent, TcpClientOptions options = {});
    ~TcpClient() override;

    TcpClient(const TcpClient&) = delete;
    auto operator=(const TcpClient&) -> TcpClient& = delete;

    /// Begin connecting.
    void start();

    /// Close the connection and stop reconnecting.
    void stop();

    auto connected() const -> bool override { return connected_; }

    /// Queue a message on the socket. @return false when not connected.
    auto send(const ClientMessage& message) -> bool override;

    auto options() const -> const TcpClientOptions& { return options_; }

private:
    void do_connect();
    void on_connect(const boost::system::error_code& ec);
    void do_read();
    void do_write();
    void arm_sync_timer();
    void drop(const boost::system::error_code& ec);
    void drop(const Error& reason);
    void close_socket();
    void on_full_state();
    void schedule_reconnect();

    ClientAgent& agent_;
    TcpClientOptions options_;
    Backoff backoff_;

    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer retry_timer_;
    boost::asio::steady_timer sync_timer_;

    std::unique_ptr<wire::FrameReader> reader_;
    std::vector<std::byte> read_buffer_;

    struct Outgoing {
        std::vector<std::byte> frame;
        std::optional<Mutation> mutation;
    };
    std::deque<Outgoing> write_queue_;

    // Bumped on every new connection so late handlers of a dead one are ignored.
    std::uint64_t generation_{0};
    bool connected_{false};
    bool stopped_{true};
    // Per connection: the server's first sync-all-listings is its
    // greeting, later ones answer our sync-listings requests.
    bool awaiting_greeting_{false};
    std::size_t pending_syncs_{0};
};

}  // namespace listing_sync::net
