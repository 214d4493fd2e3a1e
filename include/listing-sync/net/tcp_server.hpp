/// @file tcp_server.hpp
/// @brief TCP front end for a ServerCoordinator, built on Boost.Asio.

#pragma once

#include <listing-sync/channel.hpp>
#include <listing-sync/coordinator.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace listing_sync::net {

namespace detail {
struct SessionRegistry;
}  // namespace detail

/// Where and how a TcpServer listens.
struct TcpServerOptions {
    std::string host{"0.0.0.0"};
    std::uint16_t port{3000};  ///< 0 picks an ephemeral port.
    std::size_t max_frame_bytes{default_max_frame_bytes};
    /// Outbound bytes a connection may have waiting to be written. A peer
    /// that stops reading is disconnected once it falls this far behind.
    std::size_t max_queued_bytes{4 * default_max_frame_bytes};
};

/// Accepts TCP connections and exposes each one to the coordinator as a
/// Channel.
///
/// Each connection runs on its own strand, so the io_context may be run
/// from any number of threads. Inbound frames are decoded and passed to
/// ServerCoordinator::handle(); a connection that sends a corrupt frame
/// is closed. Messages that decode to an unknown event are logged and
/// dropped. A connection whose unwritten output would exceed
/// max_queued_bytes is closed; a single frame on an idle connection is
/// always accepted.
///
/// The coordinator and the server must outlive every handler queued on
/// the io_context.
///
/// @code
/// auto io = boost::asio::io_context{};
/// auto server = net::TcpServer{io, coordinator, {.port = 3000}};
/// server.start();
/// io.run();
/// @endcode
class TcpServer {
public:
    TcpServer(boost::asio::io_context& io, ServerCoordinator& coordinator,
              TcpServerOptions options = {});
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    auto operator=(const TcpServer&) -> TcpServer& = delete;

    /// Bind, listen and begin accepting.
    /// @throws boost::system::system_error if the address cannot be bound.
    void start();

    /// Stop accepting and close every open connection. Thread-safe.
    void stop();

    /// The bound port (useful after binding port 0).
    auto port() const -> std::uint16_t { return bound_port_; }

    /// Connections currently open.
    auto session_count() const -> std::size_t;

private:
    void do_accept();

    boost::asio::io_context& io_;
    ServerCoordinator& coordinator_;
    TcpServerOptions options_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<detail::SessionRegistry> registry_;
    std::atomic<ChannelId> next_id_{1};
    std::uint16_t bound_port_{0};
};

}  // namespace listing_sync::net
