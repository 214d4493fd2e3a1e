#include <listing-sync/net/tcp_client.hpp>
#include <listing-sync/json.hpp>

#include "../wire/frame.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace listing_sync::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr std::size_t read_chunk = 16 * 1024;

}  // anonymous namespace

TcpClient::TcpClient(asio::io_context& io, ClientAgent& agent, TcpClientOptions options)
    : agent_{agent},
      options_{std::move(options)},
      backoff_{options_.backoff},
      resolver_{io},
      socket_{io},
      retry_timer_{io},
      sync_timer_{io},
      reader_{std::make_unique<wire::FrameReader>(options_.max_frame_bytes)},
      read_buffer_(read_chunk) {
    agent_.set_transport(this);
}

TcpClient::~TcpClient() {
    stop();
    agent_.set_transport(nullptr);
}

void TcpClient::start() {
    if (!stopped_) return;
    stopped_ = false;
    do_connect();
}

void TcpClient::stop() {
    if (stopped_) return;
    stopped_ = true;
    retry_timer_.cancel();
    resolver_.cancel();

    close_socket();
    agent_.on_disconnected();
}

// -- Connecting ---------------------------------------------------------------

void TcpClient::do_connect() {
    agent_.on_connecting();
    spdlog::debug("Connecting to {}:{}", options_.host, options_.port);

    const auto generation = ++generation_;
    resolver_.async_resolve(options_.host, std::to_string(options_.port),
                            [this, generation](const boost::system::error_code& ec,
                                               const tcp::resolver::results_type& endpoints) {
        if (generation != generation_ || stopped_) return;
        if (ec) {
            on_connect(ec);
            return;
        }
        asio::async_connect(socket_, endpoints,
                            [this, generation](const boost::system::error_code& ec,
                                               const tcp::endpoint&) {
            if (generation != generation_ || stopped_) return;
            on_connect(ec);
        });
    });
}

void TcpClient::on_connect(const boost::system::error_code& ec) {
    if (ec) {
        spdlog::warn("Connection to {}:{} failed: {}", options_.host, options_.port, ec.message());
        agent_.on_error(Error{ErrorKind::transport_error, ec.message()});
        schedule_reconnect();
        return;
    }

    auto ignored = boost::system::error_code{};
    socket_.set_option(tcp::no_delay(true), ignored);

    connected_ = true;
    awaiting_greeting_ = true;
    pending_syncs_ = 0;
    backoff_.reset();
    reader_ = std::make_unique<wire::FrameReader>(options_.max_frame_bytes);
    do_read();

    // Sends the reconciliation request and drains the offline queue
    // through send().
    agent_.on_connected();
}

void TcpClient::schedule_reconnect() {
    if (stopped_) return;
    const auto delay = backoff_.next_delay();
    spdlog::info("Reconnecting in {} ms (attempt {})", delay.count(), backoff_.attempts());

    retry_timer_.expires_after(delay);
    retry_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopped_) return;
        do_connect();
    });
}

// -- Reading ------------------------------------------------------------------

void TcpClient::do_read() {
    const auto generation = generation_;
    socket_.async_read_some(asio::buffer(read_buffer_),
                            [this, generation](const boost::system::error_code& ec, std::size_t n) {
        if (generation != generation_ || !connected_) return;
        if (ec) {
            drop(ec);
            return;
        }

        reader_->append(std::span<const std::byte>{read_buffer_.data(), n});
        try {
            while (auto document = reader_->next()) {
                auto decoded = try_decode_server_message(*document);
                if (auto* error = std::get_if<Error>(&decoded)) {
                    spdlog::warn("Ignoring undecodable server message: {}", error->message);
                    continue;
                }
                auto& message = std::get<ServerMessage>(decoded);
                if (std::holds_alternative<SyncAllListings>(message)) on_full_state();
                agent_.receive(message);
            }
        } catch (const std::runtime_error& e) {
            drop(Error{ErrorKind::decoding_error, e.what()});
            return;
        }

        // A handler above may have dropped the connection.
        if (generation == generation_ && connected_) do_read();
    });
}

// -- Writing ------------------------------------------------------------------

auto TcpClient::send(const ClientMessage& message) -> bool {
    if (!connected_) return false;

    write_queue_.push_back(Outgoing{wire::encode_frame(encode(message)), to_mutation(message)});
    if (write_queue_.size() == 1) do_write();
    if (std::holds_alternative<SyncListings>(message)) {
        ++pending_syncs_;
        arm_sync_timer();
    }
    return true;
}

void TcpClient::do_write() {
    const auto generation = generation_;
    asio::async_write(socket_, asio::buffer(write_queue_.front().frame),
                      [this, generation](const boost::system::error_code& ec, std::size_t) {
        if (generation != generation_ || !connected_) return;
        if (ec) {
            drop(ec);
            return;
        }
        write_queue_.pop_front();
        if (!write_queue_.empty()) do_write();
    });
}

void TcpClient::arm_sync_timer() {
    const auto generation = generation_;
    sync_timer_.expires_after(options_.sync_timeout);
    sync_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != generation_ || !connected_) return;
        spdlog::warn("No sync-all-listings within {} ms", options_.sync_timeout.count());
        drop(Error{ErrorKind::transport_error, "timed out waiting for sync-all-listings"});
    });
}

void TcpClient::on_full_state() {
    if (awaiting_greeting_) {
        awaiting_greeting_ = false;
        return;
    }
    // Any later full state shows the server is processing our requests;
    // the timer stops once every outstanding request has been covered.
    if (pending_syncs_ == 0) return;
    if (--pending_syncs_ == 0) sync_timer_.cancel();
}

// -- Disconnecting ------------------------------------------------------------

void TcpClient::drop(const boost::system::error_code& ec) {
    if (ec == asio::error::eof) {
        spdlog::warn("Server closed the connection");
        close_socket();
        agent_.on_disconnected();
        schedule_reconnect();
        return;
    }
    drop(Error{ErrorKind::transport_error, ec.message()});
}

void TcpClient::drop(const Error& reason) {
    close_socket();
    agent_.on_error(reason);
    schedule_reconnect();
}

void TcpClient::close_socket() {
    ++generation_;
    connected_ = false;
    awaiting_greeting_ = false;
    pending_syncs_ = 0;
    sync_timer_.cancel();

    // The front frame may be partly written; it goes back too, so a
    // mutation is delivered at least once.
    auto unwritten = std::vector<Mutation>{};
    for (auto& outgoing : write_queue_) {
        if (outgoing.mutation) unwritten.push_back(std::move(*outgoing.mutation));
    }
    write_queue_.clear();

    auto ignored = boost::system::error_code{};
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    agent_.requeue(std::move(unwritten));
}

}  // namespace listing_sync::net
