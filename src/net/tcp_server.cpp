#include <listing-sync/net/tcp_server.hpp>
#include <listing-sync/json.hpp>

#include "../wire/frame.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace listing_sync::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
class TcpSession;
}  // anonymous namespace

namespace detail {

struct SessionRegistry {
    std::mutex mutex;
    std::map<ChannelId, std::weak_ptr<TcpSession>> sessions;
};

}  // namespace detail

namespace {

// One accepted connection. Its socket's executor is a strand, and every
// socket operation runs on it.
class TcpSession final : public Channel, public std::enable_shared_from_this<TcpSession> {
public:
    TcpSession(tcp::socket socket, ChannelId id, ServerCoordinator& coordinator,
               const TcpServerOptions& options, std::shared_ptr<detail::SessionRegistry> registry)
        : socket_{std::move(socket)},
          id_{id},
          coordinator_{coordinator},
          reader_{options.max_frame_bytes},
          max_queued_bytes_{options.max_queued_bytes},
          registry_{std::move(registry)} {}

    auto id() const -> ChannelId override { return id_; }

    void start() {
        {
            auto lock = std::scoped_lock{registry_->mutex};
            registry_->sessions.emplace(id_, weak_from_this());
        }
        asio::dispatch(socket_.get_executor(), [self = shared_from_this()] {
            self->coordinator_.attach(self);
            self->do_read();
        });
    }

    auto send(const ServerMessage& message) -> bool override {
        if (closed_) return false;

        // Encode on the caller's thread; only the queueing is serialized.
        auto frame = wire::encode_frame(encode(message));
        asio::post(socket_.get_executor(),
                   [self = shared_from_this(), frame = std::move(frame)]() mutable {
            if (self->closed_) return;
            if (!self->write_queue_.empty() &&
                self->queued_bytes_ + frame.size() > self->max_queued_bytes_) {
                spdlog::warn("Channel {} is not reading ({} bytes unwritten); closing",
                             self->id_, self->queued_bytes_);
                self->close();
                return;
            }
            self->queued_bytes_ += frame.size();
            self->write_queue_.push_back(std::move(frame));
            if (self->write_queue_.size() == 1) self->do_write();
        });
        return true;
    }

    void shutdown() {
        asio::post(socket_.get_executor(), [self = shared_from_this()] { self->close(); });
    }

private:
    void do_read() {
        socket_.async_read_some(asio::buffer(buffer_),
                                [self = shared_from_this()](const boost::system::error_code& ec,
                                                            std::size_t n) {
            self->on_read(ec, n);
        });
    }

    void on_read(const boost::system::error_code& ec, std::size_t n) {
        if (ec) {
            if (ec == asio::error::eof || ec == asio::error::operation_aborted) {
                spdlog::debug("Channel {} closed by peer", id_);
            } else {
                spdlog::warn("Channel {} read failed: {}", id_, ec.message());
            }
            close();
            return;
        }

        reader_.append(std::span<const std::byte>{buffer_.data(), n});
        try {
            while (auto document = reader_.next()) {
                auto decoded = try_decode_client_message(*document);
                if (auto* error = std::get_if<Error>(&decoded)) {
                    spdlog::warn("Channel {} sent an undecodable message: {}", id_, error->message);
                    continue;
                }
                if (auto rejected = coordinator_.handle(id_, std::get<ClientMessage>(decoded))) {
                    spdlog::debug("Channel {} event not applied cleanly: {}", id_,
                                  rejected->message);
                }
            }
        } catch (const std::runtime_error& e) {
            spdlog::warn("Channel {} sent a corrupt frame: {}", id_, e.what());
            close();
            return;
        }

        if (!closed_) do_read();
    }

    void do_write() {
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [self = shared_from_this()](const boost::system::error_code& ec,
                                                      std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::warn("Channel {} write failed: {}", self->id_, ec.message());
                }
                self->close();
                return;
            }
            if (self->closed_) return;
            self->queued_bytes_ -= self->write_queue_.front().size();
            self->write_queue_.pop_front();
            if (!self->write_queue_.empty()) self->do_write();
        });
    }

    void close() {
        if (closed_.exchange(true)) return;

        auto ignored = boost::system::error_code{};
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        write_queue_.clear();
        queued_bytes_ = 0;

        coordinator_.detach(id_);
        auto lock = std::scoped_lock{registry_->mutex};
        registry_->sessions.erase(id_);
    }

    tcp::socket socket_;
    ChannelId id_;
    ServerCoordinator& coordinator_;
    wire::FrameReader reader_;
    std::size_t max_queued_bytes_;
    std::shared_ptr<detail::SessionRegistry> registry_;
    std::array<std::byte, 16 * 1024> buffer_{};
    // Strand-only.
    std::deque<std::vector<std::byte>> write_queue_;
    std::size_t queued_bytes_{0};
    std::atomic<bool> closed_{false};
};

}  // anonymous namespace

// -- TcpServer ----------------------------------------------------------------

TcpServer::TcpServer(asio::io_context& io, ServerCoordinator& coordinator, TcpServerOptions options)
    : io_{io},
      coordinator_{coordinator},
      options_{std::move(options)},
      strand_{asio::make_strand(io)},
      acceptor_{strand_},
      registry_{std::make_shared<detail::SessionRegistry>()} {}

TcpServer::~TcpServer() = default;

void TcpServer::start() {
    auto endpoint = tcp::endpoint{asio::ip::make_address(options_.host), options_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();

    spdlog::info("Listening on {}:{}", options_.host, bound_port_);
    asio::dispatch(strand_, [this] { do_accept(); });
}

void TcpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_),
                           [this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted) return;
            spdlog::warn("Accept failed: {}", ec.message());
        } else {
            auto id = next_id_.fetch_add(1);
            auto peer_ec = boost::system::error_code{};
            auto peer = socket.remote_endpoint(peer_ec);
            spdlog::debug("Accepted connection {} from {}", id,
                          peer_ec ? std::string{"unknown peer"} : peer.address().to_string());
            std::make_shared<TcpSession>(std::move(socket), id, coordinator_, options_,
                                         registry_)
                ->start();
        }
        if (acceptor_.is_open()) do_accept();
    });
}

void TcpServer::stop() {
    asio::dispatch(strand_, [this] {
        if (!acceptor_.is_open()) return;
        auto ignored = boost::system::error_code{};
        acceptor_.close(ignored);
        spdlog::info("Stopped listening on port {}", bound_port_);
    });

    auto sessions = std::vector<std::shared_ptr<TcpSession>>{};
    {
        auto lock = std::scoped_lock{registry_->mutex};
        for (const auto& [id, weak] : registry_->sessions) {
            if (auto session = weak.lock()) sessions.push_back(std::move(session));
        }
    }
    for (const auto& session : sessions) session->shutdown();
}

auto TcpServer::session_count() const -> std::size_t {
    auto lock = std::scoped_lock{registry_->mutex};
    return registry_->sessions.size();
}

}  // namespace listing_sync::net
