#include <listing-sync/loopback.hpp>

#include <iterator>
#include <utility>

namespace listing_sync {

// -- LoopbackChannel ----------------------------------------------------------

auto LoopbackChannel::send(const ServerMessage& message) -> bool {
    auto lock = std::scoped_lock{mutex_};
    if (!open_) return false;
    inbox_.push_back(message);
    return true;
}

void LoopbackChannel::close() {
    auto lock = std::scoped_lock{mutex_};
    open_ = false;
    inbox_.clear();
}

auto LoopbackChannel::take() -> std::vector<ServerMessage> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<ServerMessage>(std::make_move_iterator(inbox_.begin()),
                                             std::make_move_iterator(inbox_.end()));
    inbox_.clear();
    return result;
}

// -- LoopbackClient -----------------------------------------------------------

LoopbackClient::LoopbackClient(ServerCoordinator& server, ClientAgent& agent, ChannelId id)
    : server_{server}, agent_{agent}, id_{id} {
    agent_.set_transport(this);
}

LoopbackClient::~LoopbackClient() {
    if (channel_) {
        channel_->close();
        server_.detach(id_);
    }
    agent_.set_transport(nullptr);
}

void LoopbackClient::connect() {
    if (channel_) return;
    agent_.on_connecting();
    channel_ = std::make_shared<LoopbackChannel>(id_);
    server_.attach(channel_);
    agent_.on_connected();
}

void LoopbackClient::disconnect() {
    if (!channel_) return;
    channel_->close();
    channel_.reset();
    server_.detach(id_);
    agent_.on_disconnected();
}

auto LoopbackClient::send(const ClientMessage& message) -> bool {
    if (!channel_ || send_failing_) return false;
    sent_.push_back(message);
    server_.handle(id_, message);
    return true;
}

auto LoopbackClient::poll() -> std::size_t {
    if (!channel_) return 0;
    auto messages = channel_->take();
    for (auto& message : messages) {
        agent_.receive(message);
        received_.push_back(std::move(message));
    }
    return messages.size();
}

void LoopbackClient::clear_history() {
    received_.clear();
    sent_.clear();
}

// -- LoopbackHub --------------------------------------------------------------

auto LoopbackHub::add_client(ClientAgent& agent) -> LoopbackClient& {
    clients_.push_back(std::make_unique<LoopbackClient>(server_, agent, next_id_++));
    return *clients_.back();
}

auto LoopbackHub::pump() -> std::size_t {
    auto total = std::size_t{0};
    for (auto delivered = std::size_t{1}; delivered > 0;) {
        delivered = 0;
        for (auto& client : clients_) delivered += client->poll();
        total += delivered;
    }
    return total;
}

}  // namespace listing_sync
