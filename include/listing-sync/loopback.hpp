/// @file loopback.hpp
/// @brief In-process transport connecting ClientAgents to a ServerCoordinator.
///
/// Messages from a client reach the coordinator synchronously. Messages
/// from the server are queued per client and delivered when the hub is
/// pumped, which lets tests and demos interleave events deterministically.

#pragma once

#include <listing-sync/agent.hpp>
#include <listing-sync/channel.hpp>
#include <listing-sync/coordinator.hpp>
#include <listing-sync/messages.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace listing_sync {

/// Server end of a loopback connection: queues outbound messages.
class LoopbackChannel final : public Channel {
public:
    explicit LoopbackChannel(ChannelId id) : id_{id} {}

    auto id() const -> ChannelId override { return id_; }
    auto send(const ServerMessage& message) -> bool override;

    /// Stop accepting messages; queued ones are discarded.
    void close();

    /// Remove and return everything queued so far.
    auto take() -> std::vector<ServerMessage>;

private:
    ChannelId id_;
    std::mutex mutex_;
    std::deque<ServerMessage> inbox_;
    bool open_{true};
};

/// Client end of a loopback connection, driving one ClientAgent.
class LoopbackClient final : public Transport {
public:
    LoopbackClient(ServerCoordinator& server, ClientAgent& agent, ChannelId id);
    ~LoopbackClient() override;

    LoopbackClient(const LoopbackClient&) = delete;
    auto operator=(const LoopbackClient&) -> LoopbackClient& = delete;

    /// Open a fresh channel to the server and run the agent's connect sequence.
    void connect();

    /// Close the channel; undelivered server messages are lost.
    void disconnect();

    /// Make sends fail while still reporting the connection as up.
    void set_send_failing(bool failing) { send_failing_ = failing; }

    auto connected() const -> bool override { return channel_ != nullptr; }
    auto send(const ClientMessage& message) -> bool override;

    /// Deliver every queued server message to the agent.
    /// @return The number delivered.
    auto poll() -> std::size_t;

    /// Every server message delivered so far, in order.
    auto received() const -> const std::vector<ServerMessage>& { return received_; }

    /// Every client message the server accepted, in order.
    auto sent() const -> const std::vector<ClientMessage>& { return sent_; }

    void clear_history();

    auto agent() -> ClientAgent& { return agent_; }
    auto id() const -> ChannelId { return id_; }

private:
    ServerCoordinator& server_;
    ClientAgent& agent_;
    ChannelId id_;
    std::shared_ptr<LoopbackChannel> channel_;
    std::vector<ServerMessage> received_;
    std::vector<ClientMessage> sent_;
    bool send_failing_{false};
};

/// Owns a set of LoopbackClients attached to one coordinator.
class LoopbackHub {
public:
    explicit LoopbackHub(ServerCoordinator& server) : server_{server} {}

    /// Create a (disconnected) client for the agent. The hub owns it.
    auto add_client(ClientAgent& agent) -> LoopbackClient&;

    /// Poll every client until no messages remain.
    /// @return The total number delivered.
    auto pump() -> std::size_t;

private:
    ServerCoordinator& server_;
    std::vector<std::unique_ptr<LoopbackClient>> clients_;
    ChannelId next_id_{1};
};

}  // namespace listing_sync
