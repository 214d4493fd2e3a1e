/// @file listing_sync.hpp
/// @brief Umbrella header for the listing-sync library.
///
/// Include this single header for access to all public types:
/// Listing, Replica, OfflineQueue, ClientAgent, ServerCoordinator,
/// the loopback and TCP transports, configuration and Error.

#pragma once

#include <listing-sync/agent.hpp>
#include <listing-sync/backoff.hpp>
#include <listing-sync/channel.hpp>
#include <listing-sync/config.hpp>
#include <listing-sync/coordinator.hpp>
#include <listing-sync/error.hpp>
#include <listing-sync/json.hpp>
#include <listing-sync/listing.hpp>
#include <listing-sync/logging.hpp>
#include <listing-sync/loopback.hpp>
#include <listing-sync/messages.hpp>
#include <listing-sync/net/tcp_client.hpp>
#include <listing-sync/net/tcp_server.hpp>
#include <listing-sync/offline_queue.hpp>
#include <listing-sync/persistence.hpp>
#include <listing-sync/presence.hpp>
#include <listing-sync/replica.hpp>
#include <listing-sync/replica_store.hpp>
#include <listing-sync/types.hpp>
