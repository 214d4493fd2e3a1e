/// @file json.hpp
/// @brief nlohmann/json encoding of listings, intents and channel messages.
///
/// Every channel message is a JSON object `{"event": <name>, "data": <payload>}`.
/// A listing is a JSON object with a string `id` plus any other fields.

#pragma once

#include <listing-sync/error.hpp>
#include <listing-sync/listing.hpp>
#include <listing-sync/messages.hpp>
#include <listing-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace listing_sync {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// from_json overloads throw std::runtime_error on malformed input.

void to_json(nlohmann::json& j, const Timestamp& t);
void from_json(const nlohmann::json& j, Timestamp& t);

void to_json(nlohmann::json& j, const Listing& listing);
void from_json(const nlohmann::json& j, Listing& listing);

void to_json(nlohmann::json& j, const Mutation& mutation);
void from_json(const nlohmann::json& j, Mutation& mutation);

void to_json(nlohmann::json& j, const MutationIntent& intent);
void from_json(const nlohmann::json& j, MutationIntent& intent);

// =============================================================================
// Channel messages
// =============================================================================

/// Encode a client message as `{"event", "data"}`.
auto encode(const ClientMessage& message) -> nlohmann::json;

/// Encode a server message as `{"event", "data"}`.
auto encode(const ServerMessage& message) -> nlohmann::json;

/// Decode a client message.
/// @throws std::runtime_error on an unknown event or malformed payload.
auto decode_client_message(const nlohmann::json& j) -> ClientMessage;

/// Decode a server message.
/// @throws std::runtime_error on an unknown event or malformed payload.
auto decode_server_message(const nlohmann::json& j) -> ServerMessage;

/// Decode a client message without throwing.
/// @return The message, or a decoding_error describing why it was rejected.
auto try_decode_client_message(const nlohmann::json& j) -> std::variant<ClientMessage, Error>;

/// Decode a server message without throwing.
/// @return The message, or a decoding_error describing why it was rejected.
auto try_decode_server_message(const nlohmann::json& j) -> std::variant<ServerMessage, Error>;

/// Decode a JSON array of listings, skipping entries that are not
/// objects with a non-empty string id.
auto decode_listings_lenient(const nlohmann::json& j) -> std::vector<Listing>;

}  // namespace listing_sync
