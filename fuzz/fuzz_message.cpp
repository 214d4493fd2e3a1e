// Fuzz target for the JSON message codec: arbitrary JSON must either
// decode or be reported as a decoding_error, never crash.

#include <listing-sync/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <variant>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto* first = reinterpret_cast<const char*>(data);
    auto document = nlohmann::json::parse(first, first + size, nullptr, false);
    if (document.is_discarded()) return 0;

    auto client = listing_sync::try_decode_client_message(document);
    if (auto* message = std::get_if<listing_sync::ClientMessage>(&client)) {
        (void)listing_sync::encode(*message);
    }

    auto server = listing_sync::try_decode_server_message(document);
    if (auto* message = std::get_if<listing_sync::ServerMessage>(&server)) {
        (void)listing_sync::encode(*message);
    }
    return 0;
}
