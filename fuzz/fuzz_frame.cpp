// Fuzz target for the TCP frame reader: exercises header parsing,
// checksum verification, DEFLATE bodies and partial input.

#include "wire/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto bytes = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    // Small cap so oversized length prefixes are rejected quickly.
    auto reader = listing_sync::wire::FrameReader{1 << 20};

    // Feed in two pieces to exercise resumption after need_more.
    const auto half = size / 2;
    try {
        reader.append(bytes.first(half));
        while (reader.next()) {}
        reader.append(bytes.subspan(half));
        while (reader.next()) {}
    } catch (const std::runtime_error&) {
        // Corrupt streams are expected to be rejected.
    }
    return 0;
}
