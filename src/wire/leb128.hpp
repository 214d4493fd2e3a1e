#pragma once

// Unsigned LEB128 (Little Endian Base 128) variable-length integers.
// Used for the body length in every wire frame.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace listing_sync::wire {

// Longest encoding of a uint64 (ceil(64 / 7)).
inline constexpr std::size_t max_uleb128_bytes = 10;

// Encode a uint64 as unsigned LEB128, appending bytes to output.
inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) {
            byte |= std::byte{0x80};  // more bytes follow
        }
        output.push_back(byte);
    } while (value != 0);
}

// Decoded value plus the number of bytes it occupied.
struct Uleb128 {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Outcome of decoding from a buffer that may still be filling up.
enum class DecodeStatus : std::uint8_t {
    ok,
    need_more,  // no terminating byte yet
    invalid,    // longer than any uint64 encoding
};

// Decode an unsigned LEB128 prefix of `input`.
inline auto decode_uleb128(std::span<const std::byte> input, Uleb128& out) -> DecodeStatus {
    auto value = std::uint64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (i == max_uleb128_bytes) return DecodeStatus::invalid;

        auto byte = input[i];
        const auto payload = static_cast<std::uint64_t>(byte) & 0x7F;
        // The tenth byte may only carry the single remaining bit.
        if (shift == 63 && payload > 1) return DecodeStatus::invalid;
        value |= payload << shift;
        shift += 7;

        if ((byte & std::byte{0x80}) == std::byte{0}) {
            out = Uleb128{.value = value, .bytes_read = i + 1};
            return DecodeStatus::ok;
        }
    }

    return input.size() >= max_uleb128_bytes ? DecodeStatus::invalid : DecodeStatus::need_more;
}

}  // namespace listing_sync::wire
