#pragma once

// Wire frame for the TCP sync channel.
//
// A frame carries one JSON-encoded channel message:
//   magic (4 bytes: 0x4C 0x53 0x59 0x4E, "LSYN")
//   checksum (4 bytes, big-endian CRC-32 of body)
//   frame_type (1 byte)
//   body_length (ULEB128)
//   body (body_length bytes; UTF-8 JSON, raw-DEFLATEd for deflated_json)
//
// Internal header, not installed.

#include "compression.hpp"
#include "leb128.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace listing_sync::wire {

inline constexpr std::array<std::byte, 4> frame_magic = {
    std::byte{0x4C}, std::byte{0x53}, std::byte{0x59}, std::byte{0x4E}
};

// Default cap on a frame body, compressed or not.
inline constexpr std::size_t default_max_body = std::size_t{64} * 1024 * 1024;

enum class FrameType : std::uint8_t {
    json          = 0x00,
    deflated_json = 0x01,
};

struct FrameHeader {
    FrameType type;
    std::uint32_t checksum;
    std::size_t body_offset;  // offset from the frame start to the body
    std::size_t body_length;
};

// Parse a frame header from the front of `data`.
// need_more: the header is incomplete. invalid: the stream is corrupt.
inline auto parse_frame_header(std::span<const std::byte> data, FrameHeader& out,
                               std::size_t max_body = default_max_body) -> DecodeStatus {
    const auto have = std::min(data.size(), frame_magic.size());
    if (have == 0) return DecodeStatus::need_more;
    if (std::memcmp(data.data(), frame_magic.data(), have) != 0) return DecodeStatus::invalid;
    if (data.size() < 9) return DecodeStatus::need_more;

    auto checksum = std::uint32_t{0};
    for (std::size_t i = 4; i < 8; ++i) {
        checksum = (checksum << 8) | static_cast<std::uint32_t>(data[i]);
    }

    const auto type = static_cast<std::uint8_t>(data[8]);
    if (type > static_cast<std::uint8_t>(FrameType::deflated_json)) return DecodeStatus::invalid;

    auto length = Uleb128{};
    auto status = decode_uleb128(data.subspan(9), length);
    if (status != DecodeStatus::ok) return status;
    if (length.value > max_body) return DecodeStatus::invalid;

    out = FrameHeader{
        .type = static_cast<FrameType>(type),
        .checksum = checksum,
        .body_offset = 9 + length.bytes_read,
        .body_length = static_cast<std::size_t>(length.value),
    };
    return DecodeStatus::ok;
}

inline void write_frame(FrameType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    output.insert(output.end(), frame_magic.begin(), frame_magic.end());

    const auto checksum = crc32_of(body);
    for (int shift = 24; shift >= 0; shift -= 8) {
        output.push_back(static_cast<std::byte>((checksum >> shift) & 0xFF));
    }

    output.push_back(static_cast<std::byte>(type));
    encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

// Serialize a message into one frame, deflating bodies at or above the
// threshold when that makes them smaller.
inline auto encode_frame(const nlohmann::json& message) -> std::vector<std::byte> {
    const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto plain = std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(text.data()), text.size()};

    auto output = std::vector<std::byte>{};
    output.reserve(text.size() + 16);

    if (plain.size() >= deflate_threshold) {
        if (auto packed = deflate_body(plain); packed && packed->size() < plain.size()) {
            write_frame(FrameType::deflated_json, *packed, output);
            return output;
        }
    }
    write_frame(FrameType::json, plain, output);
    return output;
}

// Verify and decode the body of a complete frame.
// @throws std::runtime_error on a checksum mismatch, bad DEFLATE data or bad JSON.
inline auto decode_frame_body(const FrameHeader& header, std::span<const std::byte> frame)
    -> nlohmann::json {
    const auto body = frame.subspan(header.body_offset, header.body_length);
    if (crc32_of(body) != header.checksum) {
        throw std::runtime_error{"frame checksum mismatch"};
    }

    auto inflated = std::optional<std::vector<std::byte>>{};
    auto text = body;
    if (header.type == FrameType::deflated_json) {
        inflated = inflate_body(body);
        if (!inflated) throw std::runtime_error{"frame body failed to inflate"};
        text = *inflated;
    }

    const auto* first = reinterpret_cast<const char*>(text.data());
    auto document = nlohmann::json::parse(first, first + text.size(), nullptr, false);
    if (document.is_discarded()) throw std::runtime_error{"frame body is not valid JSON"};
    return document;
}

// Accumulates bytes from a stream and yields complete decoded messages.
class FrameReader {
public:
    explicit FrameReader(std::size_t max_body = default_max_body) : max_body_{max_body} {}

    void append(std::span<const std::byte> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    // The next complete message, or nullopt if more bytes are needed.
    // @throws std::runtime_error if the stream is corrupt.
    auto next() -> std::optional<nlohmann::json> {
        auto header = FrameHeader{};
        auto status = parse_frame_header(buffer_, header, max_body_);
        if (status == DecodeStatus::invalid) throw std::runtime_error{"invalid frame header"};
        if (status == DecodeStatus::need_more) return std::nullopt;

        const auto frame_size = header.body_offset + header.body_length;
        if (buffer_.size() < frame_size) return std::nullopt;

        auto message = decode_frame_body(header, std::span<const std::byte>{buffer_}.first(frame_size));
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_size));
        return message;
    }

    auto buffered() const -> std::size_t { return buffer_.size(); }

private:
    std::size_t max_body_;
    std::vector<std::byte> buffer_;
};

}  // namespace listing_sync::wire
