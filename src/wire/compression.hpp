#pragma once

// Raw DEFLATE (no zlib/gzip header) for large frame bodies, plus the
// CRC-32 used as the frame checksum. Full-state pushes carry every
// listing, media references included, so they are worth compressing.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace listing_sync::wire {

// Bodies smaller than this are sent uncompressed.
inline constexpr std::size_t deflate_threshold = 1024;

// Hard cap on an inflated body, against decompression bombs.
inline constexpr std::size_t max_inflated_size = std::size_t{64} * 1024 * 1024;

inline auto crc32_of(std::span<const std::byte> data) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

inline auto deflate_body(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 selects raw deflate
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

inline auto inflate_body(std::span<const std::byte> input,
                         std::size_t max_output_size = max_inflated_size)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto output = std::vector<std::byte>(std::min(input.size() * 4, max_output_size));

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    auto ret = ::inflate(&stream, Z_FINISH);
    while ((ret == Z_BUF_ERROR || ret == Z_OK) && stream.avail_out == 0 &&
           output.size() < max_output_size) {
        auto written = stream.total_out;
        output.resize(std::min(output.size() * 2, max_output_size));
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output.size() - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

}  // namespace listing_sync::wire
