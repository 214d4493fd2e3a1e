#include "../src/wire/compression.hpp"
#include "../src/wire/frame.hpp"

#include <listing-sync/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using namespace listing_sync;
using namespace listing_sync::wire;
using json = nlohmann::json;

namespace {

auto as_bytes(const std::string& text) -> std::vector<std::byte> {
    auto bytes = std::vector<std::byte>(text.size());
    std::memcpy(bytes.data(), text.data(), text.size());
    return bytes;
}

auto big_message(std::size_t listings) -> json {
    auto all = std::vector<Listing>{};
    for (std::size_t i = 0; i < listings; ++i) {
        all.push_back(Listing{"id-" + std::to_string(i),
                              {{"title", "A repeated title that compresses well"}}});
    }
    return encode(ServerMessage{SyncAllListings{all}});
}

}  // anonymous namespace

// -- Compression --------------------------------------------------------------

TEST(Compression, crc32_known_value) {
    // CRC-32 of "123456789" is the standard check value 0xCBF43926.
    EXPECT_EQ(crc32_of(as_bytes("123456789")), 0xCBF43926u);
}

TEST(Compression, deflate_inflate_restores_input) {
    const auto input = as_bytes(std::string(4096, 'a') + "tail");
    const auto packed = deflate_body(input);
    ASSERT_TRUE(packed.has_value());
    EXPECT_LT(packed->size(), input.size());

    const auto unpacked = inflate_body(*packed);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(*unpacked, input);
}

TEST(Compression, inflate_respects_size_cap) {
    const auto input = as_bytes(std::string(100000, 'z'));
    const auto packed = deflate_body(input);
    ASSERT_TRUE(packed.has_value());
    EXPECT_FALSE(inflate_body(*packed, 1000).has_value());
}

TEST(Compression, inflate_rejects_garbage) {
    EXPECT_FALSE(inflate_body(as_bytes("definitely not deflate data")).has_value());
}

// -- Frame layout -------------------------------------------------------------

TEST(Frame, small_message_is_plain_json) {
    const auto message = json{{"event", "users-count"}, {"data", 2}};
    const auto frame = encode_frame(message);

    ASSERT_GE(frame.size(), 10u);
    EXPECT_EQ(frame[0], std::byte{0x4C});
    EXPECT_EQ(frame[1], std::byte{0x53});
    EXPECT_EQ(frame[2], std::byte{0x59});
    EXPECT_EQ(frame[3], std::byte{0x4E});
    EXPECT_EQ(frame[8], static_cast<std::byte>(FrameType::json));

    const auto body = message.dump();
    EXPECT_EQ(frame[9], static_cast<std::byte>(body.size()));

    // Checksum is big-endian CRC-32 of the body.
    const auto crc = crc32_of(as_bytes(body));
    EXPECT_EQ(frame[4], static_cast<std::byte>(crc >> 24));
    EXPECT_EQ(frame[7], static_cast<std::byte>(crc & 0xFF));
}

TEST(Frame, large_message_is_deflated_and_decodes) {
    const auto message = big_message(200);
    const auto frame = encode_frame(message);
    EXPECT_EQ(frame[8], static_cast<std::byte>(FrameType::deflated_json));
    EXPECT_LT(frame.size(), message.dump().size());

    auto reader = FrameReader{};
    reader.append(frame);
    auto decoded = reader.next();
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, message);
}

// -- FrameReader --------------------------------------------------------------

TEST(FrameReader, yields_messages_fed_byte_by_byte) {
    const auto first = json{{"event", "listing-deleted"}, {"data", "a"}};
    const auto second = big_message(50);
    auto stream = encode_frame(first);
    const auto tail = encode_frame(second);
    stream.insert(stream.end(), tail.begin(), tail.end());

    auto reader = FrameReader{};
    auto decoded = std::vector<json>{};
    for (auto byte : stream) {
        reader.append(std::span<const std::byte>{&byte, 1});
        while (auto message = reader.next()) decoded.push_back(*message);
    }

    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded[0], first);
    EXPECT_EQ(decoded[1], second);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST(FrameReader, incomplete_frame_waits) {
    auto frame = encode_frame(json{{"event", "users-count"}, {"data", 1}});
    frame.pop_back();

    auto reader = FrameReader{};
    reader.append(frame);
    EXPECT_FALSE(reader.next().has_value());
}

TEST(FrameReader, bad_magic_throws) {
    auto frame = encode_frame(json{{"event", "users-count"}, {"data", 1}});
    frame[0] = std::byte{'X'};

    auto reader = FrameReader{};
    reader.append(frame);
    EXPECT_THROW(reader.next(), std::runtime_error);
}

TEST(FrameReader, corrupted_body_fails_checksum) {
    auto frame = encode_frame(json{{"event", "users-count"}, {"data", 1}});
    frame.back() = std::byte{'!'};

    auto reader = FrameReader{};
    reader.append(frame);
    EXPECT_THROW(reader.next(), std::runtime_error);
}

TEST(FrameReader, oversized_body_is_rejected_before_it_arrives) {
    const auto frame = encode_frame(json{{"event", "sync-all-listings"}, {"data", std::string(500, 'x')}});

    auto reader = FrameReader{100};
    reader.append(std::span<const std::byte>{frame}.first(12));
    EXPECT_THROW(reader.next(), std::runtime_error);
}

TEST(FrameReader, unknown_frame_type_throws) {
    auto frame = encode_frame(json{{"event", "users-count"}, {"data", 1}});
    frame[8] = std::byte{0x07};

    auto reader = FrameReader{};
    reader.append(frame);
    EXPECT_THROW(reader.next(), std::runtime_error);
}

TEST(FrameReader, non_json_body_throws) {
    const auto body = as_bytes("{not json");
    auto frame = std::vector<std::byte>{};
    write_frame(FrameType::json, body, frame);

    auto reader = FrameReader{};
    reader.append(frame);
    EXPECT_THROW(reader.next(), std::runtime_error);
}
