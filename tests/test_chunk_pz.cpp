#include <gtest/gtest.h>
#include <cstddef>
#include <random>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "../canvaschunk/include/canvaschunk/chunks/chunk_pz.hpp"
#include "../canvaschunk/include/canvaschunk/compressors/compressor_lz4.hpp"
#include "../canvaschunk/include/canvaschunk/compressors/compressor_lzstring.hpp"
#include "../canvaschunk/include/canvaschunk/decoders/json_byte_list.hpp"
#include "../canvaschunk/include/canvaschunk/palettes.hpp"

using namespace canvaschunk;

// ============================================================================
// Helper Functions
// ============================================================================

/// Packed 4-bit chunk content with a few painted regions
std::vector<std::byte> generate_raw_chunk(uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> nibble(0, 15);
    std::vector<std::byte> raw(ChunkPz::raw_size, std::byte{0x33});
    for (std::size_t i = 0; i < raw.size(); i += 97) {
        raw[i] = static_cast<std::byte>((nibble(rng) << 4) | nibble(rng));
    }
    return raw;
}

std::string lzstring_text(std::string_view plain) {
    const LZStringCompressor compressor{};
    auto text = compressor.compress_to_base64(plain);
    EXPECT_TRUE(text.is_ok());
    return text.is_ok() ? text.value() : std::string{};
}

/// Message text wrapping an arbitrary buffer in the two outer stages
std::string wrap_frame_bytes(std::span<const std::byte> frame) {
    auto list = format_json_byte_list(frame);
    EXPECT_TRUE(list.is_ok());
    return lzstring_text(list.is_ok() ? list.value() : std::string{});
}

std::vector<std::byte> as_bytes(const std::string& text) {
    std::vector<std::byte> bytes(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        bytes[i] = static_cast<std::byte>(text[i]);
    }
    return bytes;
}

// ============================================================================
// Request descriptors
// ============================================================================

TEST(ChunkPz, SocketMessage) {
    auto request = ChunkPz(3, 11).request_descriptor();
    ASSERT_TRUE(request.is_ok());
    ASSERT_TRUE(std::holds_alternative<SocketMessage>(request.value()));
    EXPECT_EQ(request_target(request.value()), "42[\"r\", {\"cx\": 3, \"cy\": 11}]");
}

TEST(ChunkPz, OutOfBoundsRequestFails) {
    auto request = ChunkPz(16, 0).request_descriptor();
    ASSERT_TRUE(request.is_error());
    EXPECT_EQ(request.error().code, Error::Code::OutOfBounds);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(ChunkPz, EncodeDecodeIsBitExact) {
    const auto raw = generate_raw_chunk(42);
    auto text = ChunkPz::encode(raw);
    ASSERT_TRUE(text.is_ok()) << text.error().message;

    auto tile = ChunkPz::decode(text.value(), palettes::pixelzone, PixelOrigin{-4096, -4096});
    ASSERT_TRUE(tile.is_ok()) << tile.error().message;
    const RasterTile& t = tile.value();

    EXPECT_EQ(t.width(), 512u);
    EXPECT_EQ(t.height(), 512u);
    EXPECT_EQ(t.mode(), ColorMode::Indexed8);
    EXPECT_EQ(t.palette(), &palettes::pixelzone);

    const auto indices = t.pixels();
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const auto packed = static_cast<uint8_t>(raw[i]);
        ASSERT_EQ(indices[2 * i], packed >> 4) << i;
        ASSERT_EQ(indices[2 * i + 1], packed & 0x0F) << i;
    }
}

TEST(ChunkPz, LoadFromMessageBytes) {
    auto text = ChunkPz::encode(generate_raw_chunk(1));
    ASSERT_TRUE(text.is_ok());

    ChunkPz chunk(2, 5);
    ASSERT_TRUE(chunk.load(as_bytes(text.value())).is_ok());
    ASSERT_TRUE(chunk.is_loaded());
    EXPECT_EQ(chunk.raster()->origin(), (PixelOrigin{-3072, -1536}));
    EXPECT_EQ(chunk.raster()->palette(), &palettes::pixelzone);
}

TEST(ChunkPz, LoadWithOtherPalette) {
    const Palette custom{{{1, 2, 3}}, Palette::Fill::Repeat};
    auto text = ChunkPz::encode(generate_raw_chunk(2));
    ASSERT_TRUE(text.is_ok());

    ChunkPz chunk(0, 0);
    ASSERT_TRUE(chunk.load_text(text.value(), custom).is_ok());
    auto rgb = chunk.raster()->rgb_at(100, 100);
    ASSERT_TRUE(rgb.is_ok());
    EXPECT_EQ(rgb.value(), (Rgb{1, 2, 3}));
}

TEST(ChunkPz, EncodeRejectsWrongSize) {
    const std::vector<std::byte> raw(ChunkPz::raw_size - 1);
    auto text = ChunkPz::encode(raw);
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code, Error::Code::InvalidArgument);
}

// ============================================================================
// Stage failures
// ============================================================================

TEST(ChunkPz, StringStageFailure) {
    auto tile = ChunkPz::decode("not*base64", palettes::pixelzone, PixelOrigin{});
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::DecodeError);
    EXPECT_NE(tile.error().message.find("string"), std::string::npos);
}

TEST(ChunkPz, ByteListStageFailure) {
    auto tile = ChunkPz::decode(lzstring_text("1,2,300"), palettes::pixelzone, PixelOrigin{});
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::DecodeError);
    EXPECT_NE(tile.error().message.find("byte list"), std::string::npos);
}

TEST(ChunkPz, BlockStageFailure) {
    const std::vector<std::byte> not_a_frame{std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4},
                                             std::byte{5}, std::byte{6}, std::byte{7}, std::byte{8}};
    auto tile = ChunkPz::decode(wrap_frame_bytes(not_a_frame), palettes::pixelzone, PixelOrigin{});
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::DecodeError);
    EXPECT_NE(tile.error().message.find("block"), std::string::npos);
}

TEST(ChunkPz, UnpackStageFailure) {
    // A valid frame whose content is one byte short of a chunk
    const std::vector<std::byte> short_raw(ChunkPz::raw_size - 1, std::byte{0x11});
    const Lz4FrameCompressor compressor{};
    std::vector<std::byte> frame;
    auto written = compressor.compress(frame, 0, short_raw);
    ASSERT_TRUE(written.is_ok());
    frame.resize(written.value());

    auto tile = ChunkPz::decode(wrap_frame_bytes(frame), palettes::pixelzone, PixelOrigin{});
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::DecodeError);
    EXPECT_NE(tile.error().message.find("unpack"), std::string::npos);
}

TEST(ChunkPz, EmptyMessageFails) {
    ChunkPz chunk(0, 0);
    auto loaded = chunk.load_text("", palettes::pixelzone);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, Error::Code::DecodeError);
    EXPECT_FALSE(chunk.is_loaded());
}
