#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <png.h>

#include "../canvaschunk/include/canvaschunk/chunks/chunk_pzi.hpp"
#include "../canvaschunk/include/canvaschunk/decoders/image_container.hpp"

using namespace canvaschunk;

// ============================================================================
// Helper Functions
// ============================================================================

/// RGB gradient: red follows x, green follows y, blue is constant
std::vector<uint8_t> generate_gradient(uint32_t width, uint32_t height) {
    std::vector<uint8_t> rgb(static_cast<std::size_t>(width) * height * 3);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 3;
            rgb[i] = static_cast<uint8_t>(x & 0xFF);
            rgb[i + 1] = static_cast<uint8_t>(y & 0xFF);
            rgb[i + 2] = 0x40;
        }
    }
    return rgb;
}

/// Encode pixels with libpng's simplified write API
std::vector<std::byte> encode_png(const std::vector<uint8_t>& pixels, uint32_t width, uint32_t height,
                                  png_uint_32 format = PNG_FORMAT_RGB) {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = width;
    image.height = height;
    image.format = format;

    png_alloc_size_t size = 0;
    if (!png_image_write_get_memory_size(image, size, 0, pixels.data(), 0, nullptr)) {
        ADD_FAILURE() << "PNG size query failed: " << image.message;
        return {};
    }
    std::vector<std::byte> png(size);
    if (!png_image_write_to_memory(&image, png.data(), &size, 0, pixels.data(), 0, nullptr)) {
        ADD_FAILURE() << "PNG encode failed: " << image.message;
        return {};
    }
    png.resize(size);
    return png;
}

// ============================================================================
// Image container
// ============================================================================

TEST(ImageContainer, DecodesRgb) {
    const auto pixels = generate_gradient(7, 3);
    const auto png = encode_png(pixels, 7, 3);
    ASSERT_FALSE(png.empty());

    auto image = decode_image_container(png);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    EXPECT_EQ(image.value().width, 7u);
    EXPECT_EQ(image.value().height, 3u);
    EXPECT_EQ(image.value().rgb, pixels);
}

TEST(ImageContainer, GrayIsExpandedToRgb) {
    const std::vector<uint8_t> gray{0, 128, 255, 7};
    const auto png = encode_png(gray, 2, 2, PNG_FORMAT_GRAY);

    auto image = decode_image_container(png);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    ASSERT_EQ(image.value().rgb.size(), 12u);
    EXPECT_EQ(image.value().rgb[0], image.value().rgb[1]);
    EXPECT_EQ(image.value().rgb[1], image.value().rgb[2]);
    EXPECT_GT(image.value().rgb[6], image.value().rgb[3]);
}

TEST(ImageContainer, NotAnImage) {
    const std::vector<std::byte> garbage(64, std::byte{0x5A});
    auto image = decode_image_container(garbage);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::DecodeError);
}

TEST(ImageContainer, TruncatedStream) {
    auto png = encode_png(generate_gradient(64, 64), 64, 64);
    ASSERT_GT(png.size(), 100u);
    png.resize(png.size() / 2);

    auto image = decode_image_container(png);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::DecodeError);
}

// ============================================================================
// ChunkPzi
// ============================================================================

TEST(ChunkPzi, RequestUrl) {
    auto request = ChunkPzi(4, 19).request_descriptor();
    ASSERT_TRUE(request.is_ok());
    ASSERT_TRUE(std::holds_alternative<HttpGet>(request.value()));
    EXPECT_EQ(request_target(request.value()), "https://pixelzone.io/api/image/4.19.png");
}

TEST(ChunkPzi, OutOfBoundsRequestFails) {
    auto request = ChunkPzi(-1, 0).request_descriptor();
    ASSERT_TRUE(request.is_error());
    EXPECT_EQ(request.error().code, Error::Code::OutOfBounds);
}

TEST(ChunkPzi, LoadFullSizeImage) {
    const auto pixels = generate_gradient(500, 500);
    const auto png = encode_png(pixels, 500, 500);

    ChunkPzi chunk(2, 3);
    ASSERT_TRUE(chunk.load(png).is_ok());
    ASSERT_TRUE(chunk.is_loaded());

    const RasterTile& tile = *chunk.raster();
    EXPECT_EQ(tile.mode(), ColorMode::RGB8);
    EXPECT_EQ(tile.origin(), (PixelOrigin{1000, 1500}));
    EXPECT_EQ(tile.rgb_at(300, 200).value(), (Rgb{300 & 0xFF, 200, 0x40}));
}

TEST(ChunkPzi, WrongImageSize) {
    const auto png = encode_png(generate_gradient(499, 500), 499, 500);

    ChunkPzi chunk(0, 0);
    auto loaded = chunk.load(png);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, Error::Code::DecodeError);
    EXPECT_FALSE(chunk.is_loaded());
}
