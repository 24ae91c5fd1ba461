#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

#include "../canvaschunk/include/canvaschunk/palettes.hpp"
#include "../canvaschunk/include/canvaschunk/raster_tile.hpp"

using namespace canvaschunk;

// ============================================================================
// Helper Functions
// ============================================================================

const Palette& test_palette() {
    static const Palette palette{{
        {255, 0, 0}, {0, 255, 0}, {0, 0, 255}, {10, 20, 30}
    }, Palette::Fill::Pad};
    return palette;
}

// ============================================================================
// Palette
// ============================================================================

TEST(Palette, RepeatFillTilesColors) {
    const Palette palette{{{1, 1, 1}, {2, 2, 2}, {3, 3, 3}}, Palette::Fill::Repeat};
    EXPECT_EQ(palette.defined_colors(), 3u);
    EXPECT_EQ(palette[3], (Rgb{1, 1, 1}));
    EXPECT_EQ(palette[5], (Rgb{3, 3, 3}));
    EXPECT_EQ(palette[255], (Rgb{1, 1, 1}));  // 255 % 3 == 0
}

TEST(Palette, PadFillIsBlack) {
    EXPECT_EQ(test_palette()[3], (Rgb{10, 20, 30}));
    EXPECT_EQ(test_palette()[4], (Rgb{0, 0, 0}));
    EXPECT_EQ(test_palette()[255], (Rgb{0, 0, 0}));
}

TEST(Palette, DefaultIsEmpty) {
    const Palette palette;
    EXPECT_TRUE(palette.empty());
    EXPECT_EQ(palette[7], (Rgb{0, 0, 0}));
}

TEST(Palette, ServiceTables) {
    EXPECT_EQ(palettes::pixelcanvas.defined_colors(), 16u);
    EXPECT_EQ(palettes::pixelzone.defined_colors(), 16u);
    EXPECT_EQ(palettes::pxls[255], (Rgb{0, 0, 0}));

    const PaletteSet set{};
    EXPECT_EQ(&set.for_kind(VariantKind::BigChunk), &palettes::pixelcanvas);
    EXPECT_EQ(&set.for_kind(VariantKind::BigChunkVariantB), &palettes::pixelplace);
    EXPECT_EQ(&set.for_kind(VariantKind::BoundedBoard), &palettes::pxls);
}

// ============================================================================
// Buffer size invariant
// ============================================================================

TEST(RasterTile, RequiredBufferSize) {
    EXPECT_EQ(required_buffer_size(ColorMode::Indexed8, 512, 512), 262144u);
    EXPECT_EQ(required_buffer_size(ColorMode::PackedIndexed4, 512, 512), 131072u);
    EXPECT_EQ(required_buffer_size(ColorMode::PackedIndexed4, 3, 2), 4u);
    EXPECT_EQ(required_buffer_size(ColorMode::RGB8, 960, 960), 2764800u);
}

TEST(RasterTile, CreateRejectsShortBuffer) {
    auto tile = RasterTile::create(4, 4, ColorMode::Indexed8, std::vector<uint8_t>(15), &test_palette());
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::DecodeError);
}

TEST(RasterTile, CreateRejectsLongBuffer) {
    auto tile = RasterTile::create(4, 4, ColorMode::RGB8, std::vector<uint8_t>(49));
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::DecodeError);
}

TEST(RasterTile, CreateRejectsZeroDimensions) {
    auto tile = RasterTile::create(0, 4, ColorMode::Indexed8, {});
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::InvalidArgument);
}

// ============================================================================
// Pixel access
// ============================================================================

TEST(RasterTile, IndexedAccess) {
    auto tile = RasterTile::create(2, 2, ColorMode::Indexed8, {0, 1, 2, 3}, &test_palette(),
                                   PixelOrigin{-10, 20});
    ASSERT_TRUE(tile.is_ok());
    const RasterTile& t = tile.value();

    EXPECT_TRUE(t.is_indexed());
    EXPECT_EQ(t.origin(), (PixelOrigin{-10, 20}));
    EXPECT_EQ(t.index_at(1, 0).value(), 1);
    EXPECT_EQ(t.index_at(0, 1).value(), 2);
    EXPECT_EQ(t.rgb_at(1, 1).value(), (Rgb{10, 20, 30}));
}

TEST(RasterTile, PackedAccess) {
    // 3x2, rows byte aligned
    auto tile = RasterTile::create(3, 2, ColorMode::PackedIndexed4, {0x01, 0x20, 0x32, 0x10},
                                   &test_palette());
    ASSERT_TRUE(tile.is_ok());
    const RasterTile& t = tile.value();

    EXPECT_EQ(t.index_at(0, 0).value(), 0);
    EXPECT_EQ(t.index_at(1, 0).value(), 1);
    EXPECT_EQ(t.index_at(2, 0).value(), 2);
    EXPECT_EQ(t.index_at(0, 1).value(), 3);
    EXPECT_EQ(t.index_at(2, 1).value(), 1);
    EXPECT_EQ(t.rgb_at(2, 0).value(), (Rgb{0, 0, 255}));
}

TEST(RasterTile, RgbAccess) {
    auto tile = RasterTile::create(1, 2, ColorMode::RGB8, {1, 2, 3, 4, 5, 6});
    ASSERT_TRUE(tile.is_ok());
    const RasterTile& t = tile.value();

    EXPECT_FALSE(t.is_indexed());
    EXPECT_EQ(t.palette(), nullptr);
    EXPECT_EQ(t.rgb_at(0, 1).value(), (Rgb{4, 5, 6}));

    auto index = t.index_at(0, 0);
    ASSERT_TRUE(index.is_error());
    EXPECT_EQ(index.error().code, Error::Code::UnsupportedFeature);
}

TEST(RasterTile, AccessOutsideTile) {
    auto tile = RasterTile::create(2, 2, ColorMode::Indexed8, {0, 0, 0, 0}, &test_palette());
    ASSERT_TRUE(tile.is_ok());

    auto rgb = tile.value().rgb_at(2, 0);
    ASSERT_TRUE(rgb.is_error());
    EXPECT_EQ(rgb.error().code, Error::Code::OutOfBounds);
}

TEST(RasterTile, IndexedWithoutPalette) {
    auto tile = RasterTile::create(1, 1, ColorMode::Indexed8, {0});
    ASSERT_TRUE(tile.is_ok());

    auto rgb = tile.value().to_rgb();
    ASSERT_TRUE(rgb.is_error());
    EXPECT_EQ(rgb.error().code, Error::Code::InvalidArgument);
}

TEST(RasterTile, ToRgbResolvesPalette) {
    auto tile = RasterTile::create(3, 1, ColorMode::PackedIndexed4, {0x12, 0x30}, &test_palette());
    ASSERT_TRUE(tile.is_ok());

    auto rgb = tile.value().to_rgb();
    ASSERT_TRUE(rgb.is_ok());
    const std::vector<uint8_t> expected{0, 255, 0, 0, 0, 255, 10, 20, 30};
    EXPECT_EQ(rgb.value(), expected);
}

TEST(RasterTile, SetOrigin) {
    auto tile = RasterTile::create(1, 1, ColorMode::RGB8, {0, 0, 0});
    ASSERT_TRUE(tile.is_ok());
    tile.value().set_origin(PixelOrigin{960, -448});
    EXPECT_EQ(tile.value().origin(), (PixelOrigin{960, -448}));
}
