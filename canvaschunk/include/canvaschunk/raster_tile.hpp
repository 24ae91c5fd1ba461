#pragma once

/**
 * @file raster_tile.hpp
 * @brief Decoded pixel data of one chunk
 *
 * A RasterTile is what every chunk variant produces from its payload. It is
 * either RGB-8 (three bytes per pixel, palette already resolved) or indexed
 * (palette indices plus a pointer to the palette they refer to).
 *
 * ## Buffer size invariant
 *
 * The pixel buffer length always equals the size required by the color mode:
 * - Indexed8:       width × height
 * - PackedIndexed4: ceil(width / 2) × height (rows are byte aligned, high nibble first)
 * - RGB8:           width × height × 3
 *
 * The only way to build a tile is RasterTile::create(), which rejects any
 * other length with Error::Code::DecodeError. A short buffer is never padded
 * and a long one is never truncated.
 *
 * @note RasterTile is a value type; copies are deep
 * @note A palette passed by pointer is not owned and must outlive the tile;
 *       create_with_shared_palette() makes the tile co-own its palette
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include "types/chunk_key.hpp"
#include "types/palette.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// @brief Pixel storage format of a RasterTile
enum class ColorMode : uint8_t {
    Indexed8,       ///< One palette index per byte
    PackedIndexed4, ///< Two palette indices per byte, high nibble first
    RGB8            ///< Three bytes (R, G, B) per pixel
};

/// @brief Number of bytes a width × height buffer occupies in a color mode
[[nodiscard]] constexpr std::size_t required_buffer_size(
    ColorMode mode, uint32_t width, uint32_t height) noexcept {
    switch (mode) {
        case ColorMode::Indexed8:
            return static_cast<std::size_t>(width) * height;
        case ColorMode::PackedIndexed4:
            return (static_cast<std::size_t>(width) + 1) / 2 * height;
        case ColorMode::RGB8:
            return static_cast<std::size_t>(width) * height * 3;
    }
    return 0;
}

class RasterTile {
public:
    /// @brief Build a tile, validating the buffer length against the color mode
    /// @param width Width in pixels
    /// @param height Height in pixels
    /// @param mode Color mode of @p pixels
    /// @param pixels Pixel buffer (moved into the tile)
    /// @param palette Palette for indexed modes (ignored for RGB8)
    /// @param origin Pixel-space position of the tile's top-left corner
    /// @return The tile, or an error
    /// @retval DecodeError Buffer length does not match the color mode
    /// @retval InvalidArgument Zero width or height
    [[nodiscard]] static Result<RasterTile> create(
        uint32_t width,
        uint32_t height,
        ColorMode mode,
        std::vector<uint8_t> pixels,
        const Palette* palette = nullptr,
        PixelOrigin origin = {}) noexcept;

    /// @brief Same as create(), the tile keeping @p palette alive for its own lifetime
    /// @retval InvalidArgument Indexed mode without a palette
    [[nodiscard]] static Result<RasterTile> create_with_shared_palette(
        uint32_t width,
        uint32_t height,
        ColorMode mode,
        std::vector<uint8_t> pixels,
        std::shared_ptr<const Palette> palette,
        PixelOrigin origin = {}) noexcept;

    [[nodiscard]] uint32_t width() const noexcept { return width_; }
    [[nodiscard]] uint32_t height() const noexcept { return height_; }
    [[nodiscard]] ColorMode mode() const noexcept { return mode_; }
    [[nodiscard]] PixelOrigin origin() const noexcept { return origin_; }
    [[nodiscard]] const Palette* palette() const noexcept { return palette_; }
    [[nodiscard]] bool is_indexed() const noexcept { return mode_ != ColorMode::RGB8; }
    [[nodiscard]] std::span<const uint8_t> pixels() const noexcept { return pixels_; }

    /// @brief Move the tile to another pixel-space origin
    void set_origin(PixelOrigin origin) noexcept { origin_ = origin; }

    /// @brief Palette index of a pixel
    /// @retval OutOfBounds Pixel outside the tile
    /// @retval UnsupportedFeature Tile is RGB8
    [[nodiscard]] Result<uint8_t> index_at(uint32_t x, uint32_t y) const noexcept;

    /// @brief Resolved color of a pixel
    /// @retval OutOfBounds Pixel outside the tile
    /// @retval InvalidArgument Indexed tile without palette
    [[nodiscard]] Result<Rgb> rgb_at(uint32_t x, uint32_t y) const noexcept;

    /// @brief Whole tile as an RGB-8 buffer (width × height × 3 bytes)
    /// @retval InvalidArgument Indexed tile without palette
    /// @retval MemoryError Allocation failed
    [[nodiscard]] Result<std::vector<uint8_t>> to_rgb() const noexcept;

private:
    RasterTile(uint32_t width, uint32_t height, ColorMode mode,
               std::vector<uint8_t> pixels, const Palette* palette,
               PixelOrigin origin) noexcept;

    uint32_t width_;
    uint32_t height_;
    ColorMode mode_;
    std::vector<uint8_t> pixels_;
    const Palette* palette_;
    std::shared_ptr<const Palette> palette_owner_;
    PixelOrigin origin_;
};

} // namespace canvaschunk

#define CANVASCHUNK_RASTER_TILE_HEADER
#include "impl/raster_tile_impl.hpp"
