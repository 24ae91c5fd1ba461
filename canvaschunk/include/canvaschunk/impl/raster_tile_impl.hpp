// This file contains the implementation of RasterTile.
// Do not include this file directly - it is included by raster_tile.hpp

#pragma once

#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>
#include "../types/palette.hpp"
#include "../types/result.hpp"

#ifndef CANVASCHUNK_RASTER_TILE_HEADER
#include "../raster_tile.hpp" // for linters
#endif

namespace canvaschunk {

inline RasterTile::RasterTile(uint32_t width, uint32_t height, ColorMode mode,
                              std::vector<uint8_t> pixels, const Palette* palette,
                              PixelOrigin origin) noexcept
    : width_(width)
    , height_(height)
    , mode_(mode)
    , pixels_(std::move(pixels))
    , palette_(mode == ColorMode::RGB8 ? nullptr : palette)
    , origin_(origin) {}

inline Result<RasterTile> RasterTile::create(
    uint32_t width,
    uint32_t height,
    ColorMode mode,
    std::vector<uint8_t> pixels,
    const Palette* palette,
    PixelOrigin origin) noexcept {

    if (width == 0 || height == 0) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Raster tile must have non-zero dimensions");
    }

    const std::size_t expected = required_buffer_size(mode, width, height);
    if (pixels.size() != expected) [[unlikely]] {
        return Err(Error::Code::DecodeError,
                   "Pixel buffer holds " + std::to_string(pixels.size()) +
                   " bytes, expected " + std::to_string(expected) +
                   " for a " + std::to_string(width) + "x" + std::to_string(height) + " tile");
    }

    return Ok(RasterTile{width, height, mode, std::move(pixels), palette, origin});
}

inline Result<RasterTile> RasterTile::create_with_shared_palette(
    uint32_t width,
    uint32_t height,
    ColorMode mode,
    std::vector<uint8_t> pixels,
    std::shared_ptr<const Palette> palette,
    PixelOrigin origin) noexcept {

    if (mode != ColorMode::RGB8 && !palette) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Shared palette is null");
    }

    auto tile = create(width, height, mode, std::move(pixels), palette.get(), origin);
    if (tile && mode != ColorMode::RGB8) {
        tile.value().palette_owner_ = std::move(palette);
    }
    return tile;
}

inline Result<uint8_t> RasterTile::index_at(uint32_t x, uint32_t y) const noexcept {
    if (x >= width_ || y >= height_) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "Pixel outside raster tile");
    }

    switch (mode_) {
        case ColorMode::Indexed8:
            return Ok(pixels_[static_cast<std::size_t>(y) * width_ + x]);
        case ColorMode::PackedIndexed4: {
            const std::size_t row_bytes = (static_cast<std::size_t>(width_) + 1) / 2;
            const uint8_t packed = pixels_[y * row_bytes + x / 2];
            return Ok(static_cast<uint8_t>((x % 2 == 0) ? (packed >> 4) : (packed & 0x0F)));
        }
        case ColorMode::RGB8:
            break;
    }
    return Err(Error::Code::UnsupportedFeature, "RGB tiles have no palette indices");
}

inline Result<Rgb> RasterTile::rgb_at(uint32_t x, uint32_t y) const noexcept {
    if (x >= width_ || y >= height_) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "Pixel outside raster tile");
    }

    if (mode_ == ColorMode::RGB8) {
        const std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * 3;
        return Ok(Rgb{pixels_[i], pixels_[i + 1], pixels_[i + 2]});
    }

    if (palette_ == nullptr) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Indexed tile has no palette");
    }

    auto index = index_at(x, y);
    if (!index) {
        return index.error();
    }
    return Ok((*palette_)[index.value()]);
}

inline Result<std::vector<uint8_t>> RasterTile::to_rgb() const noexcept {
    if (mode_ == ColorMode::RGB8) {
        try {
            return Ok(std::vector<uint8_t>(pixels_));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate RGB buffer");
        }
    }

    if (palette_ == nullptr) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Indexed tile has no palette");
    }

    std::vector<uint8_t> rgb;
    try {
        rgb.resize(required_buffer_size(ColorMode::RGB8, width_, height_));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate RGB buffer");
    }

    const Palette& palette = *palette_;
    std::size_t out = 0;
    if (mode_ == ColorMode::Indexed8) {
        for (uint8_t index : pixels_) {
            const Rgb& c = palette[index];
            rgb[out++] = c.r;
            rgb[out++] = c.g;
            rgb[out++] = c.b;
        }
    } else {
        const std::size_t row_bytes = (static_cast<std::size_t>(width_) + 1) / 2;
        for (uint32_t y = 0; y < height_; ++y) {
            const uint8_t* row = pixels_.data() + y * row_bytes;
            for (uint32_t x = 0; x < width_; ++x) {
                const uint8_t index = (x % 2 == 0) ? (row[x / 2] >> 4) : (row[x / 2] & 0x0F);
                const Rgb& c = palette[index];
                rgb[out++] = c.r;
                rgb[out++] = c.g;
                rgb[out++] = c.b;
            }
        }
    }

    return Ok(std::move(rgb));
}

} // namespace canvaschunk
