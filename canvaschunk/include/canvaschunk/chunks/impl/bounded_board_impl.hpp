// This file contains the implementation of the bounded board chunk.
// Do not include this file directly - it is included by bounded_board.hpp

#pragma once

#include <new>
#include <string>
#include <utility>
#include <vector>

#ifndef CANVASCHUNK_BOUNDED_BOARD_HEADER
#include "../bounded_board.hpp" // for linters
#endif

namespace canvaschunk {

inline Result<TileSize> BoundedBoard::tile_size() const noexcept {
    if (!info_) [[unlikely]] {
        return Err(Error::Code::NotConfigured, "Bounded board size requested before board info was set");
    }
    return Ok(TileSize{info_->width, info_->height});
}

inline Result<std::vector<uint8_t>> BoundedBoard::read_indices(std::span<const std::byte> payload) const noexcept {
    if (!info_) [[unlikely]] {
        return Err(Error::Code::NotConfigured, "Bounded board loaded before board info was set");
    }

    const std::size_t expected = required_buffer_size(ColorMode::Indexed8, info_->width, info_->height);
    if (payload.size() != expected) [[unlikely]] {
        return Err(Error::Code::DecodeError,
                   "Board payload has " + std::to_string(payload.size()) +
                   " bytes, expected " + std::to_string(expected));
    }

    std::vector<uint8_t> pixels;
    try {
        pixels.resize(payload.size());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate board raster");
    }
    for (std::size_t i = 0; i < payload.size(); ++i) {
        pixels[i] = static_cast<uint8_t>(payload[i]);
    }
    return Ok(std::move(pixels));
}

inline Result<void> BoundedBoard::load(std::span<const std::byte> payload, const Palette& palette) noexcept {
    auto pixels = read_indices(payload);
    if (!pixels) {
        return pixels.error();
    }
    return adopt(RasterTile::create(info_->width, info_->height, ColorMode::Indexed8,
                                    std::move(pixels).value(), &palette, pixel_origin()));
}

inline Result<void> BoundedBoard::load(std::span<const std::byte> payload,
                                       std::shared_ptr<const Palette> palette) noexcept {
    auto pixels = read_indices(payload);
    if (!pixels) {
        return pixels.error();
    }
    return adopt(RasterTile::create_with_shared_palette(info_->width, info_->height, ColorMode::Indexed8,
                                                        std::move(pixels).value(), std::move(palette),
                                                        pixel_origin()));
}

inline Result<Tiling<BoundedBoard>> BoundedBoard::get_intersecting(
    int64_t /*origin_x*/, int64_t /*origin_y*/, int64_t /*extent_x*/, int64_t /*extent_y*/) noexcept {
    try {
        Tiling<BoundedBoard> tiling;
        tiling.chunks.emplace_back();
        tiling.columns = 1;
        tiling.rows = 1;
        return Ok(std::move(tiling));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate chunk list");
    }
}

inline Result<Tiling<BoundedBoard>> BoundedBoard::get_intersecting(
    const BoardInfo& info,
    int64_t origin_x, int64_t origin_y, int64_t extent_x, int64_t extent_y) noexcept {
    auto tiling = get_intersecting(origin_x, origin_y, extent_x, extent_y);
    if (tiling) {
        tiling.value().chunks.front().set_board_info(info);
    }
    return tiling;
}

} // namespace canvaschunk
