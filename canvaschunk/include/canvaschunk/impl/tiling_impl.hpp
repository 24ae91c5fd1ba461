// This file contains the implementation of the chunk grid tiling.
// Do not include this file directly - it is included by tiling.hpp

#pragma once

#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../types/result.hpp"

#ifndef CANVASCHUNK_TILING_HEADER
#include "../tiling.hpp" // for linters
#endif

namespace canvaschunk {

namespace tiling_impl {

/// Last pixel of [origin, origin + extent), or nothing if it overflows
[[nodiscard]] constexpr bool inclusive_end(int64_t origin, int64_t extent, int64_t& end) noexcept {
    if (origin > std::numeric_limits<int64_t>::max() - (extent - 1)) {
        return false;
    }
    end = origin + (extent - 1);
    return true;
}

/// Shifted pixel coordinate would overflow
[[nodiscard]] constexpr bool shift_overflows(int64_t pixel, int64_t offset) noexcept {
    return (offset > 0 && pixel > std::numeric_limits<int64_t>::max() - offset) ||
           (offset < 0 && pixel < std::numeric_limits<int64_t>::min() - offset);
}

} // namespace tiling_impl

inline Result<GridRange> covering_range(
    const GridGeometry& geometry,
    int64_t origin_x,
    int64_t origin_y,
    int64_t extent_x,
    int64_t extent_y) noexcept {

    if (geometry.size == 0) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Grid chunk size is zero");
    }
    if (extent_x < 1 || extent_y < 1) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   "Rectangle extent must be at least 1 pixel, got " +
                   std::to_string(extent_x) + "x" + std::to_string(extent_y));
    }

    int64_t end_x = 0;
    int64_t end_y = 0;
    if (!tiling_impl::inclusive_end(origin_x, extent_x, end_x) ||
        !tiling_impl::inclusive_end(origin_y, extent_y, end_y)) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Rectangle end overflows 64-bit coordinates");
    }
    if (tiling_impl::shift_overflows(origin_x, geometry.offset) ||
        tiling_impl::shift_overflows(origin_y, geometry.offset) ||
        tiling_impl::shift_overflows(end_x, geometry.offset) ||
        tiling_impl::shift_overflows(end_y, geometry.offset)) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Rectangle too close to the 64-bit coordinate limit");
    }

    GridRange range{
        geometry.index_of(origin_x),
        geometry.index_of(origin_y),
        geometry.index_of(end_x),
        geometry.index_of(end_y)
    };

    constexpr int64_t max_span = std::numeric_limits<uint32_t>::max();
    if (range.x1 - range.x0 >= max_span || range.y1 - range.y0 >= max_span) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "Rectangle covers too many chunks");
    }
    return Ok(range);
}

template <typename Chunk>
Result<Tiling<Chunk>> tile_rect(
    const GridGeometry& geometry,
    int64_t origin_x,
    int64_t origin_y,
    int64_t extent_x,
    int64_t extent_y) noexcept {

    auto range_result = covering_range(geometry, origin_x, origin_y, extent_x, extent_y);
    if (!range_result) {
        return range_result.error();
    }
    const GridRange& range = range_result.value();

    Tiling<Chunk> tiling;
    tiling.columns = range.columns();
    tiling.rows = range.rows();
    try {
        tiling.chunks.reserve(static_cast<std::size_t>(tiling.columns) * tiling.rows);
        for (int64_t y = range.y0; y <= range.y1; ++y) {
            for (int64_t x = range.x0; x <= range.x1; ++x) {
                tiling.chunks.emplace_back(x, y);
            }
        }
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError,
                   "Failed to allocate " + std::to_string(tiling.columns) + "x" +
                   std::to_string(tiling.rows) + " chunk list");
    } catch (const std::length_error&) {
        return Err(Error::Code::MemoryError, "Chunk list exceeds maximum vector size");
    }
    return Ok(std::move(tiling));
}

} // namespace canvaschunk
