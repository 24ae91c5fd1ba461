#pragma once

/**
 * @file tiling.hpp
 * @brief Mapping of pixel rectangles onto a service's chunk grid
 *
 * Every fixed-size service cuts its canvas into square chunks of `size`
 * pixels. The grid is shifted so that chunk (0, 0) starts at pixel
 * (-offset, -offset):
 *
 *     pixel_origin(x, y) = (x * size - offset, y * size - offset)
 *
 * and a pixel p lies in chunk floor((p + offset) / size). Canvas coordinates
 * may be negative, so the division always rounds towards negative infinity.
 *
 * ## Covering a rectangle
 *
 * A rectangle is given as an origin and an extent and covers the half-open
 * range [origin, origin + extent) on each axis. Its first and last pixel
 * (origin + extent - 1) are mapped to grid indices, giving the inclusive grid
 * range [x0..x1] × [y0..y1]. The chunks are emitted row by row, left to
 * right, and the grid shape is (x1 - x0 + 1, y1 - y0 + 1).
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * using namespace canvaschunk;
 *
 * auto tiling = BigChunk::get_intersecting(-500, -500, 2000, 1000);
 * if (tiling) {
 *     for (const auto& chunk : tiling.value().chunks) {
 *         if (chunk.is_in_bounds()) {
 *             // request chunk.request_descriptor()
 *         }
 *     }
 * }
 * @endcode
 *
 * @note Tiling performs no bounds filtering; the caller filters with is_in_bounds()
 */

#include <cstdint>
#include <vector>
#include "types/chunk_key.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// @brief Integer division rounding towards negative infinity
/// @note @p b must be positive
[[nodiscard]] constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    const int64_t q = a / b;
    return (a % b != 0 && a < 0) ? q - 1 : q;
}

/// @brief Grid layout of a fixed-size service
struct GridGeometry {
    uint32_t size;      ///< Chunk width and height in pixels
    int64_t offset;     ///< Pixel distance from chunk (0, 0)'s corner to the canvas origin
    int64_t min_index;  ///< Smallest valid grid index on both axes (inclusive)
    int64_t max_index;  ///< Largest valid grid index on both axes (exclusive)

    /// @brief Pixel-space top-left corner of a chunk
    [[nodiscard]] constexpr PixelOrigin origin_of(ChunkCoord coord) const noexcept {
        return PixelOrigin{
            coord.x * static_cast<int64_t>(size) - offset,
            coord.y * static_cast<int64_t>(size) - offset
        };
    }

    /// @brief Grid index of the chunk containing a pixel (one axis)
    [[nodiscard]] constexpr int64_t index_of(int64_t pixel) const noexcept {
        return floor_div(pixel + offset, static_cast<int64_t>(size));
    }

    /// @brief Whether a grid coordinate lies within the service's canvas
    [[nodiscard]] constexpr bool contains(ChunkCoord coord) const noexcept {
        return coord.x >= min_index && coord.x < max_index &&
               coord.y >= min_index && coord.y < max_index;
    }

    [[nodiscard]] constexpr TileSize tile_size() const noexcept {
        return TileSize{size, size};
    }
};

/// @brief Inclusive range of grid coordinates
struct GridRange {
    int64_t x0;
    int64_t y0;
    int64_t x1;  ///< Last column (inclusive)
    int64_t y1;  ///< Last row (inclusive)

    [[nodiscard]] constexpr uint32_t columns() const noexcept {
        return static_cast<uint32_t>(x1 - x0 + 1);
    }

    [[nodiscard]] constexpr uint32_t rows() const noexcept {
        return static_cast<uint32_t>(y1 - y0 + 1);
    }
};

/// @brief Chunks covering a rectangle, plus the shape of their grid
/// @note chunks.size() == columns × rows, ordered row-major
template <typename Chunk>
struct Tiling {
    std::vector<Chunk> chunks;
    uint32_t columns{0};
    uint32_t rows{0};
};

/// @brief Inclusive grid range covering the half-open rectangle
///        [origin_x, origin_x + extent_x) × [origin_y, origin_y + extent_y)
/// @retval InvalidArgument Extent below 1, or a rectangle whose end overflows
/// @retval OutOfBounds The covering grid has more than UINT32_MAX columns or rows
[[nodiscard]] Result<GridRange> covering_range(
    const GridGeometry& geometry,
    int64_t origin_x,
    int64_t origin_y,
    int64_t extent_x,
    int64_t extent_y) noexcept;

/// @brief Build one chunk per grid coordinate of the covering range, row-major
/// @tparam Chunk Chunk type constructible from (int64_t x, int64_t y)
/// @retval MemoryError Allocation of the chunk list failed
template <typename Chunk>
[[nodiscard]] Result<Tiling<Chunk>> tile_rect(
    const GridGeometry& geometry,
    int64_t origin_x,
    int64_t origin_y,
    int64_t extent_x,
    int64_t extent_y) noexcept;

} // namespace canvaschunk

#define CANVASCHUNK_TILING_HEADER
#include "impl/tiling_impl.hpp"
