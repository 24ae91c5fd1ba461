#pragma once

/**
 * @file big_chunk.hpp
 * @brief 960×960 chunks of the big-canvas services
 *
 * Both big-canvas services share one grid and one payload format and differ
 * only in their endpoint and palette, so they are two instantiations of the
 * same template.
 *
 * ## Payload format
 *
 * A chunk is a 15×15 grid of 64×64 sub-blocks. The payload is the
 * concatenation of the sub-blocks in row-major order, each stored as
 * 2048 bytes of 4-bit palette indices (high nibble first, 32 bytes per row).
 * The payload is therefore always exactly 460800 bytes.
 *
 * The canvas ends at ±1,000,000 pixels. Sub-blocks whose top-left corner lies
 * outside [-1000000, 1000000) on either axis are not decoded; their bytes are
 * skipped and the area keeps the background color (palette index 1). The
 * block grid is aligned with the limit, so a sub-block is either entirely on
 * or entirely off the canvas.
 *
 * The decoded raster is RGB-8.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include "chunk_common.hpp"
#include "../config.hpp"
#include "../palettes.hpp"
#include "../raster_tile.hpp"
#include "../tiling.hpp"
#include "../types/request.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

template <VariantKind Kind>
class BigChunkT : public ChunkState {
    static_assert(Kind == VariantKind::BigChunk || Kind == VariantKind::BigChunkVariantB,
                  "BigChunkT only models the big-canvas services");

public:
    static constexpr VariantKind kind = Kind;
    static constexpr GridGeometry geometry{960, 448, -1043, 1043};

    static constexpr uint32_t block_size = 64;
    static constexpr uint32_t blocks_per_side = 15;
    static constexpr std::size_t block_bytes = block_size * block_size / 2;
    static constexpr std::size_t payload_size = blocks_per_side * blocks_per_side * block_bytes;
    static constexpr int64_t canvas_limit = 1'000'000;
    static constexpr uint8_t background_index = 1;

    BigChunkT(int64_t x, int64_t y) noexcept : ChunkState(x, y) {}
    explicit BigChunkT(ChunkCoord coord) noexcept : ChunkState(coord.x, coord.y) {}

    [[nodiscard]] ChunkKey key() const noexcept { return ChunkKey{kind, coord_.x, coord_.y}; }

    [[nodiscard]] PixelOrigin pixel_origin() const noexcept { return geometry.origin_of(coord_); }

    [[nodiscard]] static constexpr TileSize tile_size() noexcept { return geometry.tile_size(); }

    [[nodiscard]] bool is_in_bounds() const noexcept { return geometry.contains(coord_); }

    /// @brief HTTP GET of the chunk; the service addresses chunks in 64-pixel block units
    /// @retval OutOfBounds Chunk outside the canvas
    [[nodiscard]] Result<RequestDescriptor> request_descriptor(
        const ServiceEndpoints& endpoints = {}) const noexcept;

    [[nodiscard]] static const Palette& default_palette() noexcept {
        if constexpr (Kind == VariantKind::BigChunk) {
            return palettes::pixelcanvas;
        } else {
            return palettes::pixelplace;
        }
    }

    /// @brief Decode a payload and store the raster
    /// @retval DecodeError Payload is not exactly payload_size bytes
    [[nodiscard]] Result<void> load(std::span<const std::byte> payload, const Palette& palette) noexcept {
        return adopt(decode(payload, palette, pixel_origin()));
    }

    [[nodiscard]] Result<void> load(std::span<const std::byte> payload) noexcept {
        return load(payload, default_palette());
    }

    /// @brief Decode a payload for a chunk whose top-left corner is @p origin
    [[nodiscard]] static Result<RasterTile> decode(
        std::span<const std::byte> payload,
        const Palette& palette,
        PixelOrigin origin) noexcept;

    [[nodiscard]] static Result<Tiling<BigChunkT>> get_intersecting(
        int64_t origin_x, int64_t origin_y, int64_t extent_x, int64_t extent_y) noexcept {
        return tile_rect<BigChunkT>(geometry, origin_x, origin_y, extent_x, extent_y);
    }

    [[nodiscard]] bool operator==(const BigChunkT& other) const noexcept {
        return coord_ == other.coord_;
    }
};

using BigChunk = BigChunkT<VariantKind::BigChunk>;
using BigChunkVariantB = BigChunkT<VariantKind::BigChunkVariantB>;

} // namespace canvaschunk

#define CANVASCHUNK_BIG_CHUNK_HEADER
#include "impl/big_chunk_impl.hpp"

static_assert(canvaschunk::ChunkVariant<canvaschunk::BigChunk>, "BigChunk must satisfy ChunkVariant concept");
static_assert(canvaschunk::ChunkVariant<canvaschunk::BigChunkVariantB>, "BigChunkVariantB must satisfy ChunkVariant concept");
