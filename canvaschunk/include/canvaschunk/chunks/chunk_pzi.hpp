#pragma once

/**
 * @file chunk_pzi.hpp
 * @brief 500×500 chunks served as whole PNG images over HTTP
 *
 * The canvas is a 20×20 grid starting at the pixel origin. Each chunk is a
 * self-describing PNG; decoding delegates to the image container decoder and
 * yields RGB-8. An image of any other size than 500×500 is a DecodeError.
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

class ChunkPzi : public ChunkState {
public:
    static constexpr VariantKind kind = VariantKind::ChunkPzi;
    static constexpr GridGeometry geometry{500, 0, 0, 20};

    ChunkPzi(int64_t x, int64_t y) noexcept : ChunkState(x, y) {}
    explicit ChunkPzi(ChunkCoord coord) noexcept : ChunkState(coord.x, coord.y) {}

    [[nodiscard]] ChunkKey key() const noexcept { return ChunkKey{kind, coord_.x, coord_.y}; }

    [[nodiscard]] PixelOrigin pixel_origin() const noexcept { return geometry.origin_of(coord_); }

    [[nodiscard]] static constexpr TileSize tile_size() noexcept { return geometry.tile_size(); }

    [[nodiscard]] bool is_in_bounds() const noexcept { return geometry.contains(coord_); }

    /// @retval OutOfBounds Chunk outside the canvas
    [[nodiscard]] Result<RequestDescriptor> request_descriptor(
        const ServiceEndpoints& endpoints = {}) const noexcept;

    /// The images carry their own colors; the palette is unused for decoding
    [[nodiscard]] static const Palette& default_palette() noexcept { return palettes::pixelzone; }

    [[nodiscard]] Result<void> load(std::span<const std::byte> payload, const Palette& /*palette*/) noexcept {
        return adopt(decode(payload, pixel_origin()));
    }

    [[nodiscard]] Result<void> load(std::span<const std::byte> payload) noexcept {
        return adopt(decode(payload, pixel_origin()));
    }

    /// @retval DecodeError Not a decodable image, or not 500×500
    [[nodiscard]] static Result<RasterTile> decode(
        std::span<const std::byte> payload,
        PixelOrigin origin) noexcept;

    [[nodiscard]] static Result<Tiling<ChunkPzi>> get_intersecting(
        int64_t origin_x, int64_t origin_y, int64_t extent_x, int64_t extent_y) noexcept {
        return tile_rect<ChunkPzi>(geometry, origin_x, origin_y, extent_x, extent_y);
    }

    [[nodiscard]] bool operator==(const ChunkPzi& other) const noexcept {
        return coord_ == other.coord_;
    }
};

} // namespace canvaschunk

#define CANVASCHUNK_CHUNK_PZI_HEADER
#include "impl/chunk_pzi_impl.hpp"

static_assert(canvaschunk::ChunkVariant<canvaschunk::ChunkPzi>, "ChunkPzi must satisfy ChunkVariant concept");
