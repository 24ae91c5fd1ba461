#pragma once

/**
 * @file chunk_variants.hpp
 * @brief Heterogeneous chunk lists
 *
 * When the service is known at compile time, use the chunk class directly
 * (BigChunk::get_intersecting(...), chunk.load(...)). When the service is
 * chosen at runtime, or chunks of several services are processed together,
 * hold them as AnyChunk and use the free functions below, which dispatch
 * through std::visit.
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * using namespace canvaschunk;
 *
 * auto tiling = get_intersecting_any(VariantKind::ChunkPz, 0, 0, 1024, 1024);
 * for (auto& chunk : tiling.value().chunks) {
 *     auto request = request_descriptor(chunk);
 *     // transport fetch ...
 *     auto loaded = load(chunk, payload);
 * }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <variant>
#include "chunks/big_chunk.hpp"
#include "chunks/bounded_board.hpp"
#include "chunks/chunk_pz.hpp"
#include "chunks/chunk_pzi.hpp"
#include "config.hpp"
#include "palettes.hpp"
#include "raster_tile.hpp"
#include "tiling.hpp"
#include "types/chunk_key.hpp"
#include "types/request.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// Closed set of chunk types; the alternative order follows VariantKind
using AnyChunk = std::variant<
    BigChunk,
    BigChunkVariantB,
    ChunkPz,
    ChunkPzi,
    BoundedBoard
>;

/// @brief Tile a rectangle for a service chosen at runtime
/// @param board Metadata given to a BoundedBoard chunk; ignored for other kinds
[[nodiscard]] Result<Tiling<AnyChunk>> get_intersecting_any(
    VariantKind kind,
    int64_t origin_x,
    int64_t origin_y,
    int64_t extent_x,
    int64_t extent_y,
    const BoardInfo* board = nullptr) noexcept;

/// @brief A single chunk of a service chosen at runtime
/// @note For BoundedBoard the coordinate is ignored and the board is unconfigured
[[nodiscard]] AnyChunk make_chunk(VariantKind kind, ChunkCoord coord) noexcept;

[[nodiscard]] VariantKind kind_of(const AnyChunk& chunk) noexcept;

[[nodiscard]] ChunkKey key_of(const AnyChunk& chunk) noexcept;

[[nodiscard]] PixelOrigin pixel_origin_of(const AnyChunk& chunk) noexcept;

/// @retval NotConfigured BoundedBoard without board info
[[nodiscard]] Result<TileSize> tile_size_of(const AnyChunk& chunk) noexcept;

[[nodiscard]] bool is_in_bounds(const AnyChunk& chunk) noexcept;

/// @retval OutOfBounds Chunk outside its service's canvas
[[nodiscard]] Result<RequestDescriptor> request_descriptor(
    const AnyChunk& chunk,
    const ServiceEndpoints& endpoints = {}) noexcept;

/// @brief Decode a payload with the palette the set assigns to the chunk's kind
[[nodiscard]] Result<void> load(
    AnyChunk& chunk,
    std::span<const std::byte> payload,
    const PaletteSet& palette_set = {}) noexcept;

[[nodiscard]] const std::shared_ptr<const RasterTile>& raster_of(const AnyChunk& chunk) noexcept;

[[nodiscard]] bool is_loaded(const AnyChunk& chunk) noexcept;

void set_raster(AnyChunk& chunk, std::shared_ptr<const RasterTile> raster) noexcept;

} // namespace canvaschunk

#define CANVASCHUNK_CHUNK_VARIANTS_HEADER
#include "impl/chunk_variants_impl.hpp"
