// This file contains the implementation of the AnyChunk dispatch functions.
// Do not include this file directly - it is included by chunk_variants.hpp

#pragma once

#include <new>
#include <type_traits>
#include <utility>
#include <variant>

#ifndef CANVASCHUNK_CHUNK_VARIANTS_HEADER
#include "../chunk_variants.hpp" // for linters
#endif

namespace canvaschunk {

namespace chunk_variants_impl {

template <typename Chunk>
[[nodiscard]] Result<Tiling<AnyChunk>> widen(Result<Tiling<Chunk>>&& tiling) noexcept {
    if (!tiling) {
        return tiling.error();
    }
    Tiling<Chunk>& typed = tiling.value();

    Tiling<AnyChunk> any;
    any.columns = typed.columns;
    any.rows = typed.rows;
    try {
        any.chunks.reserve(typed.chunks.size());
        for (auto& chunk : typed.chunks) {
            any.chunks.emplace_back(std::in_place_type<Chunk>, std::move(chunk));
        }
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate chunk list");
    }
    return Ok(std::move(any));
}

} // namespace chunk_variants_impl

inline Result<Tiling<AnyChunk>> get_intersecting_any(
    VariantKind kind,
    int64_t origin_x,
    int64_t origin_y,
    int64_t extent_x,
    int64_t extent_y,
    const BoardInfo* board) noexcept {

    using chunk_variants_impl::widen;
    switch (kind) {
        case VariantKind::BigChunk:
            return widen(BigChunk::get_intersecting(origin_x, origin_y, extent_x, extent_y));
        case VariantKind::BigChunkVariantB:
            return widen(BigChunkVariantB::get_intersecting(origin_x, origin_y, extent_x, extent_y));
        case VariantKind::ChunkPz:
            return widen(ChunkPz::get_intersecting(origin_x, origin_y, extent_x, extent_y));
        case VariantKind::ChunkPzi:
            return widen(ChunkPzi::get_intersecting(origin_x, origin_y, extent_x, extent_y));
        case VariantKind::BoundedBoard:
            if (board != nullptr) {
                return widen(BoundedBoard::get_intersecting(*board, origin_x, origin_y, extent_x, extent_y));
            }
            return widen(BoundedBoard::get_intersecting(origin_x, origin_y, extent_x, extent_y));
    }
    return Err(Error::Code::InvalidArgument, "Unknown chunk variant");
}

inline AnyChunk make_chunk(VariantKind kind, ChunkCoord coord) noexcept {
    switch (kind) {
        case VariantKind::BigChunk:
            return AnyChunk{std::in_place_type<BigChunk>, coord};
        case VariantKind::BigChunkVariantB:
            return AnyChunk{std::in_place_type<BigChunkVariantB>, coord};
        case VariantKind::ChunkPz:
            return AnyChunk{std::in_place_type<ChunkPz>, coord};
        case VariantKind::ChunkPzi:
            return AnyChunk{std::in_place_type<ChunkPzi>, coord};
        case VariantKind::BoundedBoard:
            break;
    }
    return AnyChunk{std::in_place_type<BoundedBoard>};
}

inline VariantKind kind_of(const AnyChunk& chunk) noexcept {
    return std::visit([](const auto& c) noexcept { return std::decay_t<decltype(c)>::kind; }, chunk);
}

inline ChunkKey key_of(const AnyChunk& chunk) noexcept {
    return std::visit([](const auto& c) noexcept { return c.key(); }, chunk);
}

inline PixelOrigin pixel_origin_of(const AnyChunk& chunk) noexcept {
    return std::visit([](const auto& c) noexcept { return c.pixel_origin(); }, chunk);
}

inline Result<TileSize> tile_size_of(const AnyChunk& chunk) noexcept {
    return std::visit([](const auto& c) noexcept -> Result<TileSize> { return c.tile_size(); }, chunk);
}

inline bool is_in_bounds(const AnyChunk& chunk) noexcept {
    return std::visit([](const auto& c) noexcept { return c.is_in_bounds(); }, chunk);
}

inline Result<RequestDescriptor> request_descriptor(
    const AnyChunk& chunk,
    const ServiceEndpoints& endpoints) noexcept {
    return std::visit([&endpoints](const auto& c) noexcept { return c.request_descriptor(endpoints); }, chunk);
}

inline Result<void> load(
    AnyChunk& chunk,
    std::span<const std::byte> payload,
    const PaletteSet& palette_set) noexcept {
    return std::visit([&](auto& c) noexcept {
        return c.load(payload, palette_set.for_kind(std::decay_t<decltype(c)>::kind));
    }, chunk);
}

inline const std::shared_ptr<const RasterTile>& raster_of(const AnyChunk& chunk) noexcept {
    return std::visit([](const auto& c) noexcept -> const std::shared_ptr<const RasterTile>& {
        return c.raster();
    }, chunk);
}

inline bool is_loaded(const AnyChunk& chunk) noexcept {
    return raster_of(chunk) != nullptr;
}

inline void set_raster(AnyChunk& chunk, std::shared_ptr<const RasterTile> raster) noexcept {
    std::visit([&raster](auto& c) noexcept { c.set_raster(std::move(raster)); }, chunk);
}

} // namespace canvaschunk
