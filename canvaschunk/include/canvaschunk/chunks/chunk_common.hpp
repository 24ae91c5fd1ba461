#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>
#include "../config.hpp"
#include "../raster_tile.hpp"
#include "../tiling.hpp"
#include "../types/chunk_key.hpp"
#include "../types/palette.hpp"
#include "../types/request.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

/// Concept for one backend service's chunk type
/// Coordinate math, bounds and request building must be pure and callable
/// from any thread; load() mutates only the chunk it is called on.
template <typename T>
concept ChunkVariant = requires(const T chunk,
                                T& mutable_chunk,
                                std::span<const std::byte> payload,
                                const Palette& palette,
                                const ServiceEndpoints& endpoints,
                                int64_t v) {
    { T::kind } -> std::convertible_to<VariantKind>;

    { chunk.coord() } -> std::same_as<ChunkCoord>;
    { chunk.key() } -> std::same_as<ChunkKey>;
    { chunk.pixel_origin() } -> std::same_as<PixelOrigin>;
    { chunk.is_in_bounds() } -> std::same_as<bool>;
    { chunk.request_descriptor(endpoints) } -> std::same_as<Result<RequestDescriptor>>;

    // Decode a payload into the chunk's raster; a failure leaves the chunk unchanged
    { mutable_chunk.load(payload, palette) } -> std::same_as<Result<void>>;
    { T::default_palette() } -> std::same_as<const Palette&>;

    { chunk.is_loaded() } -> std::same_as<bool>;
    { chunk.raster() } -> std::same_as<const std::shared_ptr<const RasterTile>&>;

    { T::get_intersecting(v, v, v, v) } -> std::same_as<Result<Tiling<T>>>;

    requires std::is_nothrow_move_constructible_v<T>;
};

/// State every chunk carries: its grid coordinate and, once decoded, its raster
/// The raster is shared so that a cache and several chunks may hold the same tile
class ChunkState {
public:
    ChunkState(int64_t x, int64_t y) noexcept
        : coord_{x, y} {}

    [[nodiscard]] ChunkCoord coord() const noexcept { return coord_; }
    [[nodiscard]] int64_t x() const noexcept { return coord_.x; }
    [[nodiscard]] int64_t y() const noexcept { return coord_.y; }

    /// Decoded raster, or null while the chunk is pending
    [[nodiscard]] const std::shared_ptr<const RasterTile>& raster() const noexcept { return raster_; }

    [[nodiscard]] bool is_loaded() const noexcept { return raster_ != nullptr; }

    /// Attach an already decoded raster (e.g. from a cache)
    void set_raster(std::shared_ptr<const RasterTile> raster) noexcept { raster_ = std::move(raster); }

    /// Drop the raster and return to the pending state
    void reset() noexcept { raster_.reset(); }

protected:
    /// Store a decode result; an error leaves the previous raster in place
    [[nodiscard]] Result<void> adopt(Result<RasterTile>&& decoded) noexcept {
        if (!decoded) {
            return decoded.error();
        }
        try {
            raster_ = std::make_shared<const RasterTile>(std::move(decoded).value());
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate raster tile");
        }
        return Ok();
    }

    ChunkCoord coord_;
    std::shared_ptr<const RasterTile> raster_;
};

} // namespace canvaschunk
