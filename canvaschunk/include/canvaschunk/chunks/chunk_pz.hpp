#pragma once

/**
 * @file chunk_pz.hpp
 * @brief 512×512 chunks requested over the socket connection
 *
 * The canvas is a 16×16 grid of chunks centered on the origin
 * (chunk (0, 0) starts at pixel (-4096, -4096)).
 *
 * ## Payload format
 *
 * The response carries the chunk as text, produced by stacking four encodings.
 * Decoding undoes them in this exact order:
 * 1. LZString base64 text → plain text
 * 2. plain text, a comma separated list of byte values → bytes
 * 3. bytes, one LZ4 frame → raw buffer
 * 4. raw buffer, 512×512 4-bit palette indices (high nibble first) → Indexed8 raster
 *
 * Each stage is a separate function (see decoders/ and compressors/) so
 * that it can be fed its own fixture. A failure in any stage is a DecodeError
 * for that chunk only.
 *
 * The decoded raster stays indexed and keeps a pointer to the palette it was
 * decoded with.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "chunk_common.hpp"
#include "../config.hpp"
#include "../palettes.hpp"
#include "../raster_tile.hpp"
#include "../tiling.hpp"
#include "../types/request.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

class ChunkPz : public ChunkState {
public:
    static constexpr VariantKind kind = VariantKind::ChunkPz;
    static constexpr GridGeometry geometry{512, 4096, 0, 16};

    /// Size of the raw buffer after LZ4 decompression
    static constexpr std::size_t raw_size = 512 * 512 / 2;

    ChunkPz(int64_t x, int64_t y) noexcept : ChunkState(x, y) {}
    explicit ChunkPz(ChunkCoord coord) noexcept : ChunkState(coord.x, coord.y) {}

    [[nodiscard]] ChunkKey key() const noexcept { return ChunkKey{kind, coord_.x, coord_.y}; }

    [[nodiscard]] PixelOrigin pixel_origin() const noexcept { return geometry.origin_of(coord_); }

    [[nodiscard]] static constexpr TileSize tile_size() noexcept { return geometry.tile_size(); }

    [[nodiscard]] bool is_in_bounds() const noexcept { return geometry.contains(coord_); }

    /// @brief Socket message requesting the chunk: `42["r", {"cx": X, "cy": Y}]`
    /// @param endpoints Unused, the socket protocol has no per-chunk address
    /// @retval OutOfBounds Chunk outside the canvas
    [[nodiscard]] Result<RequestDescriptor> request_descriptor(
        const ServiceEndpoints& endpoints = {}) const noexcept;

    [[nodiscard]] static const Palette& default_palette() noexcept { return palettes::pixelzone; }

    /// @brief Decode the text content of the response message and store the raster
    /// @param payload Message text as bytes
    [[nodiscard]] Result<void> load(std::span<const std::byte> payload, const Palette& palette) noexcept {
        return load_text(std::string_view(reinterpret_cast<const char*>(payload.data()), payload.size()),
                         palette);
    }

    [[nodiscard]] Result<void> load(std::span<const std::byte> payload) noexcept {
        return load(payload, default_palette());
    }

    [[nodiscard]] Result<void> load_text(std::string_view text, const Palette& palette) noexcept {
        return adopt(decode(text, palette, pixel_origin()));
    }

    /// @brief Run the four decode stages on a message text
    [[nodiscard]] static Result<RasterTile> decode(
        std::string_view text,
        const Palette& palette,
        PixelOrigin origin) noexcept;

    /// @brief Inverse of decode(): encode a 4-bit packed raw buffer as message text
    /// @param raw raw_size bytes of packed palette indices
    /// @retval InvalidArgument @p raw is not raw_size bytes
    /// @retval CompressionError LZ4 compression failed
    [[nodiscard]] static Result<std::string> encode(std::span<const std::byte> raw) noexcept;

    [[nodiscard]] static Result<Tiling<ChunkPz>> get_intersecting(
        int64_t origin_x, int64_t origin_y, int64_t extent_x, int64_t extent_y) noexcept {
        return tile_rect<ChunkPz>(geometry, origin_x, origin_y, extent_x, extent_y);
    }

    [[nodiscard]] bool operator==(const ChunkPz& other) const noexcept {
        return coord_ == other.coord_;
    }
};

} // namespace canvaschunk

#define CANVASCHUNK_CHUNK_PZ_HEADER
#include "impl/chunk_pz_impl.hpp"

static_assert(canvaschunk::ChunkVariant<canvaschunk::ChunkPz>, "ChunkPz must satisfy ChunkVariant concept");
