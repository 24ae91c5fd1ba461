#pragma once

/**
 * @file bounded_board.hpp
 * @brief Whole-board chunk of a finite canvas
 *
 * The bounded service serves its entire board as one raw buffer, so the
 * "grid" has a single chunk at (0, 0) whose size is only known at runtime.
 * The board metadata (BoardInfo) must be supplied with set_board_info()
 * before the chunk is sized or decoded; until then tile_size() and load()
 * fail with NotConfigured.
 *
 * The board is not requested per chunk: the caller fetches it as a single
 * resource, so request_descriptor() is NoRequest.
 *
 * ## Payload format
 *
 * width × height bytes, one palette index per pixel, row-major, no padding.
 * The raster stays indexed.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include "chunk_common.hpp"
#include "../config.hpp"
#include "../palettes.hpp"
#include "../raster_tile.hpp"
#include "../tiling.hpp"
#include "../types/request.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

class BoundedBoard : public ChunkState {
public:
    static constexpr VariantKind kind = VariantKind::BoundedBoard;

    BoundedBoard() noexcept : ChunkState(0, 0) {}
    explicit BoundedBoard(const BoardInfo& info) noexcept : ChunkState(0, 0), info_(info) {}

    /// @brief Supply the board metadata; replaces any previous metadata
    void set_board_info(const BoardInfo& info) noexcept { info_ = info; }

    [[nodiscard]] const std::optional<BoardInfo>& board_info() const noexcept { return info_; }

    [[nodiscard]] bool is_configured() const noexcept { return info_.has_value(); }

    [[nodiscard]] ChunkKey key() const noexcept { return ChunkKey{kind, 0, 0}; }

    [[nodiscard]] PixelOrigin pixel_origin() const noexcept { return PixelOrigin{0, 0}; }

    /// @retval NotConfigured Board metadata never supplied
    [[nodiscard]] Result<TileSize> tile_size() const noexcept;

    [[nodiscard]] bool is_in_bounds() const noexcept { return true; }

    /// @brief Always NoRequest
    [[nodiscard]] Result<RequestDescriptor> request_descriptor(
        const ServiceEndpoints& /*endpoints*/ = {}) const noexcept {
        return Ok(RequestDescriptor{NoRequest{}});
    }

    /// Palette used when the caller supplies none. A palette listed in the board
    /// metadata is not applied implicitly: pass `board_info()->palette` to load().
    [[nodiscard]] static const Palette& default_palette() noexcept { return palettes::pxls; }

    /// @retval NotConfigured Board metadata never supplied
    /// @retval DecodeError Payload is not exactly width × height bytes
    /// @note @p palette is borrowed and must outlive the raster
    [[nodiscard]] Result<void> load(std::span<const std::byte> payload, const Palette& palette) noexcept;

    /// @brief Decode with a palette the raster co-owns, such as the one in BoardInfo
    /// @retval InvalidArgument @p palette is null
    [[nodiscard]] Result<void> load(std::span<const std::byte> payload,
                                    std::shared_ptr<const Palette> palette) noexcept;

    [[nodiscard]] Result<void> load(std::span<const std::byte> payload) noexcept {
        return load(payload, default_palette());
    }

    /// @brief One unconfigured board, shape (1, 1), whatever the rectangle
    [[nodiscard]] static Result<Tiling<BoundedBoard>> get_intersecting(
        int64_t origin_x, int64_t origin_y, int64_t extent_x, int64_t extent_y) noexcept;

    /// @brief One board configured with @p info, shape (1, 1), whatever the rectangle
    [[nodiscard]] static Result<Tiling<BoundedBoard>> get_intersecting(
        const BoardInfo& info,
        int64_t origin_x, int64_t origin_y, int64_t extent_x, int64_t extent_y) noexcept;

    [[nodiscard]] bool operator==(const BoundedBoard&) const noexcept { return true; }

private:
    [[nodiscard]] Result<std::vector<uint8_t>> read_indices(std::span<const std::byte> payload) const noexcept;

    std::optional<BoardInfo> info_;
};

} // namespace canvaschunk

#define CANVASCHUNK_BOUNDED_BOARD_HEADER
#include "impl/bounded_board_impl.hpp"

static_assert(canvaschunk::ChunkVariant<canvaschunk::BoundedBoard>, "BoundedBoard must satisfy ChunkVariant concept");
