#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace canvaschunk {

/// @brief Backend service a chunk belongs to
/// @note Closed set: adding a service means adding a chunk class and an AnyChunk alternative
enum class VariantKind : uint8_t {
    BigChunk,           ///< 960x960 big-canvas chunk (pixelcanvas)
    BigChunkVariantB,   ///< Same geometry as BigChunk, other endpoint and palette (pixelplace)
    ChunkPz,            ///< 512x512 LZString + LZ4 payload over a socket message
    ChunkPzi,           ///< 500x500 whole-image PNG over HTTP
    BoundedBoard        ///< Single board-sized chunk, size known at runtime
};

[[nodiscard]] constexpr const char* to_string(VariantKind kind) noexcept {
    switch (kind) {
        case VariantKind::BigChunk: return "BigChunk";
        case VariantKind::BigChunkVariantB: return "BigChunkVariantB";
        case VariantKind::ChunkPz: return "ChunkPz";
        case VariantKind::ChunkPzi: return "ChunkPzi";
        case VariantKind::BoundedBoard: return "BoundedBoard";
    }
    return "Unknown";
}

/// @brief Integer grid coordinate of a chunk
struct ChunkCoord {
    int64_t x{0};
    int64_t y{0};

    constexpr bool operator==(const ChunkCoord&) const noexcept = default;
};

/// @brief Pixel-space position of a chunk's top-left corner
struct PixelOrigin {
    int64_t x{0};
    int64_t y{0};

    constexpr bool operator==(const PixelOrigin&) const noexcept = default;
};

/// @brief Width and height of a chunk's raster in pixels
struct TileSize {
    uint32_t width{0};
    uint32_t height{0};

    constexpr bool operator==(const TileSize&) const noexcept = default;
};

/// @brief Identity of a chunk: variant plus grid coordinate
/// @note Chunks of different variants are never equal, even at the same coordinate
struct ChunkKey {
    VariantKind kind{VariantKind::BigChunk};
    int64_t x{0};
    int64_t y{0};

    constexpr bool operator==(const ChunkKey&) const noexcept = default;
};

/// @brief FNV-1a hash over (kind, x, y), consistent with ChunkKey equality
struct ChunkKeyHash {
    std::size_t operator()(const ChunkKey& k) const noexcept {
        uint64_t h = 14695981039346656037ULL;
        h ^= static_cast<uint64_t>(k.kind);
        h *= 1099511628211ULL;
        h ^= static_cast<uint64_t>(k.x);
        h *= 1099511628211ULL;
        h ^= static_cast<uint64_t>(k.y);
        h *= 1099511628211ULL;
        return static_cast<std::size_t>(h);
    }
};

} // namespace canvaschunk

template <>
struct std::hash<canvaschunk::ChunkKey> : canvaschunk::ChunkKeyHash {};
