#pragma once

/// @file palettes.hpp
/// @brief Default color tables for the supported services
///
/// These tables are plain lookup data. Callers that track a service whose
/// palette changed can build their own Palette and point a PaletteSet at it.

#include "types/chunk_key.hpp"
#include "types/palette.hpp"

namespace canvaschunk {

namespace palettes {

/// pixelcanvas.io (BigChunk)
inline constexpr Palette pixelcanvas{{
    {0xFF, 0xFF, 0xFF}, {0xE4, 0xE4, 0xE4}, {0x88, 0x88, 0x88}, {0x22, 0x22, 0x22},
    {0xFF, 0xA7, 0xD1}, {0xE5, 0x00, 0x00}, {0xE5, 0x95, 0x00}, {0xA0, 0x6A, 0x42},
    {0xE5, 0xD9, 0x00}, {0x94, 0xE0, 0x44}, {0x02, 0xBE, 0x01}, {0x00, 0xD3, 0xDD},
    {0x00, 0x83, 0xC7}, {0x00, 0x00, 0xEA}, {0xCF, 0x6E, 0xE4}, {0x82, 0x00, 0x80}
}, Palette::Fill::Repeat};

/// pixelplace.fun (BigChunkVariantB); only the first 16 entries are reachable from 4-bit data
inline constexpr Palette pixelplace{{
    {0xFF, 0xFF, 0xFF}, {0xC4, 0xC4, 0xC4}, {0x88, 0x88, 0x88}, {0x55, 0x55, 0x55},
    {0x22, 0x22, 0x22}, {0x00, 0x00, 0x00}, {0x00, 0x66, 0x00}, {0x22, 0xB1, 0x4C},
    {0x02, 0xBE, 0x01}, {0x51, 0xE1, 0x19}, {0x94, 0xE0, 0x44}, {0xFB, 0xFF, 0x5B},
    {0xE5, 0xD9, 0x00}, {0xE6, 0xBE, 0x0C}, {0xE5, 0x95, 0x00}, {0xA0, 0x6A, 0x42},
    {0x99, 0x53, 0x0D}, {0x63, 0x3C, 0x1F}, {0x6B, 0x00, 0x00}, {0x9E, 0x00, 0x00},
    {0xE5, 0x00, 0x00}, {0xFF, 0x39, 0x04}, {0xBB, 0x4F, 0x00}, {0xFF, 0x75, 0x5F},
    {0xFF, 0xC4, 0x9F}, {0xFF, 0xDF, 0xCC}, {0xFF, 0xA7, 0xD1}, {0xCF, 0x6E, 0xE4},
    {0xEC, 0x08, 0xEC}, {0x82, 0x00, 0x80}, {0x51, 0x00, 0xFF}, {0x02, 0x07, 0x63},
    {0x00, 0x00, 0xEA}, {0x04, 0x4B, 0xFF}, {0x65, 0x83, 0xCF}, {0x36, 0xBA, 0xFF},
    {0x00, 0x83, 0xC7}, {0x00, 0xD3, 0xDD}, {0x45, 0xFF, 0xC8}
}, Palette::Fill::Repeat};

/// pixelzone.io (ChunkPz, ChunkPzi)
inline constexpr Palette pixelzone{{
    {0x26, 0x26, 0x26}, {0x00, 0x00, 0x00}, {0x80, 0x80, 0x80}, {0xFF, 0xFF, 0xFF},
    {0x99, 0x62, 0x2B}, {0xFF, 0xC4, 0x99}, {0x99, 0x00, 0x00}, {0xFF, 0x00, 0x00},
    {0xFF, 0x99, 0x00}, {0xFF, 0xFF, 0x00}, {0x00, 0x99, 0x00}, {0x00, 0xFF, 0x00},
    {0x00, 0x00, 0x99}, {0x00, 0x00, 0xFF}, {0x99, 0x00, 0x99}, {0xFF, 0x00, 0xFF}
}, Palette::Fill::Repeat};

/// pxls.space (BoundedBoard); index 255 marks unplaceable pixels and stays black
inline constexpr Palette pxls{{
    {0xFF, 0xFF, 0xFF}, {0xCD, 0xCD, 0xCD}, {0x88, 0x88, 0x88}, {0x55, 0x55, 0x55},
    {0x22, 0x22, 0x22}, {0x00, 0x00, 0x00}, {0xFF, 0xA7, 0xD1}, {0xE5, 0x00, 0x00},
    {0x80, 0x00, 0x00}, {0xFF, 0xDD, 0xCA}, {0xE5, 0x95, 0x00}, {0xA0, 0x6A, 0x42},
    {0xE5, 0xD9, 0x00}, {0x94, 0xE0, 0x44}, {0x02, 0xBE, 0x01}, {0x00, 0x5F, 0x00},
    {0x00, 0xD3, 0xDD}, {0x00, 0x83, 0xC7}, {0x00, 0x00, 0xEA}, {0xCF, 0x6E, 0xE4},
    {0x82, 0x00, 0x80}
}, Palette::Fill::Pad};

} // namespace palettes

/// @brief Which palette each variant decodes with
/// @note Holds non-owning pointers; the pointed-to palettes must outlive every decode
struct PaletteSet {
    const Palette* big_chunk = &palettes::pixelcanvas;
    const Palette* big_chunk_variant_b = &palettes::pixelplace;
    const Palette* chunk_pz = &palettes::pixelzone;
    const Palette* chunk_pzi = &palettes::pixelzone;
    const Palette* bounded_board = &palettes::pxls;

    [[nodiscard]] const Palette& for_kind(VariantKind kind) const noexcept {
        switch (kind) {
            case VariantKind::BigChunk: return *big_chunk;
            case VariantKind::BigChunkVariantB: return *big_chunk_variant_b;
            case VariantKind::ChunkPz: return *chunk_pz;
            case VariantKind::ChunkPzi: return *chunk_pzi;
            case VariantKind::BoundedBoard: return *bounded_board;
        }
        return *big_chunk;
    }

    [[nodiscard]] bool operator==(const PaletteSet&) const noexcept = default;
};

} // namespace canvaschunk
