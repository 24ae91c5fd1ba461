#pragma once

#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <vector>
#include "../raster_tile.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

/// @brief Unpack one row of 4-bit indices, high nibble first
/// @param src Packed row, at least ceil(width / 2) bytes
/// @param dst Destination, at least width bytes
inline void unpack_4bit_row(const std::byte* src, uint8_t* dst, uint32_t width) noexcept {
    uint32_t x = 0;
    for (; x + 1 < width; x += 2) {
        const auto v = static_cast<uint8_t>(*src++);
        dst[x] = static_cast<uint8_t>(v >> 4);
        dst[x + 1] = static_cast<uint8_t>(v & 0x0F);
    }
    if (x < width) {
        dst[x] = static_cast<uint8_t>(static_cast<uint8_t>(*src) >> 4);
    }
}

/// @brief Expand a 4-bit packed raster into one palette index per byte
/// @param packed ceil(width / 2) × height bytes, rows byte aligned
/// @return width × height indices
/// @retval DecodeError @p packed length does not match the dimensions
/// @retval MemoryError Allocation failed
[[nodiscard]] inline Result<std::vector<uint8_t>> unpack_4bit(
    std::span<const std::byte> packed,
    uint32_t width,
    uint32_t height) noexcept {

    const std::size_t expected = required_buffer_size(ColorMode::PackedIndexed4, width, height);
    if (packed.size() != expected) [[unlikely]] {
        return Err(Error::Code::DecodeError,
                   "Packed 4-bit buffer has " + std::to_string(packed.size()) +
                   " bytes, expected " + std::to_string(expected));
    }

    std::vector<uint8_t> indices;
    try {
        indices.resize(static_cast<std::size_t>(width) * height);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate unpacked buffer");
    }

    const std::size_t row_bytes = (static_cast<std::size_t>(width) + 1) / 2;
    for (uint32_t y = 0; y < height; ++y) {
        unpack_4bit_row(packed.data() + y * row_bytes,
                        indices.data() + static_cast<std::size_t>(y) * width,
                        width);
    }
    return Ok(std::move(indices));
}

} // namespace canvaschunk
