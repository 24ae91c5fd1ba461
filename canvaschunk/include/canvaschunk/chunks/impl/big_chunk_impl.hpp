// This file contains the implementation of the big-canvas chunks.
// Do not include this file directly - it is included by big_chunk.hpp

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <utility>
#include <vector>
#include "../../decoders/packed_pixels.hpp"

#ifndef CANVASCHUNK_BIG_CHUNK_HEADER
#include "../big_chunk.hpp" // for linters
#endif

namespace canvaschunk {

template <VariantKind Kind>
Result<RequestDescriptor> BigChunkT<Kind>::request_descriptor(
    const ServiceEndpoints& endpoints) const noexcept {

    if (!is_in_bounds()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   std::string(to_string(kind)) + " (" + std::to_string(coord_.x) + ", " +
                   std::to_string(coord_.y) + ") is outside the canvas");
    }

    try {
        const std::string& prefix = (Kind == VariantKind::BigChunk)
            ? endpoints.big_chunk_prefix : endpoints.big_chunk_variant_b_prefix;
        const std::string& suffix = (Kind == VariantKind::BigChunk)
            ? endpoints.big_chunk_suffix : endpoints.big_chunk_variant_b_suffix;

        return Ok(RequestDescriptor{HttpGet{
            prefix + std::to_string(coord_.x * blocks_per_side) + "." +
            std::to_string(coord_.y * blocks_per_side) + suffix
        }});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to build request URL");
    }
}

template <VariantKind Kind>
Result<RasterTile> BigChunkT<Kind>::decode(
    std::span<const std::byte> payload,
    const Palette& palette,
    PixelOrigin origin) noexcept {

    if (payload.size() != payload_size) [[unlikely]] {
        return Err(Error::Code::DecodeError,
                   std::string(to_string(kind)) + " payload has " + std::to_string(payload.size()) +
                   " bytes, expected " + std::to_string(payload_size));
    }

    constexpr uint32_t side = geometry.size;
    std::vector<uint8_t> rgb;
    try {
        rgb.resize(required_buffer_size(ColorMode::RGB8, side, side));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate big chunk raster");
    }

    const Rgb background = palette[background_index];
    for (std::size_t i = 0; i < rgb.size(); i += 3) {
        rgb[i] = background.r;
        rgb[i + 1] = background.g;
        rgb[i + 2] = background.b;
    }

    auto on_canvas = [](int64_t p) noexcept {
        return p >= -canvas_limit && p < canvas_limit;
    };

    constexpr std::size_t block_row_bytes = block_size / 2;
    std::array<uint8_t, block_size> indices{};
    const std::byte* block = payload.data();

    for (uint32_t cy = 0; cy < side; cy += block_size) {
        for (uint32_t cx = 0; cx < side; cx += block_size, block += block_bytes) {
            if (!on_canvas(origin.x + cx) || !on_canvas(origin.y + cy)) {
                continue;
            }

            for (uint32_t row = 0; row < block_size; ++row) {
                unpack_4bit_row(block + row * block_row_bytes, indices.data(), block_size);
                uint8_t* dst = rgb.data() + (static_cast<std::size_t>(cy + row) * side + cx) * 3;
                for (uint8_t index : indices) {
                    const Rgb& c = palette[index];
                    *dst++ = c.r;
                    *dst++ = c.g;
                    *dst++ = c.b;
                }
            }
        }
    }

    return RasterTile::create(side, side, ColorMode::RGB8, std::move(rgb), nullptr, origin);
}

} // namespace canvaschunk
