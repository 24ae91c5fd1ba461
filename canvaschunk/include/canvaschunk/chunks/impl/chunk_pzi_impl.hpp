// This file contains the implementation of the PNG-served chunks.
// Do not include this file directly - it is included by chunk_pzi.hpp

#pragma once

#include <new>
#include <string>
#include <utility>
#include "../../decoders/image_container.hpp"

#ifndef CANVASCHUNK_CHUNK_PZI_HEADER
#include "../chunk_pzi.hpp" // for linters
#endif

namespace canvaschunk {

inline Result<RequestDescriptor> ChunkPzi::request_descriptor(
    const ServiceEndpoints& endpoints) const noexcept {

    if (!is_in_bounds()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "ChunkPzi (" + std::to_string(coord_.x) + ", " +
                   std::to_string(coord_.y) + ") is outside the canvas");
    }

    try {
        return Ok(RequestDescriptor{HttpGet{
            endpoints.chunk_pzi_prefix + std::to_string(coord_.x) + "." +
            std::to_string(coord_.y) + endpoints.chunk_pzi_suffix
        }});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to build request URL");
    }
}

inline Result<RasterTile> ChunkPzi::decode(
    std::span<const std::byte> payload,
    PixelOrigin origin) noexcept {

    auto image = decode_image_container(payload);
    if (!image) {
        return image.error();
    }

    constexpr uint32_t side = geometry.size;
    if (image.value().width != side || image.value().height != side) [[unlikely]] {
        return Err(Error::Code::DecodeError,
                   "ChunkPzi image is " + std::to_string(image.value().width) + "x" +
                   std::to_string(image.value().height) + ", expected " +
                   std::to_string(side) + "x" + std::to_string(side));
    }

    return RasterTile::create(side, side, ColorMode::RGB8,
                              std::move(image.value().rgb), nullptr, origin);
}

} // namespace canvaschunk
