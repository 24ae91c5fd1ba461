// This file contains the implementation of the socket-served chunks.
// Do not include this file directly - it is included by chunk_pz.hpp

#pragma once

#include <cstddef>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../../compressors/compressor_lz4.hpp"
#include "../../compressors/compressor_lzstring.hpp"
#include "../../decoders/json_byte_list.hpp"
#include "../../decoders/packed_pixels.hpp"
#include "../../decompressors/decompressor_lz4.hpp"
#include "../../decompressors/decompressor_lzstring.hpp"

#ifndef CANVASCHUNK_CHUNK_PZ_HEADER
#include "../chunk_pz.hpp" // for linters
#endif

namespace canvaschunk {

namespace chunk_pz_impl {

/// Prefix a stage error with the stage name, keeping its code
[[nodiscard]] inline Error stage_error(const char* stage, const Error& error) {
    return Err(error.code, std::string("ChunkPz ") + stage + " stage: " + error.message);
}

} // namespace chunk_pz_impl

inline Result<RequestDescriptor> ChunkPz::request_descriptor(
    const ServiceEndpoints& /*endpoints*/) const noexcept {

    if (!is_in_bounds()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "ChunkPz (" + std::to_string(coord_.x) + ", " +
                   std::to_string(coord_.y) + ") is outside the canvas");
    }

    try {
        return Ok(RequestDescriptor{SocketMessage{
            "42[\"r\", {\"cx\": " + std::to_string(coord_.x) +
            ", \"cy\": " + std::to_string(coord_.y) + "}]"
        }});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to build socket message");
    }
}

inline Result<RasterTile> ChunkPz::decode(
    std::string_view text,
    const Palette& palette,
    PixelOrigin origin) noexcept {

    try {
        const LZStringDecompressor string_codec{};
        auto list_text = string_codec.decompress_from_base64_utf8(text);
        if (!list_text) {
            return chunk_pz_impl::stage_error("string", list_text.error());
        }

        auto frame = parse_json_byte_list(list_text.value());
        if (!frame) {
            return chunk_pz_impl::stage_error("byte list", frame.error());
        }

        const Lz4FrameDecompressor block_codec{};
        auto raw = block_codec.decompress(std::span<const std::byte>(frame.value()));
        if (!raw) {
            return chunk_pz_impl::stage_error("block", raw.error());
        }

        constexpr uint32_t side = geometry.size;
        auto indices = unpack_4bit(raw.value(), side, side);
        if (!indices) {
            return chunk_pz_impl::stage_error("unpack", indices.error());
        }

        return RasterTile::create(side, side, ColorMode::Indexed8,
                                  std::move(indices).value(), &palette, origin);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while decoding ChunkPz payload");
    }
}

inline Result<std::string> ChunkPz::encode(std::span<const std::byte> raw) noexcept {
    if (raw.size() != raw_size) [[unlikely]] {
        return Err(Error::Code::InvalidArgument,
                   "ChunkPz raw buffer has " + std::to_string(raw.size()) +
                   " bytes, expected " + std::to_string(raw_size));
    }

    const Lz4FrameCompressor block_codec{};
    std::vector<std::byte> frame;
    auto written = block_codec.compress(frame, 0, raw);
    if (!written) {
        return written.error();
    }
    frame.resize(written.value());

    auto list_text = format_json_byte_list(frame);
    if (!list_text) {
        return list_text.error();
    }

    const LZStringCompressor string_codec{};
    return string_codec.compress_to_base64(std::string_view(list_text.value()));
}

} // namespace canvaschunk
