#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <vector>
#include <lz4frame.h>
#include "../types/result.hpp"

namespace canvaschunk {

/// RAII wrapper for an LZ4 frame decompression context
/// Context is allocated lazily on first use and reset before every frame
///
/// Only one frame is accepted per call; bytes after the end of the frame are an error.
class Lz4FrameDecompressor {
private:
    struct Lz4ContextDeleter {
        void operator()(LZ4F_dctx* ctx) const noexcept {
            if (ctx) {
                LZ4F_freeDecompressionContext(ctx);
            }
        }
    };

    mutable std::unique_ptr<LZ4F_dctx, Lz4ContextDeleter> context_;

    /// Ensure context is initialized (lazy initialization)
    [[nodiscard]] Result<LZ4F_dctx*> ensure_context() const noexcept {
        if (!context_) {
            LZ4F_dctx* ctx = nullptr;
            const LZ4F_errorCode_t code = LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION);
            if (LZ4F_isError(code) || ctx == nullptr) {
                return Err(Error::Code::MemoryError,
                           "Failed to create LZ4 decompression context");
            }
            context_.reset(ctx);
        } else {
            LZ4F_resetDecompressionContext(context_.get());
        }
        return Ok(context_.get());
    }

    [[nodiscard]] static Error frame_error(std::size_t code) {
        return Err(Error::Code::DecodeError,
                   std::string("LZ4 frame decompression failed: ") + LZ4F_getErrorName(code));
    }

public:
    Lz4FrameDecompressor() noexcept = default;

    ~Lz4FrameDecompressor() = default;

    // Non-copyable
    Lz4FrameDecompressor(const Lz4FrameDecompressor&) = delete;
    Lz4FrameDecompressor& operator=(const Lz4FrameDecompressor&) = delete;

    // Movable
    Lz4FrameDecompressor(Lz4FrameDecompressor&&) noexcept = default;
    Lz4FrameDecompressor& operator=(Lz4FrameDecompressor&&) noexcept = default;

    /// Decompress one frame into a caller-provided buffer
    /// @return Number of bytes written to @p output
    /// @retval DecodeError Corrupt or truncated frame, trailing data, or output buffer too small
    /// @note Not thread-safe: use one decompressor per thread
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        auto ctx_result = ensure_context();
        if (!ctx_result) {
            return Err(ctx_result.error().code, ctx_result.error().message);
        }

        std::size_t in_pos = 0;
        std::size_t out_pos = 0;
        while (true) {
            std::size_t dst_size = output.size() - out_pos;
            std::size_t src_size = input.size() - in_pos;
            const std::size_t hint = LZ4F_decompress(
                ctx_result.value(),
                output.data() + out_pos, &dst_size,
                input.data() + in_pos, &src_size,
                nullptr);

            if (LZ4F_isError(hint)) {
                return frame_error(hint);
            }
            in_pos += src_size;
            out_pos += dst_size;

            if (hint == 0) {
                break;
            }
            if (src_size == 0 && dst_size == 0) {
                if (in_pos >= input.size()) {
                    return Err(Error::Code::DecodeError, "LZ4 frame is truncated");
                }
                return Err(Error::Code::DecodeError,
                           "Output buffer too small for LZ4 frame");
            }
        }

        if (in_pos != input.size()) {
            return Err(Error::Code::DecodeError, "Trailing data after LZ4 frame");
        }
        return Ok(out_pos);
    }

    /// Decompress one frame into a newly allocated buffer of the exact decoded size
    /// @retval DecodeError Corrupt or truncated frame, or trailing data
    /// @retval MemoryError Allocation failed
    [[nodiscard]] Result<std::vector<std::byte>> decompress(
        std::span<const std::byte> input) const noexcept {

        auto ctx_result = ensure_context();
        if (!ctx_result) {
            return Err(ctx_result.error().code, ctx_result.error().message);
        }

        std::vector<std::byte> output;
        try {
            output.resize(std::max<std::size_t>(64 * 1024, input.size() * 4));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate LZ4 output buffer");
        }

        std::size_t in_pos = 0;
        std::size_t out_pos = 0;
        while (true) {
            if (out_pos == output.size()) {
                try {
                    output.resize(output.size() * 2);
                } catch (const std::bad_alloc&) {
                    return Err(Error::Code::MemoryError, "Failed to grow LZ4 output buffer");
                }
            }

            std::size_t dst_size = output.size() - out_pos;
            std::size_t src_size = input.size() - in_pos;
            const std::size_t hint = LZ4F_decompress(
                ctx_result.value(),
                output.data() + out_pos, &dst_size,
                input.data() + in_pos, &src_size,
                nullptr);

            if (LZ4F_isError(hint)) {
                return frame_error(hint);
            }
            in_pos += src_size;
            out_pos += dst_size;

            if (hint == 0) {
                break;
            }
            if (src_size == 0 && dst_size == 0 && in_pos >= input.size()) {
                return Err(Error::Code::DecodeError, "LZ4 frame is truncated");
            }
        }

        if (in_pos != input.size()) {
            return Err(Error::Code::DecodeError, "Trailing data after LZ4 frame");
        }
        output.resize(out_pos);
        return Ok(std::move(output));
    }
};

} // namespace canvaschunk
