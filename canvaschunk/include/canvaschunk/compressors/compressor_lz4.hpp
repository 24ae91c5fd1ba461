#pragma once

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

/// RAII wrapper for an LZ4 frame compression context
/// Context is allocated lazily on first use
///
/// Produces a single frame with the content size recorded in the header,
/// which is what the socket service sends and what Lz4FrameDecompressor expects.
class Lz4FrameCompressor {
private:
    struct Lz4ContextDeleter {
        void operator()(LZ4F_cctx* ctx) const noexcept {
            if (ctx) {
                LZ4F_freeCompressionContext(ctx);
            }
        }
    };

    mutable std::unique_ptr<LZ4F_cctx, Lz4ContextDeleter> context_;
    int compression_level_;

    /// Ensure context is initialized (lazy initialization)
    [[nodiscard]] Result<LZ4F_cctx*> ensure_context() const noexcept {
        if (!context_) {
            LZ4F_cctx* ctx = nullptr;
            const LZ4F_errorCode_t code = LZ4F_createCompressionContext(&ctx, LZ4F_VERSION);
            if (LZ4F_isError(code) || ctx == nullptr) {
                return Err(Error::Code::MemoryError,
                           "Failed to create LZ4 compression context");
            }
            context_.reset(ctx);
        }
        return Ok(context_.get());
    }

    [[nodiscard]] LZ4F_preferences_t preferences(std::size_t input_size) const noexcept {
        LZ4F_preferences_t prefs{};
        prefs.frameInfo.contentSize = static_cast<unsigned long long>(input_size);
        prefs.compressionLevel = compression_level_;
        return prefs;
    }

    [[nodiscard]] static Error frame_error(std::size_t code) {
        return Err(Error::Code::CompressionError,
                   std::string("LZ4 frame compression failed: ") + LZ4F_getErrorName(code));
    }

public:
    /// @param level Compression level (0 = fast default, up to LZ4HC levels)
    explicit Lz4FrameCompressor(int level = 0) noexcept
        : compression_level_(level) {}

    ~Lz4FrameCompressor() = default;

    // Non-copyable
    Lz4FrameCompressor(const Lz4FrameCompressor&) = delete;
    Lz4FrameCompressor& operator=(const Lz4FrameCompressor&) = delete;

    // Movable
    Lz4FrameCompressor(Lz4FrameCompressor&&) noexcept = default;
    Lz4FrameCompressor& operator=(Lz4FrameCompressor&&) noexcept = default;

    /// Compress @p input as one LZ4 frame
    /// @param output Output vector - will be resized if needed
    /// @param offset Starting position in output vector
    /// @param input Input data to compress
    /// @return Number of bytes written
    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        auto ctx_result = ensure_context();
        if (!ctx_result) {
            return Err(ctx_result.error().code, ctx_result.error().message);
        }

        const LZ4F_preferences_t prefs = preferences(input.size());
        const std::size_t required_size = offset + LZ4F_compressFrameBound(input.size(), &prefs);
        if (output.size() < required_size) {
            try {
                output.resize(required_size);
            } catch (const std::bad_alloc&) {
                return Err(Error::Code::MemoryError,
                           "Failed to resize output buffer");
            }
        }

        std::byte* dst = output.data() + offset;
        const std::size_t capacity = output.size() - offset;
        std::size_t written = 0;

        const std::size_t header = LZ4F_compressBegin(ctx_result.value(), dst, capacity, &prefs);
        if (LZ4F_isError(header)) {
            return frame_error(header);
        }
        written += header;

        const std::size_t body = LZ4F_compressUpdate(
            ctx_result.value(), dst + written, capacity - written,
            input.data(), input.size(), nullptr);
        if (LZ4F_isError(body)) {
            return frame_error(body);
        }
        written += body;

        const std::size_t footer = LZ4F_compressEnd(
            ctx_result.value(), dst + written, capacity - written, nullptr);
        if (LZ4F_isError(footer)) {
            return frame_error(footer);
        }
        written += footer;

        return Ok(written);
    }

    [[nodiscard]] int get_level() const noexcept {
        return compression_level_;
    }
};

} // namespace canvaschunk
