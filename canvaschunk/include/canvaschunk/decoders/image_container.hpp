#pragma once

#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <vector>
#include <png.h>
#include "../types/result.hpp"

namespace canvaschunk {

/// @brief Whole image decoded to RGB-8
struct DecodedImage {
    uint32_t width{0};
    uint32_t height{0};
    std::vector<uint8_t> rgb;  ///< width × height × 3 bytes, row-major
};

namespace image_container_impl {

/// Releases libpng's read state unless the read completed
struct PngImageGuard {
    png_image* image;

    ~PngImageGuard() {
        if (image != nullptr) {
            png_image_free(image);
        }
    }
};

} // namespace image_container_impl

/// @brief Decode a PNG byte stream into RGB-8
///
/// Any color type and bit depth is accepted; palette, gray and 16-bit images
/// are converted by libpng. An alpha channel is composited over black.
///
/// @retval DecodeError Not a PNG, or a corrupt or truncated stream
/// @retval MemoryError Allocation failed
[[nodiscard]] inline Result<DecodedImage> decode_image_container(
    std::span<const std::byte> data) noexcept {

    png_image image{};
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, data.data(), data.size())) {
        return Err(Error::Code::DecodeError,
                   std::string("Image container header unreadable: ") + image.message);
    }
    image_container_impl::PngImageGuard guard{&image};

    image.format = PNG_FORMAT_RGB;

    DecodedImage out;
    out.width = image.width;
    out.height = image.height;
    try {
        out.rgb.resize(PNG_IMAGE_SIZE(image));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate decoded image");
    }

    const png_color black{0, 0, 0};
    const int ok = png_image_finish_read(&image, &black, out.rgb.data(), 0, nullptr);
    // finish_read releases the read state on success and failure
    guard.image = nullptr;
    if (!ok) {
        return Err(Error::Code::DecodeError,
                   std::string("Image container decode failed: ") + image.message);
    }

    return Ok(std::move(out));
}

} // namespace canvaschunk
