#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration: service endpoints and bounded board metadata
 *
 * Endpoints default to the public services. Every field can be overridden,
 * e.g. to point the HTTP variants at a local mirror or a recorded replay.
 *
 * BoardInfo describes the single-chunk bounded board. Its size is not a
 * compile-time constant: it is read from the service's info document
 * (a JSON object with at least "width" and "height") and handed to the
 * BoundedBoard chunk before it is tiled or decoded.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include "types/palette.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// @brief URL templates of the HTTP based services
/// @note A chunk URL is prefix + a + "." + b + suffix, with a/b the service-native indices
struct ServiceEndpoints {
    std::string big_chunk_prefix = "https://pixelcanvas.io/api/bigchunk/";
    std::string big_chunk_suffix = ".bmp";
    std::string big_chunk_variant_b_prefix = "https://pixelplace.fun/api/bigchunk/";
    std::string big_chunk_variant_b_suffix = ".bmp";
    std::string chunk_pzi_prefix = "https://pixelzone.io/api/image/";
    std::string chunk_pzi_suffix = ".png";
};

/// @brief Metadata of a bounded board
struct BoardInfo {
    uint32_t width{0};
    uint32_t height{0};
    std::shared_ptr<const Palette> palette;  ///< Set when the info document lists colors

    /// @brief Parse the service's info document
    /// @param json_text JSON object with "width", "height" and optionally "palette"
    /// @return Parsed metadata, or an error
    /// @retval DecodeError Not valid JSON, not an object, missing or non-positive dimensions,
    ///                     or a palette entry that is not a 6-digit hex color
    /// @note "palette" may be an array of "#RRGGBB"/"RRGGBB" strings or of
    ///       objects carrying the color in a "value" member; other members are ignored
    [[nodiscard]] static Result<BoardInfo> from_json(std::string_view json_text) noexcept;
};

/// @brief Parse "RRGGBB" or "#RRGGBB"
/// @retval DecodeError Malformed color string
[[nodiscard]] inline Result<Rgb> parse_hex_color(std::string_view text) noexcept;

} // namespace canvaschunk

#define CANVASCHUNK_CONFIG_HEADER
#include "impl/config_impl.hpp"
