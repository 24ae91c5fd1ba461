// This file contains the implementation of the configuration helpers.
// Do not include this file directly - it is included by config.hpp

#pragma once

#include <charconv>
#include <cstdint>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <span>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "../types/palette.hpp"
#include "../types/result.hpp"

#ifndef CANVASCHUNK_CONFIG_HEADER
#include "../config.hpp" // for linters
#endif

namespace canvaschunk {

inline Result<Rgb> parse_hex_color(std::string_view text) noexcept {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6) [[unlikely]] {
        return Err(Error::Code::DecodeError, "Color must have 6 hex digits: " + std::string(text));
    }

    uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc{} || ptr != text.data() + text.size()) [[unlikely]] {
        return Err(Error::Code::DecodeError, "Invalid hex color: " + std::string(text));
    }

    return Ok(Rgb{
        static_cast<uint8_t>((value >> 16) & 0xFF),
        static_cast<uint8_t>((value >> 8) & 0xFF),
        static_cast<uint8_t>(value & 0xFF)
    });
}

namespace config_impl {

/// Read a strictly positive dimension that fits in 32 bits
[[nodiscard]] inline Result<uint32_t> read_dimension(const nlohmann::json& doc, const char* name) {
    const auto it = doc.find(name);
    if (it == doc.end()) {
        return Err(Error::Code::DecodeError, std::string("Board info has no \"") + name + "\"");
    }
    if (!it->is_number_integer()) {
        return Err(Error::Code::DecodeError, std::string("Board info \"") + name + "\" is not an integer");
    }
    const int64_t value = it->get<int64_t>();
    if (value <= 0 || value > static_cast<int64_t>(UINT32_MAX)) {
        return Err(Error::Code::DecodeError,
                   std::string("Board info \"") + name + "\" out of range: " + std::to_string(value));
    }
    return Ok(static_cast<uint32_t>(value));
}

[[nodiscard]] inline Result<Palette> read_palette(const nlohmann::json& entries) {
    if (!entries.is_array()) {
        return Err(Error::Code::DecodeError, "Board info \"palette\" is not an array");
    }

    std::vector<Rgb> colors;
    colors.reserve(entries.size());
    for (const auto& entry : entries) {
        const nlohmann::json* color = &entry;
        if (entry.is_object()) {
            const auto it = entry.find("value");
            if (it == entry.end()) {
                return Err(Error::Code::DecodeError, "Palette entry has no \"value\"");
            }
            color = &*it;
        }
        if (!color->is_string()) {
            return Err(Error::Code::DecodeError, "Palette color is not a string");
        }
        auto rgb = parse_hex_color(color->get_ref<const std::string&>());
        if (!rgb) {
            return rgb.error();
        }
        colors.push_back(rgb.value());
    }

    return Ok(Palette(std::span<const Rgb>(colors), Palette::Fill::Pad));
}

} // namespace config_impl

inline Result<BoardInfo> BoardInfo::from_json(std::string_view json_text) noexcept {
    try {
        const auto doc = nlohmann::json::parse(json_text, nullptr, false);
        if (doc.is_discarded()) {
            return Err(Error::Code::DecodeError, "Board info is not valid JSON");
        }
        if (!doc.is_object()) {
            return Err(Error::Code::DecodeError, "Board info is not a JSON object");
        }

        auto width = config_impl::read_dimension(doc, "width");
        if (!width) return width.error();
        auto height = config_impl::read_dimension(doc, "height");
        if (!height) return height.error();

        BoardInfo info;
        info.width = width.value();
        info.height = height.value();

        const auto palette_it = doc.find("palette");
        if (palette_it != doc.end() && !palette_it->is_null()) {
            auto palette = config_impl::read_palette(*palette_it);
            if (!palette) return palette.error();
            info.palette = std::make_shared<const Palette>(std::move(palette).value());
        }

        return Ok(std::move(info));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while parsing board info");
    } catch (const std::exception& e) {
        return Err(Error::Code::DecodeError, std::string("Board info parse failed: ") + e.what());
    }
}

} // namespace canvaschunk
