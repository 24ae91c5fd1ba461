#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "../types/result.hpp"

namespace canvaschunk {

/// @brief Parse a comma separated list of byte values ("12,0,255")
///
/// The text is wrapped in '[' ']' and parsed as a JSON array; every element
/// must be an integer in 0..255. An empty text gives an empty buffer.
///
/// @retval DecodeError Invalid JSON, a non-integer element or a value out of byte range
/// @retval MemoryError Allocation failed
[[nodiscard]] inline Result<std::vector<std::byte>> parse_json_byte_list(std::string_view text) noexcept {
    try {
        std::string wrapped;
        wrapped.reserve(text.size() + 2);
        wrapped.push_back('[');
        wrapped.append(text);
        wrapped.push_back(']');

        const auto doc = nlohmann::json::parse(wrapped, nullptr, false);
        if (doc.is_discarded()) [[unlikely]] {
            return Err(Error::Code::DecodeError, "Byte list is not valid JSON");
        }

        std::vector<std::byte> bytes;
        bytes.reserve(doc.size());
        for (std::size_t i = 0; i < doc.size(); ++i) {
            const auto& element = doc[i];
            if (!element.is_number_integer()) [[unlikely]] {
                return Err(Error::Code::DecodeError,
                           "Byte list element " + std::to_string(i) + " is not an integer");
            }
            const int64_t value = element.get<int64_t>();
            if (value < 0 || value > 255) [[unlikely]] {
                return Err(Error::Code::DecodeError,
                           "Byte list element " + std::to_string(i) + " out of range: " +
                           std::to_string(value));
            }
            bytes.push_back(static_cast<std::byte>(value));
        }
        return Ok(std::move(bytes));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while parsing byte list");
    } catch (const std::exception& e) {
        return Err(Error::Code::DecodeError, std::string("Byte list parse failed: ") + e.what());
    }
}

/// @brief Inverse of parse_json_byte_list: "12,0,255" without the enclosing brackets
/// @retval MemoryError Allocation failed
[[nodiscard]] inline Result<std::string> format_json_byte_list(std::span<const std::byte> bytes) noexcept {
    try {
        nlohmann::json list = nlohmann::json::array();
        for (std::byte b : bytes) {
            list.push_back(static_cast<unsigned>(b));
        }
        std::string text = list.dump();
        return Ok(text.substr(1, text.size() - 2));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while formatting byte list");
    }
}

} // namespace canvaschunk
