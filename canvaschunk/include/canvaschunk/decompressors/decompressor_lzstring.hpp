#pragma once

#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "lzstring_common.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

/// LZString decompression, base64 flavour
///
/// Format: an LZW-style token stream packed LSB-first into values, the values
/// packed MSB-first into 6-bit base64 characters. Token width starts at 2 bits
/// and grows as the dictionary fills. Tokens:
/// - 0: next 8 bits are a new single character
/// - 1: next 16 bits are a new single character
/// - 2: end of stream
/// - n: dictionary entry n (or n == dict size: previous entry + its first char)
///
/// No external dictionary, no state shared between calls.
class LZStringDecompressor {
private:
    /// Bit cursor over the validated base64 input
    class BitReader {
    public:
        explicit BitReader(std::string_view input) noexcept
            : input_(input)
            , value_(next_value(0))
            , position_(reset_value) {}

        /// Read an @p nbits value, least significant bit first
        [[nodiscard]] uint32_t read(unsigned nbits) noexcept {
            uint32_t bits = 0;
            for (unsigned i = 0; i < nbits; ++i) {
                const uint32_t bit = (value_ & position_) != 0 ? 1u : 0u;
                position_ >>= 1;
                if (position_ == 0) {
                    position_ = reset_value;
                    value_ = next_value(index_++);
                }
                bits |= bit << i;
            }
            return bits;
        }

        /// True once the reader has moved past the last character
        [[nodiscard]] bool exhausted() const noexcept {
            return index_ > input_.size();
        }

    private:
        static constexpr uint32_t reset_value = 1u << (lzstring::bits_per_char - 1);

        [[nodiscard]] uint32_t next_value(std::size_t i) const noexcept {
            if (i >= input_.size()) {
                return 0;
            }
            return static_cast<uint32_t>(lzstring::base64_reverse[static_cast<unsigned char>(input_[i])]);
        }

        std::string_view input_;
        uint32_t value_;
        uint32_t position_;
        std::size_t index_{1};
    };

    [[nodiscard]] static Result<void> validate_alphabet(std::string_view input) noexcept {
        for (std::size_t i = 0; i < input.size(); ++i) {
            if (lzstring::base64_reverse[static_cast<unsigned char>(input[i])] < 0) {
                return Err(Error::Code::DecodeError,
                           "LZString: invalid base64 character at offset " + std::to_string(i));
            }
        }
        return Ok();
    }

    [[nodiscard]] static Result<std::u16string> decompress_impl(std::string_view input) {
        BitReader reader(input);
        std::vector<std::u16string> dictionary(3);  // slots 0..2 are the control tokens
        uint32_t enlarge_in = 4;
        unsigned num_bits = 3;

        std::u16string result;
        std::u16string w;

        switch (reader.read(2)) {
            case 0:
                w.assign(1, static_cast<char16_t>(reader.read(8)));
                break;
            case 1:
                w.assign(1, static_cast<char16_t>(reader.read(16)));
                break;
            case 2:
                return Ok(std::u16string{});
            default:
                return Err(Error::Code::DecodeError, "LZString: invalid leading token");
        }
        dictionary.push_back(w);
        result = w;

        while (true) {
            if (reader.exhausted()) {
                return Err(Error::Code::DecodeError, "LZString: stream ends before end marker");
            }
            if (num_bits > 31) {
                return Err(Error::Code::DecodeError, "LZString: token width overflow");
            }

            std::size_t token = reader.read(num_bits);
            switch (token) {
                case 0:
                    dictionary.emplace_back(1, static_cast<char16_t>(reader.read(8)));
                    token = dictionary.size() - 1;
                    --enlarge_in;
                    break;
                case 1:
                    dictionary.emplace_back(1, static_cast<char16_t>(reader.read(16)));
                    token = dictionary.size() - 1;
                    --enlarge_in;
                    break;
                case 2:
                    return Ok(std::move(result));
                default:
                    break;
            }

            if (enlarge_in == 0) {
                enlarge_in = 1u << num_bits;
                ++num_bits;
            }

            std::u16string entry;
            if (token < dictionary.size()) {
                entry = dictionary[token];
            } else if (token == dictionary.size()) {
                entry = w + w.front();
            } else {
                return Err(Error::Code::DecodeError,
                           "LZString: reference to unknown dictionary entry " + std::to_string(token));
            }
            result += entry;

            dictionary.push_back(w + entry.front());
            --enlarge_in;
            w = std::move(entry);

            if (enlarge_in == 0) {
                enlarge_in = 1u << num_bits;
                ++num_bits;
            }
        }
    }

public:
    constexpr LZStringDecompressor() noexcept = default;

    /// @brief Decompress base64 LZString text into UTF-16 code units
    /// @param input Base64 text (A-Z a-z 0-9 + / and '=' padding)
    /// @return Decompressed text; empty input gives empty text
    /// @retval DecodeError Invalid character, missing end marker, or bad back-reference
    /// @retval MemoryError Allocation failed
    [[nodiscard]] Result<std::u16string> decompress_from_base64(std::string_view input) const noexcept {
        if (input.empty()) {
            return Ok(std::u16string{});
        }
        auto valid = validate_alphabet(input);
        if (!valid) {
            return valid.error();
        }
        try {
            return decompress_impl(input);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "LZString: out of memory");
        }
    }

    /// @brief Decompress base64 LZString text and return it as UTF-8
    [[nodiscard]] Result<std::string> decompress_from_base64_utf8(std::string_view input) const noexcept {
        auto text = decompress_from_base64(input);
        if (!text) {
            return text.error();
        }
        try {
            return Ok(lzstring::utf16_to_utf8(text.value()));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "LZString: out of memory");
        }
    }
};

} // namespace canvaschunk
