#pragma once

#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include "../decompressors/lzstring_common.hpp"
#include "../types/result.hpp"

namespace canvaschunk {

/// LZString compression, base64 flavour
/// Inverse of LZStringDecompressor; output is padded with '=' to a multiple of 4 characters
class LZStringCompressor {
private:
    class BitWriter {
    public:
        void write_bit(uint32_t bit) {
            value_ = (value_ << 1) | bit;
            if (position_ == lzstring::bits_per_char - 1) {
                position_ = 0;
                out_.push_back(lzstring::base64_alphabet[value_]);
                value_ = 0;
            } else {
                ++position_;
            }
        }

        /// Write @p nbits of @p value, least significant bit first
        void write(uint32_t value, unsigned nbits) {
            for (unsigned i = 0; i < nbits; ++i) {
                write_bit(value & 1u);
                value >>= 1;
            }
        }

        /// Shift out the partially filled last character
        void flush() {
            while (true) {
                value_ <<= 1;
                if (position_ == lzstring::bits_per_char - 1) {
                    out_.push_back(lzstring::base64_alphabet[value_]);
                    break;
                }
                ++position_;
            }
        }

        [[nodiscard]] std::string& output() noexcept { return out_; }

    private:
        std::string out_;
        uint32_t value_{0};
        unsigned position_{0};
    };

    [[nodiscard]] static std::string compress_impl(std::u16string_view input) {
        std::unordered_map<std::u16string, uint32_t> dictionary;
        std::unordered_set<std::u16string> pending;  // single characters not yet emitted literally
        std::u16string w;
        uint32_t enlarge_in = 2;
        uint32_t dict_size = 3;
        unsigned num_bits = 2;
        BitWriter writer;

        auto grow = [&] {
            if (--enlarge_in == 0) {
                enlarge_in = 1u << num_bits;
                ++num_bits;
            }
        };

        auto emit = [&](const std::u16string& phrase) {
            if (pending.contains(phrase)) {
                const char16_t ch = phrase.front();
                if (ch < 256) {
                    writer.write(0, num_bits);
                    writer.write(ch, 8);
                } else {
                    writer.write(1, num_bits);
                    writer.write(ch, 16);
                }
                grow();
                pending.erase(phrase);
            } else {
                writer.write(dictionary.at(phrase), num_bits);
            }
            grow();
        };

        for (char16_t ch : input) {
            const std::u16string c(1, ch);
            if (!dictionary.contains(c)) {
                dictionary.emplace(c, dict_size++);
                pending.insert(c);
            }

            std::u16string wc = w + ch;
            if (dictionary.contains(wc)) {
                w = std::move(wc);
            } else {
                emit(w);
                dictionary.emplace(std::move(wc), dict_size++);
                w = c;
            }
        }

        if (!w.empty()) {
            emit(w);
        }

        writer.write(2, num_bits);
        writer.flush();

        std::string out = std::move(writer.output());
        while (out.size() % 4 != 0) {
            out.push_back('=');
        }
        return out;
    }

public:
    constexpr LZStringCompressor() noexcept = default;

    /// @brief Compress UTF-16 text into base64 LZString text
    /// @note Empty input still produces the end-of-stream token ("Q===")
    /// @retval MemoryError Allocation failed
    [[nodiscard]] Result<std::string> compress_to_base64(std::u16string_view input) const noexcept {
        try {
            return Ok(compress_impl(input));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "LZString: out of memory");
        }
    }

    /// @brief Compress UTF-8 text into base64 LZString text
    /// @retval DecodeError @p input is not valid UTF-8
    [[nodiscard]] Result<std::string> compress_to_base64(std::string_view input) const noexcept {
        try {
            auto text = lzstring::utf8_to_utf16(input);
            if (!text) {
                return text.error();
            }
            return compress_to_base64(std::u16string_view(text.value()));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "LZString: out of memory");
        }
    }
};

} // namespace canvaschunk
