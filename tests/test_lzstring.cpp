#include <gtest/gtest.h>
#include <random>
#include <string>

#include "../canvaschunk/include/canvaschunk/compressors/compressor_lzstring.hpp"
#include "../canvaschunk/include/canvaschunk/decompressors/decompressor_lzstring.hpp"

using namespace canvaschunk;

// ============================================================================
// Helper Functions
// ============================================================================

/// Comma separated byte values, the kind of text chunk payloads carry
std::string generate_byte_list_text(std::size_t count, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string text;
    for (std::size_t i = 0; i < count; ++i) {
        if (i != 0) text += ',';
        text += std::to_string(dist(rng));
    }
    return text;
}

std::string compress_or_fail(std::string_view text) {
    const LZStringCompressor compressor{};
    auto compressed = compressor.compress_to_base64(text);
    EXPECT_TRUE(compressed.is_ok());
    return compressed.is_ok() ? compressed.value() : std::string{};
}

// ============================================================================
// Known encodings
// ============================================================================

TEST(LZString, EmptyInputCompressesToEndMarker) {
    const LZStringCompressor compressor{};
    auto compressed = compressor.compress_to_base64(std::string_view{});
    ASSERT_TRUE(compressed.is_ok());
    EXPECT_EQ(compressed.value(), "Q===");
}

TEST(LZString, EndMarkerDecompressesToEmpty) {
    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64_utf8("Q===");
    ASSERT_TRUE(text.is_ok());
    EXPECT_TRUE(text.value().empty());
}

TEST(LZString, EmptyInputDecompressesToEmpty) {
    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64("");
    ASSERT_TRUE(text.is_ok());
    EXPECT_TRUE(text.value().empty());
}

TEST(LZString, OutputIsPaddedBase64) {
    const std::string compressed = compress_or_fail("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa");
    ASSERT_FALSE(compressed.empty());
    EXPECT_EQ(compressed.size() % 4, 0u);
    for (char c : compressed) {
        const bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                           (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
        EXPECT_TRUE(valid) << "unexpected character '" << c << "'";
    }
}

// ============================================================================
// Round trips
// ============================================================================

TEST(LZString, RoundTripAscii) {
    const std::string source = "Hello, world! Hello, world! Hello, canvas!";
    const std::string compressed = compress_or_fail(source);

    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64_utf8(compressed);
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), source);
}

TEST(LZString, RoundTripByteListText) {
    const std::string source = generate_byte_list_text(5000, 12345);
    const std::string compressed = compress_or_fail(source);
    EXPECT_LT(compressed.size(), source.size());

    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64_utf8(compressed);
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), source);
}

TEST(LZString, RoundTripWideCharacters) {
    const std::u16string source = u"pixel éè ✓✓✓ 日本";
    const LZStringCompressor compressor{};
    auto compressed = compressor.compress_to_base64(std::u16string_view(source));
    ASSERT_TRUE(compressed.is_ok());

    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64(compressed.value());
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), source);
}

TEST(LZString, RoundTripUtf8) {
    const std::string source = "caf\xc3\xa9 \xe2\x9c\x93";
    const std::string compressed = compress_or_fail(source);

    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64_utf8(compressed);
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), source);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(LZString, InvalidCharacterIsDecodeError) {
    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64("Q=!=");
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code, Error::Code::DecodeError);
}

TEST(LZString, TruncatedStreamIsDecodeError) {
    const std::string compressed = compress_or_fail(generate_byte_list_text(2000, 99));
    ASSERT_GT(compressed.size(), 16u);

    const LZStringDecompressor decompressor{};
    auto text = decompressor.decompress_from_base64(compressed.substr(0, compressed.size() / 2));
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code, Error::Code::DecodeError);
}

TEST(LZString, InvalidUtf8IsRejectedByCompressor) {
    const LZStringCompressor compressor{};
    auto compressed = compressor.compress_to_base64(std::string_view("\xff\xfe"));
    ASSERT_TRUE(compressed.is_error());
    EXPECT_EQ(compressed.error().code, Error::Code::DecodeError);
}
