#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace canvaschunk {

/// @brief 8-bit RGB color
struct Rgb {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};

    constexpr bool operator==(const Rgb&) const noexcept = default;
};

/// @brief Indexed color table with 256 slots
///
/// A service defines only a handful of colors. How the remaining slots are
/// filled is chosen when the palette is built:
/// - Repeat: the defined colors are tiled over all 256 slots (index i maps to
///   color i % count). Used for the 4-bit services.
/// - Pad: slots past the defined colors are black.
///
/// Palettes are immutable once built and are passed by reference into decode
/// calls; a RasterTile keeps a pointer to the palette it was decoded with, so
/// the palette must outlive the tile.
class Palette {
public:
    enum class Fill { Repeat, Pad };

    constexpr Palette() noexcept = default;

    constexpr Palette(std::span<const Rgb> colors, Fill fill) noexcept
        : count_(colors.size() > 256 ? 256 : colors.size()) {
        for (std::size_t i = 0; i < count_; ++i) {
            entries_[i] = colors[i];
        }
        if (fill == Fill::Repeat && count_ > 0) {
            for (std::size_t i = count_; i < entries_.size(); ++i) {
                entries_[i] = colors[i % count_];
            }
        }
    }

    constexpr Palette(std::initializer_list<Rgb> colors, Fill fill) noexcept
        : Palette(std::span<const Rgb>(colors.begin(), colors.size()), fill) {}

    /// Color for an index; every 8-bit index is valid
    [[nodiscard]] constexpr const Rgb& operator[](uint8_t index) const noexcept {
        return entries_[index];
    }

    /// Number of colors the service actually defines
    [[nodiscard]] constexpr std::size_t defined_colors() const noexcept { return count_; }

    [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0; }

    [[nodiscard]] constexpr std::span<const Rgb, 256> entries() const noexcept { return entries_; }

private:
    std::array<Rgb, 256> entries_{};
    std::size_t count_{0};
};

} // namespace canvaschunk
