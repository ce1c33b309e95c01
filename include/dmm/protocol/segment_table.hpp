#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace dmm {

// 7-segment LCD patterns (bit layout xGFEDCBA) and the glyph each one shows.
// The meter only ever draws digits, a blank and the 'L' of "O.L".
struct SegmentGlyph {
    uint8_t pattern;
    char glyph;
};

inline constexpr std::array<SegmentGlyph, 12> kSegmentTable = {{
    {0x5F, '0'},
    {0x06, '1'},
    {0x6B, '2'},
    {0x2F, '3'},
    {0x36, '4'},
    {0x3D, '5'},
    {0x7D, '6'},
    {0x07, '7'},
    {0x7F, '8'},
    {0x3F, '9'},
    {0x00, ' '},
    {0x58, 'L'},
}};

// Glyph drawn by `pattern`, or std::nullopt when the pattern is not in the table.
[[nodiscard]] constexpr std::optional<char> glyph_for_segments(uint8_t pattern) {
    for (const auto &entry : kSegmentTable) {
        if (entry.pattern == pattern) {
            return entry.glyph;
        }
    }
    return std::nullopt;
}

} // namespace dmm
