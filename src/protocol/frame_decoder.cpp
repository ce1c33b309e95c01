#include "dmm/protocol/frame_decoder.hpp"

#include "dmm/protocol/segment_table.hpp"

#include <bit>
#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>

namespace dmm {

namespace {

constexpr std::size_t kSignByte = 10;
constexpr uint8_t kSignMask = 0x08;
constexpr uint8_t kDecimalPointMask = 0x80;
constexpr uint8_t kSegmentMask = 0x7F;

// Digit bytes, most significant first. Byte 9 has no decimal point segment.
constexpr std::size_t kDigitBytes[] = {9, 8, 7, 6};

constexpr std::size_t kBarFirstByte = 11;
constexpr std::size_t kBarLastByte = 18;

// Space separated hex dump of the frame, used in error messages.
std::string hex_dump(const FrameBytes &bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    char buf[4];
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02X" : " %02X", bytes[i]);
        out += buf;
    }
    return out;
}

[[noreturn]] void fail(const char *what, std::size_t index, uint8_t residual, const FrameBytes &raw) {
    char head[96];
    std::snprintf(head, sizeof(head), "%s at byte %zu (0x%02X)", what, index, residual);
    throw DecodeError(index, residual, std::string(head) + "; frame: " + hex_dump(raw));
}

// Number shown on the LCD, or nullopt when the glyphs do not form one
// ("O.L", all blanks, a blank between digits).
std::optional<double> parse_display(std::string_view display) {
    const auto first = display.find_first_not_of(' ');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const auto last = display.find_last_not_of(' ');
    const std::string_view digits = display.substr(first, last - first + 1);

    double value = 0.0;
    const char *begin = digits.data();
    const char *end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

FrameDecoder::FrameDecoder(const PrefixTable &prefixes) : prefixes_(prefixes) {}

Measurement FrameDecoder::decode(const RawFrame &frame) const {
    FrameBytes work = frame.bytes;

    // Test-and-clear: true when every bit of `mask` is set in byte `index`.
    auto take = [&work](std::size_t index, uint8_t mask) {
        if ((work[index] & mask) != mask) {
            return false;
        }
        work[index] = static_cast<uint8_t>(work[index] & ~mask);
        return true;
    };

    Measurement m;
    m.timestamp = frame.captured_at;
    m.raw = frame.bytes;

    // Sign and digits
    if (take(kSignByte, kSignMask)) {
        m.display += '-';
    }
    for (const std::size_t index : kDigitBytes) {
        if (index != 9 && take(index, kDecimalPointMask)) {
            m.display += '.';
        }
        const auto glyph = glyph_for_segments(work[index]);
        if (!glyph) {
            fail("unknown LCD segment pattern", index, work[index], frame.bytes);
        }
        m.display += *glyph;
        work[index] = static_cast<uint8_t>(work[index] & ~kSegmentMask);
    }
    const auto shown = parse_display(m.display);

    // Unit icons. A later icon replaces the base unit or prefix set by an
    // earlier one; AC/DC append to whatever base is lit.
    if (take(20, 0x01)) m.unit = "degC";
    if (take(20, 0x02)) m.unit = "degF";
    if (take(20, 0x10)) m.prefix = Prefix::Milli;
    if (take(20, 0x20)) m.prefix = Prefix::Micro;
    if (take(20, 0x40)) m.prefix = Prefix::Nano;
    if (take(20, 0x80)) m.unit = "F";

    if (take(21, 0x01)) m.prefix = Prefix::Micro;
    if (take(21, 0x02)) m.prefix = Prefix::Milli;
    if (take(21, 0x04)) m.unit = "A";
    if (take(21, 0x08)) m.unit = "V";
    if (take(21, 0x10)) m.prefix = Prefix::Mega;
    if (take(21, 0x20)) m.prefix = Prefix::Kilo;
    if (take(21, 0x40)) m.unit = "Ohm";
    if (take(21, 0x80)) m.unit = "Hz";

    if (take(10, 0x02)) m.unit += "AC";
    if (take(10, 0x04)) m.unit += "DC";

    // Percent and transistor gain are dimensionless and win over everything above.
    if (take(19, 0x40)) m.unit = "%";
    if (take(19, 0x80)) m.unit = "hFE";

    // Indicators
    MeterFlags &flags = m.flags;
    flags.diode = take(10, 0x01);
    if (take(10, 0x60)) {
        flags.beep = true;
    } else {
        flags.unidentified_indicator = take(10, 0x20);
    }
    if (take(19, 0x0E)) {
        flags.min_max = true;
    } else if (take(19, 0x02)) {
        flags.min = true;
    } else {
        flags.max = take(19, 0x08);
    }
    flags.usb = take(19, 0x01);
    flags.auto_range = take(18, 0x20);
    flags.low_battery = take(10, 0x80);

    for (std::size_t index = kBarFirstByte; index <= kBarLastByte; ++index) {
        const uint8_t mask = index < kBarLastByte ? 0xFF : 0x0F;
        flags.bar += std::popcount(static_cast<uint8_t>(work[index] & mask));
        work[index] = static_cast<uint8_t>(work[index] & ~mask);
    }

    // Whatever is still set was not explained by any field above.
    for (std::size_t index = 0; index < kFrameLength; ++index) {
        if (work[index] != kReferenceFrame[index]) {
            fail("unrecognized bits", index, work[index], frame.bytes);
        }
    }

    m.multiplier = prefixes_.factor(m.prefix);
    if (shown) {
        m.value = *shown * m.multiplier;
    }
    return m;
}

} // namespace dmm
