#pragma once

#include "dmm/protocol/prefix_table.hpp"
#include "dmm/protocol/raw_frame.hpp"

#include <optional>
#include <string>

namespace dmm {

// Indicators decoded from the LCD icon bitmap. All default to off.
struct MeterFlags {
    bool diode = false;
    // Continuity buzzer; both bits of byte 10 mask 0x60 lit together (unconfirmed).
    bool beep = false;
    // Byte 10 bit 0x20 lit on its own; meaning not identified yet.
    bool unidentified_indicator = false;
    bool low_battery = false;
    bool min = false;
    bool max = false;
    bool min_max = false;
    bool auto_range = false;
    bool usb = false;
    // Analog bar-graph fill, 0..60 segments.
    int bar = 0;

    friend bool operator==(const MeterFlags &, const MeterFlags &) = default;
};

// A decoded reading.
struct Measurement {
    RawFrame::Clock::time_point timestamp{};
    FrameBytes raw{};
    // Sign and four glyphs with decimal points, e.g. "-1.234", "    ", " 0.L".
    std::string display;
    // Absent when the display does not parse as a number (overflow, blanks).
    // Already scaled by `multiplier`.
    std::optional<double> value;
    // Base unit with AC/DC suffix, e.g. "V", "VAC", "Ohm", "%", "hFE". Empty when no unit icon is lit.
    std::string unit;
    Prefix prefix = Prefix::None;
    double multiplier = 1.0;
    MeterFlags flags{};
    // Display name of the session that produced the reading.
    std::string name;
};

} // namespace dmm
