#pragma once

#include "dmm/errors.hpp"
#include "dmm/protocol/measurement.hpp"
#include "dmm/protocol/prefix_table.hpp"
#include "dmm/protocol/raw_frame.hpp"

namespace dmm {

// Turns one 22-byte LCD frame into a Measurement.
//
// The frame has no checksum. Instead every field the decoder understands is
// cleared from a working copy as it is read, and whatever is left must match
// kReferenceFrame exactly. A leftover bit means either corruption (e.g. a
// false sync lock) or an indicator this decoder does not know about; both are
// reported as DecodeError naming the first offending byte.
//
// Byte map (0-based):
//   6..9   digits, 9 is most significant; 6..8 carry a decimal point (0x80)
//   10     sign 0x08, AC 0x02, DC 0x04, diode 0x01, beep 0x60, low battery 0x80
//   11..18 bar graph (8 segments per byte, 4 in byte 18), auto range 18:0x20
//   19     min/max 0x0E, usb 0x01, percent 0x40, hFE 0x80
//   20     degC 0x01, degF 0x02, m 0x10, u 0x20, n 0x40, F 0x80
//   21     u 0x01, m 0x02, A 0x04, V 0x08, M 0x10, k 0x20, Ohm 0x40, Hz 0x80
//
// decode() is const and touches no shared state, so one decoder may be used
// from any thread.
class FrameDecoder {
public:
    FrameDecoder() = default;
    explicit FrameDecoder(const PrefixTable &prefixes);

    // Throws DecodeError; the returned Measurement has an empty `name`.
    [[nodiscard]] Measurement decode(const RawFrame &frame) const;

    [[nodiscard]] const PrefixTable &prefixes() const { return prefixes_; }

private:
    PrefixTable prefixes_{};
};

} // namespace dmm
