#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace dmm {

// Frame geometry of the meter's LCD stream. Every frame is exactly
// kFrameLength bytes and starts with the two sync bytes; there is no length
// field and no checksum.
inline constexpr std::size_t kFrameLength = 22;
inline constexpr uint8_t kSyncByte0 = 0xAA;
inline constexpr uint8_t kSyncByte1 = 0x55;

using FrameBytes = std::array<uint8_t, kFrameLength>;

// Expected content of a frame once every recognized field has been cleared:
// the sync marker, four fixed header bytes, then zeros. Real frames always
// carry the header bytes 52 24 01 10. A display showing blanks with no icons
// lit is transmitted exactly like this.
inline constexpr FrameBytes kReferenceFrame = {
    kSyncByte0, kSyncByte1, 0x52, 0x24, 0x01, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00,       0x00,       0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};

// One candidate frame as sliced out of the byte stream. Only the sync bytes
// are guaranteed; the rest is checked when the frame is decoded.
struct RawFrame {
    using Clock = std::chrono::system_clock;

    FrameBytes bytes{};
    // Stamped by the acquisition loop when the frame is pushed to the history.
    Clock::time_point captured_at{};

    [[nodiscard]] bool has_sync_marker() const {
        return bytes[0] == kSyncByte0 && bytes[1] == kSyncByte1;
    }
};

} // namespace dmm
