#pragma once

#include "dmm/protocol/raw_frame.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dmm {

// Streaming frame synchronizer for the AA 55 framed LCD stream.
//
// Bytes arrive in arbitrary chunks (whatever the serial driver had buffered at
// poll time). They are appended to a backlog; leading bytes are dropped one at
// a time until the backlog starts with the sync marker, then 22 bytes are cut
// out as a candidate frame. This repeats while full frames remain, so a burst
// of several frames in one chunk yields all of them.
//
// Only the marker is checked here. A false lock on an AA 55 pair inside frame
// data is caught later by FrameDecoder's residual check.
class FrameSynchronizer {
public:
    // Append `chunk` and return every complete frame now available, oldest
    // first. Returned frames carry no timestamp.
    [[nodiscard]] std::vector<RawFrame> feed(std::span<const uint8_t> chunk);

    // Drop the backlog and counters.
    void reset();

    // Bytes buffered but not yet part of an emitted frame.
    [[nodiscard]] std::size_t pending() const { return buffer_.size() - head_; }
    // Bytes skipped while hunting for the marker since the last reset.
    [[nodiscard]] std::size_t discarded_bytes() const { return discarded_; }
    [[nodiscard]] std::size_t frames_emitted() const { return emitted_; }

private:
    // Skip leading bytes until the backlog starts with AA 55 or is too short
    // to tell. A single trailing AA is kept since its 55 may be in the next chunk.
    void hunt_marker();
    // Reclaim consumed prefix of `buffer_`.
    void compact();

    std::vector<uint8_t> buffer_;
    std::size_t head_ = 0;
    std::size_t discarded_ = 0;
    std::size_t emitted_ = 0;
};

} // namespace dmm
