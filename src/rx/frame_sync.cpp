#include "dmm/rx/frame_sync.hpp"

#include <algorithm>

namespace dmm {

std::vector<RawFrame> FrameSynchronizer::feed(std::span<const uint8_t> chunk) {
    std::vector<RawFrame> frames;
    buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());

    while (true) {
        hunt_marker();
        if (pending() < kFrameLength) {
            break;
        }
        RawFrame frame;
        std::copy_n(buffer_.begin() + static_cast<std::ptrdiff_t>(head_), kFrameLength, frame.bytes.begin());
        head_ += kFrameLength;
        ++emitted_;
        frames.push_back(frame);
    }

    compact();
    return frames;
}

void FrameSynchronizer::reset() {
    buffer_.clear();
    head_ = 0;
    discarded_ = 0;
    emitted_ = 0;
}

void FrameSynchronizer::hunt_marker() {
    while (pending() >= 2) {
        if (buffer_[head_] == kSyncByte0 && buffer_[head_ + 1] == kSyncByte1) {
            return;
        }
        ++head_;
        ++discarded_;
    }
    if (pending() == 1 && buffer_[head_] != kSyncByte0) {
        ++head_;
        ++discarded_;
    }
}

void FrameSynchronizer::compact() {
    if (head_ == 0) {
        return;
    }
    if (head_ >= buffer_.size()) {
        buffer_.clear();
        head_ = 0;
        return;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(head_));
    head_ = 0;
}

} // namespace dmm
