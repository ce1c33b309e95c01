#pragma once

#include "dmm/protocol/raw_frame.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace dmm {

// Bounded FIFO of undecoded frames shared between the acquisition thread
// (producer) and the session's reader (consumer). When full, a push evicts the
// oldest frame; the producer is never blocked. All members are thread-safe.
class HistoryBuffer {
public:
    static constexpr std::size_t kDefaultDepth = 10;

    // Throws std::invalid_argument when `capacity` is zero.
    explicit HistoryBuffer(std::size_t capacity = kDefaultDepth);

    // Append `frame`. Returns true when the oldest entry was evicted to make room.
    bool push(const RawFrame &frame);

    // Remove everything queued and return only the most recently pushed
    // frame, or nullopt when empty. Older frames are discarded.
    [[nodiscard]] std::optional<RawFrame> drain_latest();

    // Remove everything queued, oldest first.
    [[nodiscard]] std::vector<RawFrame> drain();

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<RawFrame> frames_;
};

} // namespace dmm
