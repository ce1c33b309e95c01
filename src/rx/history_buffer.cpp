#include "dmm/rx/history_buffer.hpp"

#include <iterator>
#include <stdexcept>

namespace dmm {

HistoryBuffer::HistoryBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("History depth must be at least 1");
    }
}

bool HistoryBuffer::push(const RawFrame &frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool evicted = false;
    if (frames_.size() >= capacity_) {
        frames_.pop_front();
        evicted = true;
    }
    frames_.push_back(frame);
    return evicted;
}

std::optional<RawFrame> HistoryBuffer::drain_latest() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames_.empty()) {
        return std::nullopt;
    }
    RawFrame latest = frames_.back();
    frames_.clear();
    return latest;
}

std::vector<RawFrame> HistoryBuffer::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RawFrame> out(std::make_move_iterator(frames_.begin()), std::make_move_iterator(frames_.end()));
    frames_.clear();
    return out;
}

void HistoryBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
}

std::size_t HistoryBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

bool HistoryBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty();
}

} // namespace dmm
