#include "dmm/io/loopback_transport.hpp"

#include "dmm/errors.hpp"

#include <utility>

namespace dmm {

void LoopbackTransport::inject(std::span<const uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return;
    }
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
}

void LoopbackTransport::fail_next_read(std::string cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_ = std::move(cause);
}

bool LoopbackTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::vector<uint8_t> LoopbackTransport::read_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reads_;
    if (failure_) {
        std::string cause = std::move(*failure_);
        failure_.reset();
        throw TransportError(cause);
    }
    std::vector<uint8_t> out;
    out.swap(pending_);
    return out;
}

void LoopbackTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    pending_.clear();
}

std::size_t LoopbackTransport::reads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
}

} // namespace dmm
