#include "dmm/rx/acquisition_loop.hpp"

#include "dmm/rx/frame_sync.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace dmm {

AcquisitionLoop::AcquisitionLoop(Transport &transport, HistoryBuffer &history,
                                 std::chrono::milliseconds poll_interval, Logger logger)
    : transport_(transport), history_(history), poll_interval_(poll_interval), logger_(std::move(logger)) {
    if (poll_interval.count() <= 0) {
        throw std::invalid_argument("Poll interval must be positive");
    }
}

AcquisitionLoop::~AcquisitionLoop() {
    join();
}

void AcquisitionLoop::start() {
    if (thread_.joinable()) {
        throw std::logic_error("Acquisition loop already started");
    }
    running_.store(true);
    thread_ = std::thread(&AcquisitionLoop::run, this);
}

void AcquisitionLoop::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

AcquisitionStats AcquisitionLoop::stats() const {
    AcquisitionStats s;
    s.bytes_received = bytes_received_.load();
    s.frames_captured = frames_captured_.load();
    s.bytes_discarded = bytes_discarded_.load();
    s.frames_evicted = frames_evicted_.load();
    return s;
}

std::optional<TransportError> AcquisitionLoop::take_failure() {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    std::optional<TransportError> out = std::move(failure_);
    failure_.reset();
    return out;
}

void AcquisitionLoop::run() {
    // The synchronizer lives on this thread only; a restarted session gets a
    // fresh one, so a partial frame from the old transport is never completed
    // with bytes from the new one.
    FrameSynchronizer synchronizer;
    DMM_LOG_DEBUG(logger_, "acquisition started on %s", transport_.description().c_str());

    while (transport_.is_open()) {
        std::vector<uint8_t> chunk;
        try {
            chunk = transport_.read_available();
        } catch (const TransportError &e) {
            DMM_LOG_ERROR(logger_, "%s", e.what());
            // Closed before the failure is published: once take_failure() can
            // return it, the transport reports closed.
            transport_.close();
            std::lock_guard<std::mutex> lock(failure_mutex_);
            failure_ = e;
            break;
        }

        if (!chunk.empty()) {
            bytes_received_ += chunk.size();
            const std::size_t discarded_before = synchronizer.discarded_bytes();
            auto frames = synchronizer.feed(chunk);
            const std::size_t discarded = synchronizer.discarded_bytes() - discarded_before;
            bytes_discarded_ += discarded;

            const auto now = RawFrame::Clock::now();
            for (auto &frame : frames) {
                frame.captured_at = now;
                if (history_.push(frame)) {
                    ++frames_evicted_;
                }
                ++frames_captured_;
            }
            DMM_LOG_DEBUG(logger_, "poll: %zu bytes, %zu frames, %zu skipped, %zu pending", chunk.size(),
                          frames.size(), discarded, synchronizer.pending());
        }

        std::this_thread::sleep_for(poll_interval_);
    }

    DMM_LOG_DEBUG(logger_, "acquisition stopped on %s", transport_.description().c_str());
    running_.store(false);
}

} // namespace dmm
