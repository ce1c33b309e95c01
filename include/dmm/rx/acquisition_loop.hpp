#pragma once

#include "dmm/errors.hpp"
#include "dmm/io/transport.hpp"
#include "dmm/log.hpp"
#include "dmm/rx/history_buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace dmm {

// Running totals of one acquisition loop.
struct AcquisitionStats {
    uint64_t bytes_received = 0;
    uint64_t frames_captured = 0;
    // Bytes skipped while hunting for the sync marker.
    uint64_t bytes_discarded = 0;
    // Frames pushed out of the history before anyone read them.
    uint64_t frames_evicted = 0;
};

// Background poller: every `poll_interval` it drains the transport, cuts the
// bytes into frames and pushes them, timestamped, into the history. No
// decoding happens here.
//
// There is no stop flag. The loop exits on the first poll that finds the
// transport closed, or when a read throws TransportError. The transport is
// then closed and the error kept for take_failure().
// Both the transport and the history must outlive the loop.
class AcquisitionLoop {
public:
    AcquisitionLoop(Transport &transport, HistoryBuffer &history, std::chrono::milliseconds poll_interval,
                    Logger logger = Logger{});
    // Joins the thread; the owner must have closed the transport first.
    ~AcquisitionLoop();

    AcquisitionLoop(const AcquisitionLoop &) = delete;
    AcquisitionLoop &operator=(const AcquisitionLoop &) = delete;

    // Spawn the polling thread. Calling it twice is a logic error.
    void start();

    // Block until the thread has exited. No-op if it never started.
    void join();

    [[nodiscard]] bool running() const { return running_.load(); }

    [[nodiscard]] AcquisitionStats stats() const;

    // The transport failure that ended the loop, handed out once.
    [[nodiscard]] std::optional<TransportError> take_failure();

private:
    void run();

    Transport &transport_;
    HistoryBuffer &history_;
    const std::chrono::milliseconds poll_interval_;
    Logger logger_;

    std::thread thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> frames_captured_{0};
    std::atomic<uint64_t> bytes_discarded_{0};
    std::atomic<uint64_t> frames_evicted_{0};

    std::mutex failure_mutex_;
    std::optional<TransportError> failure_;
};

} // namespace dmm
