#pragma once

#include "dmm/io/serial_transport.hpp"
#include "dmm/io/transport.hpp"
#include "dmm/log.hpp"
#include "dmm/protocol/frame_decoder.hpp"
#include "dmm/protocol/measurement.hpp"
#include "dmm/protocol/prefix_table.hpp"
#include "dmm/rx/acquisition_loop.hpp"
#include "dmm/rx/history_buffer.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dmm {

struct SessionConfig {
    // Attached to every Measurement and used as the log tag.
    std::string name;
    // Frames kept between reads; older ones are evicted.
    std::size_t history_depth = HistoryBuffer::kDefaultDepth;
    // Delay between transport polls. Also bounds how long the loop lingers after close().
    std::chrono::milliseconds poll_interval{50};
    LogConfig log{};
    PrefixTable prefixes{};
};

// One connected meter: a transport, the thread polling it and the frame
// history between them. open/close/read are meant to be called from a single
// consumer thread; the acquisition thread is internal.
class DeviceSession {
public:
    // Throws std::invalid_argument for a zero history depth or poll interval.
    explicit DeviceSession(SessionConfig config = {});
    // Closes the transport and waits for the acquisition thread.
    ~DeviceSession();

    DeviceSession(const DeviceSession &) = delete;
    DeviceSession &operator=(const DeviceSession &) = delete;

    // Start acquiring from `transport`. A previous transport is closed and its
    // loop joined first, and the history is cleared. Throws TransportError if
    // `transport` is not open.
    void open(std::unique_ptr<Transport> transport);

    // Open a serial port and acquire from it. Throws TransportError.
    void open(const SerialConfig &serial);

    // Close the transport. Returns immediately; the loop notices on its next poll.
    void close();

    // Latest buffered reading; every older buffered frame is dropped undecoded.
    // std::nullopt when nothing arrived since the last read. Never waits.
    // Throws DecodeError if the latest frame is corrupt, or the TransportError
    // that stopped acquisition (reported once).
    [[nodiscard]] std::optional<Measurement> read();

    // Decode `frame` directly; the history is left untouched. Throws DecodeError.
    [[nodiscard]] Measurement read(const RawFrame &frame) const;

    // Drain and decode every buffered frame, oldest first. Frames that fail to
    // decode are logged and skipped.
    [[nodiscard]] std::vector<Measurement> read_history();

    // True while the transport is open and the acquisition loop is polling it.
    // A transport failure makes this false.
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] const std::string &name() const { return config_.name; }
    [[nodiscard]] std::size_t buffered() const { return history_.size(); }
    // Counters of the current (or last) acquisition loop.
    [[nodiscard]] AcquisitionStats stats() const;

private:
    // Close the transport and wait for the loop to exit.
    void stop_acquisition();
    void rethrow_acquisition_failure();

    SessionConfig config_;
    Logger logger_;
    FrameDecoder decoder_;
    HistoryBuffer history_;
    std::unique_ptr<Transport> transport_;
    // Declared last: destroyed before the transport and history it references.
    std::unique_ptr<AcquisitionLoop> loop_;
};

} // namespace dmm
