#include "dmm/device_session.hpp"

#include <stdexcept>
#include <utility>

namespace dmm {

DeviceSession::DeviceSession(SessionConfig config)
    : config_(std::move(config)),
      logger_(config_.log, config_.name),
      decoder_(config_.prefixes),
      history_(config_.history_depth) {
    if (config_.poll_interval.count() <= 0) {
        throw std::invalid_argument("Poll interval must be positive");
    }
}

DeviceSession::~DeviceSession() {
    stop_acquisition();
}

void DeviceSession::open(std::unique_ptr<Transport> transport) {
    if (!transport) {
        throw std::invalid_argument("DeviceSession::open requires a transport");
    }
    if (!transport->is_open()) {
        throw TransportError(transport->description() + " is not open");
    }

    // Never let two loops share the history.
    stop_acquisition();
    loop_.reset();
    history_.clear();

    transport_ = std::move(transport);
    loop_ = std::make_unique<AcquisitionLoop>(*transport_, history_, config_.poll_interval, logger_);
    loop_->start();
    DMM_LOG_INFO(logger_, "opened %s", transport_->description().c_str());
}

void DeviceSession::open(const SerialConfig &serial) {
    open(std::make_unique<SerialTransport>(serial));
}

void DeviceSession::close() {
    if (transport_ && transport_->is_open()) {
        DMM_LOG_INFO(logger_, "closing %s", transport_->description().c_str());
        transport_->close();
    }
}

std::optional<Measurement> DeviceSession::read() {
    rethrow_acquisition_failure();
    const auto latest = history_.drain_latest();
    if (!latest) {
        return std::nullopt;
    }
    return read(*latest);
}

Measurement DeviceSession::read(const RawFrame &frame) const {
    Measurement m = decoder_.decode(frame);
    m.name = config_.name;
    return m;
}

std::vector<Measurement> DeviceSession::read_history() {
    rethrow_acquisition_failure();
    std::vector<Measurement> out;
    for (const auto &frame : history_.drain()) {
        try {
            out.push_back(read(frame));
        } catch (const DecodeError &e) {
            DMM_LOG_WARN(logger_, "dropping frame: %s", e.what());
        }
    }
    return out;
}

bool DeviceSession::is_open() const {
    return transport_ && transport_->is_open() && loop_ && loop_->running();
}

AcquisitionStats DeviceSession::stats() const {
    return loop_ ? loop_->stats() : AcquisitionStats{};
}

void DeviceSession::stop_acquisition() {
    close();
    if (loop_) {
        loop_->join();
    }
}

void DeviceSession::rethrow_acquisition_failure() {
    if (!loop_) {
        return;
    }
    if (auto failure = loop_->take_failure()) {
        throw *failure;
    }
}

} // namespace dmm
