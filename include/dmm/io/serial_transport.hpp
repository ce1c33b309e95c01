#pragma once

#include "dmm/io/transport.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace dmm {

struct SerialConfig {
    // tty path, e.g. /dev/ttyUSB0
    std::string device;
    // The meter talks at 2400 baud 8N1.
    uint32_t baud = 2400;
};

// POSIX serial port in raw, non-blocking mode (8N1, no flow control).
// The port is opened by the constructor and released by close() or the
// destructor.
class SerialTransport : public Transport {
public:
    // Throws TransportError when the device cannot be opened or configured.
    explicit SerialTransport(const SerialConfig &config);
    ~SerialTransport() override;

    SerialTransport(const SerialTransport &) = delete;
    SerialTransport &operator=(const SerialTransport &) = delete;

    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] std::vector<uint8_t> read_available() override;
    void close() override;
    [[nodiscard]] std::string description() const override { return config_.device; }

private:
    SerialConfig config_;
    mutable std::mutex mutex_;
    int fd_ = -1;
};

} // namespace dmm
