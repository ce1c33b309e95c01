#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dmm {

// Non-blocking byte source the acquisition loop polls. Implementations must
// allow close() from one thread while another is inside read_available().
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual bool is_open() const = 0;

    // Return every byte currently available without waiting; empty when
    // nothing arrived since the last call or the transport is closed.
    // Throws TransportError when the underlying stream fails.
    [[nodiscard]] virtual std::vector<uint8_t> read_available() = 0;

    // Idempotent.
    virtual void close() = 0;

    // Human-readable identity for logs (device path, "loopback", ...).
    [[nodiscard]] virtual std::string description() const = 0;
};

} // namespace dmm
