#pragma once

#include "dmm/io/transport.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dmm {

// In-memory transport: bytes written with inject() are returned by the next
// read_available(). Lets the acquisition path run without hardware, e.g. in
// tests or when replaying a capture.
class LoopbackTransport : public Transport {
public:
    LoopbackTransport() = default;

    // Queue bytes for the reader. Ignored once closed.
    void inject(std::span<const uint8_t> bytes);

    // Make the next read_available() throw TransportError(cause).
    void fail_next_read(std::string cause);

    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] std::vector<uint8_t> read_available() override;
    void close() override;
    [[nodiscard]] std::string description() const override { return "loopback"; }

    // Number of read_available() calls so far; lets tests wait for a poll.
    [[nodiscard]] std::size_t reads() const;

private:
    mutable std::mutex mutex_;
    std::vector<uint8_t> pending_;
    std::optional<std::string> failure_;
    std::size_t reads_ = 0;
    bool open_ = true;
};

} // namespace dmm
