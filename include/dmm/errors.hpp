#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dmm {

// Raised by FrameDecoder when a frame byte holds an unrecognized pattern or
// keeps bits set after every known field has been extracted. The frame is
// dropped; decoder and buffer state are unaffected.
class DecodeError : public std::runtime_error {
public:
    DecodeError(std::size_t byte_index, uint8_t residual, const std::string &what)
        : std::runtime_error(what), byte_index_(byte_index), residual_(residual) {}

    // 0-based index inside the 22-byte frame.
    [[nodiscard]] std::size_t byte_index() const noexcept { return byte_index_; }
    // Value left at `byte_index` when decoding stopped.
    [[nodiscard]] uint8_t residual() const noexcept { return residual_; }

private:
    std::size_t byte_index_ = 0;
    uint8_t residual_ = 0;
};

// Opening or reading the byte stream failed. Never retried automatically.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string &cause)
        : std::runtime_error("transport error: " + cause), cause_(cause) {}

    [[nodiscard]] const std::string &cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

} // namespace dmm
