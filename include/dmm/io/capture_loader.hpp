#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace dmm {

class CaptureLoader {
public:
    // Load a raw serial capture: the bytes exactly as the meter sent them,
    // no header or framing. Captures may start mid-frame.
    // Throws std::runtime_error on I/O errors.
    static std::vector<uint8_t> load(const std::filesystem::path &path);
};

} // namespace dmm
