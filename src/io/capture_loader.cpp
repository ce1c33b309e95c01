#include "dmm/io/capture_loader.hpp"

#include <fstream>
#include <stdexcept>

namespace dmm {

std::vector<uint8_t> CaptureLoader::load(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open capture file: " + path.string());
    }

    file.seekg(0, std::ios::end);
    const std::streampos file_size = file.tellg();
    if (file_size < 0) {
        throw std::runtime_error("Failed to size capture file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<std::size_t>(file_size));
    file.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("Failed to read capture data from file: " + path.string());
    }
    return bytes;
}

} // namespace dmm
