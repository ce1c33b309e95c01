#include "dmm/io/serial_transport.hpp"

#include "dmm/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace dmm {

namespace {

speed_t baud_to_speed(uint32_t baud) {
    switch (baud) {
        case 1200: return B1200;
        case 2400: return B2400;
        case 4800: return B4800;
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        default: break;
    }
    throw TransportError("unsupported baud rate " + std::to_string(baud));
}

std::string errno_text(const std::string &what, const std::string &device) {
    return what + " " + device + ": " + std::strerror(errno);
}

} // namespace

SerialTransport::SerialTransport(const SerialConfig &config) : config_(config) {
    const speed_t speed = baud_to_speed(config_.baud);

    fd_ = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        throw TransportError(errno_text("cannot open", config_.device));
    }

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) {
        const std::string cause = errno_text("tcgetattr failed on", config_.device);
        close();
        throw TransportError(cause);
    }

    ::cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag &= ~PARENB;
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
        const std::string cause = errno_text("tcsetattr failed on", config_.device);
        close();
        throw TransportError(cause);
    }
    // Drop whatever the driver buffered before we configured the line.
    ::tcflush(fd_, TCIFLUSH);
}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

std::vector<uint8_t> SerialTransport::read_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint8_t> out;
    if (fd_ < 0) {
        return out;
    }
    uint8_t tmp[256];
    while (true) {
        const ssize_t n = ::read(fd_, tmp, sizeof(tmp));
        if (n > 0) {
            out.insert(out.end(), tmp, tmp + n);
            continue;
        }
        if (n == 0) {
            // Non-blocking raw mode reports "no data" as EAGAIN; EOF means hangup.
            throw TransportError("device hung up: " + config_.device);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        throw TransportError(errno_text("read failed on", config_.device));
    }
    return out;
}

void SerialTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace dmm
