#include <gtest/gtest.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "dmm/errors.hpp"
#include "dmm/io/serial_transport.hpp"
#include "frame_util.hpp"

using namespace dmm;
using namespace dmm::test;

namespace {

// Pseudo-terminal pair standing in for a USB-serial adapter. The transport
// opens the slave side; the test writes to and closes the master side.
struct PseudoTerminal {
  int master = -1;
  std::string slave_path;

  PseudoTerminal() {
    master = ::posix_openpt(O_RDWR | O_NOCTTY);
    if (master < 0 || ::grantpt(master) != 0 || ::unlockpt(master) != 0) return;
    const char *name = ::ptsname(master);
    if (name) slave_path = name;
  }
  ~PseudoTerminal() { hang_up(); }

  [[nodiscard]] bool ok() const { return master >= 0 && !slave_path.empty(); }

  void write_bytes(const std::vector<uint8_t> &bytes) const {
    ASSERT_EQ(::write(master, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
  }

  // Closing the master hangs up the slave, as unplugging an adapter does.
  void hang_up() {
    if (master >= 0) ::close(master);
    master = -1;
  }
};

} // namespace

TEST(SerialTransport, MissingDeviceThrows) {
  EXPECT_THROW(SerialTransport(SerialConfig{"/dev/dmm-link-no-such-port", 2400}), TransportError);
}

TEST(SerialTransport, UnsupportedBaudThrows) {
  PseudoTerminal pty;
  ASSERT_TRUE(pty.ok());
  EXPECT_THROW(SerialTransport(SerialConfig{pty.slave_path, 1234}), TransportError);
}

TEST(SerialTransport, ReadsWhatArrivedWithoutBlocking) {
  PseudoTerminal pty;
  ASSERT_TRUE(pty.ok());
  SerialTransport transport(SerialConfig{pty.slave_path, 2400});
  EXPECT_TRUE(transport.is_open());
  EXPECT_EQ(transport.description(), pty.slave_path);
  EXPECT_TRUE(transport.read_available().empty());

  const auto sent = wire(digits(kSeg1, kSeg2, kSeg3, kSeg4));
  pty.write_bytes(sent);
  std::vector<uint8_t> got;
  ASSERT_TRUE(wait_until([&] {
    const auto chunk = transport.read_available();
    got.insert(got.end(), chunk.begin(), chunk.end());
    return got.size() >= sent.size();
  }));
  EXPECT_EQ(got, sent);

  transport.close();
  EXPECT_FALSE(transport.is_open());
  EXPECT_TRUE(transport.read_available().empty());
  transport.close();
}

TEST(SerialTransport, HangupRaisesTransportError) {
  PseudoTerminal pty;
  ASSERT_TRUE(pty.ok());
  SerialTransport transport(SerialConfig{pty.slave_path, 2400});
  pty.hang_up();
  EXPECT_THROW((void)transport.read_available(), TransportError);
}
