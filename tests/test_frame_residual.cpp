#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "dmm/errors.hpp"
#include "dmm/protocol/frame_decoder.hpp"
#include "frame_util.hpp"

using namespace dmm;
using namespace dmm::test;

namespace {

struct Stray {
  std::size_t index;
  uint8_t bit;
};

// Bits no field claims. Bytes 11..17 and 21 are fully used; segment bytes are
// covered by the unknown-pattern tests.
const std::vector<Stray> kStrayBits = {
    {18, 0x10}, {18, 0x40}, {18, 0x80},
    {19, 0x04}, {19, 0x10}, {19, 0x20},
    {20, 0x04}, {20, 0x08},
    {10, 0x10}, {10, 0x40},
};

} // namespace

TEST(FrameResidual, StrayIconBitsAreReported) {
  const FrameDecoder decoder;
  for (const auto &s : kStrayBits) {
    SCOPED_TRACE("byte " + std::to_string(s.index) + " bit " + std::to_string(s.bit));
    try {
      (void)decoder.decode(frame_with({{s.index, s.bit}}));
      ADD_FAILURE() << "expected DecodeError";
    } catch (const DecodeError &e) {
      EXPECT_EQ(e.byte_index(), s.index);
      EXPECT_EQ(e.residual(), s.bit);
    }
  }
}

TEST(FrameResidual, FixedHeaderBytesMustMatch) {
  const FrameDecoder decoder;
  for (std::size_t index = 0; index < 6; ++index) {
    for (int bit = 0; bit < 8; ++bit) {
      auto f = reference_frame();
      f.bytes[index] ^= static_cast<uint8_t>(1u << bit);
      try {
        (void)decoder.decode(f);
        ADD_FAILURE() << "byte " << index << " bit " << bit << " accepted";
      } catch (const DecodeError &e) {
        EXPECT_EQ(e.byte_index(), index);
        EXPECT_EQ(e.residual(), f.bytes[index]);
      }
    }
  }
}

TEST(FrameResidual, FirstOffendingByteIsNamed) {
  const FrameDecoder decoder;
  auto f = frame_with({{20, 0x08}});
  f.bytes[3] = 0x00;
  try {
    (void)decoder.decode(f);
    FAIL() << "expected DecodeError";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.byte_index(), 3u);
    EXPECT_NE(std::string(e.what()).find("AA 55 52 00"), std::string::npos);
  }
}

TEST(FrameResidual, MisalignedFrameIsRejected) {
  // Sync marker found inside the previous frame's data: the fixed header
  // bytes land in the wrong place and the residual check catches it.
  const FrameDecoder decoder;
  auto f = reference_frame();
  for (std::size_t i = 2; i < kFrameLength; ++i) f.bytes[i] = 0x00;
  EXPECT_THROW((void)decoder.decode(f), DecodeError);
}

TEST(FrameResidual, FailureDoesNotAffectNextFrame) {
  const FrameDecoder decoder;
  EXPECT_THROW((void)decoder.decode(frame_with({{20, 0x04}})), DecodeError);
  const auto m = decoder.decode(digits(kSeg1, kSeg2, kSeg3, kSeg4));
  EXPECT_EQ(m.display, "1234");
}
