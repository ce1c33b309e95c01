#include <gtest/gtest.h>
#include <string>

#include "dmm/errors.hpp"
#include "dmm/protocol/frame_decoder.hpp"
#include "dmm/protocol/segment_table.hpp"
#include "frame_util.hpp"

using namespace dmm;
using namespace dmm::test;

TEST(FrameDecoder, ReferenceFrameIsBlankDisplay) {
  const FrameDecoder decoder;
  const auto m = decoder.decode(reference_frame());
  EXPECT_EQ(m.display, "    ");
  EXPECT_FALSE(m.value.has_value());
  EXPECT_EQ(m.unit, "");
  EXPECT_EQ(m.prefix, Prefix::None);
  EXPECT_DOUBLE_EQ(m.multiplier, 1.0);
  EXPECT_EQ(m.flags, MeterFlags{});
  EXPECT_EQ(m.flags.bar, 0);
  EXPECT_TRUE(m.name.empty());
}

TEST(FrameDecoder, EverySegmentGlyphAtLeastSignificantDigit) {
  const FrameDecoder decoder;
  for (const auto &entry : kSegmentTable) {
    SCOPED_TRACE(std::string("glyph '") + entry.glyph + "'");
    const auto m = decoder.decode(frame_with({{6, entry.pattern}}));
    EXPECT_EQ(m.display, std::string("   ") + entry.glyph);
    if (entry.glyph >= '0' && entry.glyph <= '9') {
      ASSERT_TRUE(m.value.has_value());
      EXPECT_DOUBLE_EQ(*m.value, entry.glyph - '0');
    } else {
      EXPECT_FALSE(m.value.has_value());
    }
    EXPECT_EQ(m.unit, "");
    EXPECT_EQ(m.prefix, Prefix::None);
    EXPECT_EQ(m.flags, MeterFlags{});
  }
}

TEST(FrameDecoder, EverySegmentGlyphAtEachPosition) {
  const FrameDecoder decoder;
  const std::size_t positions[] = {9, 8, 7, 6};
  for (std::size_t slot = 0; slot < 4; ++slot) {
    for (const auto &entry : kSegmentTable) {
      std::string expected = "    ";
      expected[slot] = entry.glyph;
      const auto m = decoder.decode(frame_with({{positions[slot], entry.pattern}}));
      EXPECT_EQ(m.display, expected) << "byte " << positions[slot];
      EXPECT_EQ(m.flags, MeterFlags{});
    }
  }
}

TEST(FrameDecoder, OverflowGlyphHasNoValue) {
  const FrameDecoder decoder;
  const auto m = decoder.decode(frame_with({{9, kSegL}}));
  EXPECT_NE(m.display.find('L'), std::string::npos);
  EXPECT_FALSE(m.value.has_value());

  // " 0.L" as the meter shows it on an open input.
  const auto ol = decoder.decode(digits(0x00, kSeg0, kDp | kSegL, 0x00));
  EXPECT_EQ(ol.display, " 0.L ");
  EXPECT_FALSE(ol.value.has_value());
}

TEST(FrameDecoder, SignAndDecimalPoint) {
  const FrameDecoder decoder;
  auto f = digits(kSeg1, kDp | kSeg2, kSeg3, kSeg4);
  f.bytes[10] |= 0x08;
  const auto m = decoder.decode(f);
  EXPECT_EQ(m.display, "-1.234");
  ASSERT_TRUE(m.value.has_value());
  EXPECT_DOUBLE_EQ(*m.value, -1.234);
  EXPECT_EQ(m.flags, MeterFlags{});
}

TEST(FrameDecoder, DecimalPointBeforeLastDigit) {
  const FrameDecoder decoder;
  const auto m = decoder.decode(digits(kSeg1, kSeg2, kSeg3, kDp | kSeg4));
  EXPECT_EQ(m.display, "123.4");
  ASSERT_TRUE(m.value.has_value());
  EXPECT_DOUBLE_EQ(*m.value, 123.4);
}

TEST(FrameDecoder, LeadingBlanksStillParse) {
  const FrameDecoder decoder;
  const auto m = decoder.decode(digits(0x00, 0x00, kDp | kSeg0, kSeg5));
  EXPECT_EQ(m.display, "  .05");
  ASSERT_TRUE(m.value.has_value());
  EXPECT_DOUBLE_EQ(*m.value, 0.05);
}

TEST(FrameDecoder, BlankBetweenDigitsHasNoValue) {
  const FrameDecoder decoder;
  const auto m = decoder.decode(digits(kSeg1, 0x00, kSeg2, 0x00));
  EXPECT_EQ(m.display, "1 2 ");
  EXPECT_FALSE(m.value.has_value());
}

TEST(FrameDecoder, SignWithBlankDisplayHasNoValue) {
  const FrameDecoder decoder;
  const auto m = decoder.decode(frame_with({{10, 0x08}}));
  EXPECT_EQ(m.display, "-    ");
  EXPECT_FALSE(m.value.has_value());
}

TEST(FrameDecoder, UnknownSegmentPatternNamesByte) {
  const FrameDecoder decoder;
  try {
    (void)decoder.decode(frame_with({{7, 0x01}}));
    FAIL() << "expected DecodeError";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.byte_index(), 7u);
    EXPECT_EQ(e.residual(), 0x01);
    EXPECT_NE(std::string(e.what()).find("byte 7"), std::string::npos);
  }
}

TEST(FrameDecoder, MostSignificantDigitHasNoDecimalPoint) {
  const FrameDecoder decoder;
  try {
    (void)decoder.decode(frame_with({{9, kDp | kSeg1}}));
    FAIL() << "expected DecodeError";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.byte_index(), 9u);
    EXPECT_EQ(e.residual(), kDp | kSeg1);
  }
}

TEST(FrameDecoder, CopiesTimestampAndRawBytes) {
  const FrameDecoder decoder;
  auto f = digits(kSeg1, kSeg2, kSeg3, kSeg4);
  f.captured_at = RawFrame::Clock::time_point(std::chrono::seconds(1700000000));
  const auto m = decoder.decode(f);
  EXPECT_EQ(m.timestamp, f.captured_at);
  EXPECT_EQ(m.raw, f.bytes);
}
