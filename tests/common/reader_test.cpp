// tests/common/reader_test.cpp
// Tests for the big-endian cursor and MIDI VLQ decoding.

#include "common/reader.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "common/errors.hpp"

namespace {

TEST(BytesTest, ReadsBigEndianFields) {
  const std::vector<std::uint8_t> buf = {0x12, 0x34, 0x07, 0xA1, 0x20,
                                         0xDE, 0xAD, 0xBE, 0xEF};
  Bytes r(buf);
  EXPECT_EQ(r.be16(), 0x1234);
  EXPECT_EQ(r.be24(), 0x07A120u); // 500000
  EXPECT_EQ(r.be32(), 0xDEADBEEFu);
  EXPECT_TRUE(r.eof());
}

TEST(BytesTest, UnderrunThrowsContainerParse) {
  const std::vector<std::uint8_t> buf = {0x00, 0x01, 0x02};
  Bytes r(buf);
  try {
    (void)r.be32();
    FAIL() << "expected an exception";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::ContainerParse);
  }
  // A failed read does not move the cursor.
  EXPECT_EQ(r.remaining(), 3u);
}

TEST(BytesTest, SliceAdvancesParent) {
  const std::vector<std::uint8_t> buf = {1, 2, 3, 4, 5};
  Bytes r(buf);
  Bytes sub = r.slice(3);
  EXPECT_EQ(sub.remaining(), 3u);
  EXPECT_EQ(sub.u8(), 1);
  EXPECT_EQ(r.u8(), 4);
  EXPECT_THROW((void)r.slice(2), common::Error);
}

TEST(VlqTest, DecodesStandardExamples) {
  // Values from the SMF 1.0 document.
  const std::vector<std::uint8_t> buf = {0x00, 0x7F, 0x81, 0x00, 0xC0, 0x00,
                                         0xFF, 0xFF, 0x7F, 0xFF, 0xFF, 0xFF,
                                         0x7F};
  Bytes r(buf);
  EXPECT_EQ(read_vlq(r), 0x00u);
  EXPECT_EQ(read_vlq(r), 0x7Fu);
  EXPECT_EQ(read_vlq(r), 0x80u);
  EXPECT_EQ(read_vlq(r), 0x2000u);
  EXPECT_EQ(read_vlq(r), 0x1FFFFFu);
  EXPECT_EQ(read_vlq(r), 0x0FFFFFFFu);
  EXPECT_TRUE(r.eof());
}

TEST(VlqTest, RejectsFiveByteQuantity) {
  const std::vector<std::uint8_t> buf = {0x81, 0x81, 0x81, 0x81, 0x01};
  Bytes r(buf);
  EXPECT_THROW((void)read_vlq(r), common::Error);
}

TEST(VlqTest, TruncatedQuantityThrows) {
  const std::vector<std::uint8_t> buf = {0x81};
  Bytes r(buf);
  EXPECT_THROW((void)read_vlq(r), common::Error);
}

} // namespace
