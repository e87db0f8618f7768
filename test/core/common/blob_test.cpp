/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace paracol::common;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::string hex32 = "00ff";
  std::array<uint8_t, 2> expected{0, 255};

  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex(hex32));
  EXPECT_EQ(blob, expected);
}

/**
 * @given non hex string
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromNonHex) {
  EXPECT_EC(Blob<2>::fromHex("nothex"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given hex string of the length different from the blob size
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromWrongLengthHex) {
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given arbitrary string
 * @when create blob object from this string using fromString method
 * @then blob object contains the bytes of the string
 */
TEST(BlobTest, CreateFromValidString) {
  std::array<uint8_t, 8> expected{'v', 'a', 'l', 'f', 'u', 'n', 'p', '0'};

  EXPECT_OUTCOME_TRUE(blob, Blob<8>::fromString("valfunp0"));
  EXPECT_EQ(blob, expected);
}

/**
 * @given string shorter than the blob
 * @when create blob object from this string using fromString method
 * @then INCORRECT_LENGTH error is returned
 */
TEST(BlobTest, CreateFromInvalidString) {
  EXPECT_EC(Blob<5>::fromString("0"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given blob created from a prefixed hex
 * @when blob is printed
 * @then toHex returns the same hex without prefix, fmt shortens it
 */
TEST(BlobTest, ToHexAndFormat) {
  auto hex =
      "0x0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8";
  EXPECT_OUTCOME_TRUE(blob, Hash256::fromHexWithPrefix(hex));
  EXPECT_EQ("0x" + blob.toHex(), hex);
  EXPECT_EQ(fmt::format("{}", blob), "0x0e57…e3a8");
  EXPECT_EQ(fmt::format("{:l}", blob), hex);
}

/**
 * @given the same key in hex with and without 0x prefix
 * @when blobs are created with fromHexAnyPrefix
 * @then both give the same blob, and a bare 0x is rejected
 */
TEST(BlobTest, FromHexAnyPrefix) {
  EXPECT_OUTCOME_TRUE(prefixed, Blob<2>::fromHexAnyPrefix("0x01ab"));
  EXPECT_OUTCOME_TRUE(bare, Blob<2>::fromHexAnyPrefix("01ab"));
  EXPECT_EQ(prefixed, bare);
  EXPECT_EQ(bare, (std::array<uint8_t, 2>{0x01, 0xab}));
  EXPECT_EC(Blob<2>::fromHexAnyPrefix("0x"), BlobError::INCORRECT_LENGTH);
}
