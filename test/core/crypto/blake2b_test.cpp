/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <gtest/gtest.h>

#include "common/buffer.hpp"

using paracol::common::Buffer;
using paracol::crypto::HasherImpl;

/**
 * @given empty input
 * @when blake2b-256 is computed
 * @then well-known digest of the empty string is returned
 */
TEST(Blake2b, EmptyInput256) {
  HasherImpl hasher;
  EXPECT_EQ(hasher.blake2b_256(Buffer{}).toHex(),
            "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

/**
 * @given "abc"
 * @when blake2b-256 is computed
 * @then well-known digest of "abc" is returned
 */
TEST(Blake2b, Abc256) {
  HasherImpl hasher;
  EXPECT_EQ(hasher.blake2b_256(Buffer::fromString("abc")).toHex(),
            "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
}

/**
 * @given two inputs differing in a single byte past the first block
 * @when blake2b-256 is computed for both
 * @then digests differ and repeated hashing is stable
 */
TEST(Blake2b, MultiBlockInput) {
  HasherImpl hasher;
  Buffer data;
  for (size_t i = 0; i < 300; ++i) {
    data.push_back(static_cast<uint8_t>(i * 7));
  }
  auto other = data;
  other[200] ^= 1;

  EXPECT_EQ(hasher.blake2b_256(data), hasher.blake2b_256(data));
  EXPECT_NE(hasher.blake2b_256(data), hasher.blake2b_256(other));
}
