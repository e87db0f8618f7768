/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <sodium/crypto_generichash_blake2b.h>

namespace paracol::crypto {
  using common::Hash256;

  Hash256 HasherImpl::blake2b_256(common::BufferView data) const {
    Hash256 out;
    // unkeyed generichash only fails on out-of-range lengths
    crypto_generichash_blake2b(
        out.data(), out.size(), data.data(), data.size(), nullptr, 0);
    return out;
  }
}  // namespace paracol::crypto
