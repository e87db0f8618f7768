/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include "common/blob.hpp"

namespace paracol::crypto {
  namespace constants::sr25519 {
    /**
     * Important constants to deal with sr25519
     */
    enum {
      KEYPAIR_SIZE = SR25519_KEYPAIR_SIZE,
      SECRET_SIZE = SR25519_SECRET_SIZE,
      PUBLIC_SIZE = SR25519_PUBLIC_SIZE,
      SIGNATURE_SIZE = SR25519_SIGNATURE_SIZE,
      SEED_SIZE = SR25519_SEED_SIZE
    };
  }  // namespace constants::sr25519

  using Sr25519SecretKey = common::Blob<constants::sr25519::SECRET_SIZE>;
  using Sr25519PublicKey = common::Blob<constants::sr25519::PUBLIC_SIZE>;
  using Sr25519Signature = common::Blob<constants::sr25519::SIGNATURE_SIZE>;
  using Sr25519Seed = common::Blob<constants::sr25519::SEED_SIZE>;

  struct Sr25519Keypair {
    Sr25519SecretKey secret_key;
    Sr25519PublicKey public_key;

    bool operator==(const Sr25519Keypair &other) const = default;
  };
}  // namespace paracol::crypto
