/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer_view.hpp"
#include "crypto/sr25519_types.hpp"

namespace paracol::crypto {

  class Sr25519Provider {
   public:
    virtual ~Sr25519Provider() = default;

    /**
     * Expand the mini secret key into the keypair
     */
    virtual Sr25519Keypair generateKeypair(const Sr25519Seed &seed) const = 0;

    /**
     * Sign \param message with \param keypair
     * @param keypair pair of public and secret sr25519 keys
     * @param message bytes to be signed
     * @return signature, randomized on every call
     */
    virtual Sr25519Signature sign(const Sr25519Keypair &keypair,
                                  common::BufferView message) const = 0;

    /**
     * Verifies that \param signature of \param message was made by the owner
     * of \param public_key
     */
    virtual bool verify(const Sr25519Signature &signature,
                        common::BufferView message,
                        const Sr25519PublicKey &public_key) const = 0;
  };
}  // namespace paracol::crypto
