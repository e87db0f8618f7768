/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_provider.hpp"

namespace paracol::crypto {

  class Sr25519ProviderImpl : public Sr25519Provider {
   public:
    Sr25519Keypair generateKeypair(const Sr25519Seed &seed) const override;

    Sr25519Signature sign(const Sr25519Keypair &keypair,
                          common::BufferView message) const override;

    bool verify(const Sr25519Signature &signature,
                common::BufferView message,
                const Sr25519PublicKey &public_key) const override;
  };

}  // namespace paracol::crypto
