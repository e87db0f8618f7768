/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block_header.hpp"

namespace paracol::primitives {

  outcome::result<BlockHash> calculateBlockHash(const BlockHeader &header,
                                                const crypto::Hasher &hasher) {
    OUTCOME_TRY(encoded, scale::encode(header));
    return hasher.blake2b_256(encoded);
  }

}  // namespace paracol::primitives
