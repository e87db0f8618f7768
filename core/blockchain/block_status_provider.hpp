/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/block_status.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace paracol::blockchain {

  /**
   * Answers questions about the import status of local blocks
   */
  class BlockStatusProvider {
   public:
    virtual ~BlockStatusProvider() = default;

    /**
     * @param block_hash hash of the block
     * @return status of the block or error if the status can't be determined
     */
    virtual outcome::result<BlockStatus> getBlockStatus(
        const primitives::BlockHash &block_hash) const = 0;
  };

}  // namespace paracol::blockchain
