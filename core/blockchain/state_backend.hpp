/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "storage/state_snapshot.hpp"

namespace paracol::blockchain {

  /**
   * Gives access to the post-execution state of imported blocks
   */
  class StateBackend {
   public:
    virtual ~StateBackend() = default;

    /**
     * @param block_hash hash of an imported block
     * @return read-only snapshot of the state after the block was executed
     */
    virtual outcome::result<std::shared_ptr<const storage::StateSnapshot>>
    stateAt(const primitives::BlockHash &block_hash) const = 0;
  };

}  // namespace paracol::blockchain
