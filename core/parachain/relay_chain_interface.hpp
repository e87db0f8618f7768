/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "outcome/outcome.hpp"
#include "parachain/types.hpp"

namespace paracol::parachain {

  /**
   * Read access to the relay chain state needed by the collator
   */
  class RelayChainInterface {
   public:
    virtual ~RelayChainInterface() = default;

    /**
     * @param relay_parent relay chain block to query at
     * @param para_id parachain whose downward queue is read
     * @return contents of the downward message queue
     */
    virtual outcome::result<std::vector<InboundDownwardMessage>> dmqContents(
        const RelayHash &relay_parent, ParachainId para_id) const = 0;
  };

}  // namespace paracol::parachain
