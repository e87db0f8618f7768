/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "network/block_announcer.hpp"
#include "outcome/outcome.hpp"
#include "parachain/types.hpp"

namespace paracol::parachain {

  /**
   * Parachain consensus driven by the relay chain
   */
  class ParachainConsensus {
   public:
    using FollowTask = std::function<void()>;

    virtual ~ParachainConsensus() = default;

    /**
     * Prepare the task that follows the relay chain and updates the best
     * parachain block accordingly
     * @param para_id parachain to follow
     * @param announce_block used to announce newly included blocks
     * @return task to be run in background
     */
    virtual outcome::result<FollowTask> followRelayChain(
        ParachainId para_id, network::BlockAnnouncer announce_block) = 0;
  };

}  // namespace paracol::parachain
