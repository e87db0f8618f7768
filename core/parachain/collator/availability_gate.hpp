/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "blockchain/block_status_provider.hpp"
#include "log/logger.hpp"
#include "primitives/common.hpp"

namespace paracol::parachain {

  /**
   * Decides whether a parachain block can be built upon, judging by its
   * local import status only
   */
  class AvailabilityGate {
   public:
    explicit AvailabilityGate(
        std::shared_ptr<const blockchain::BlockStatusProvider> block_status);

    /**
     * @param hash parent block hash
     * @return true only if the block is imported and its state is available
     */
    bool isBuildable(const primitives::BlockHash &hash) const;

   private:
    std::shared_ptr<const blockchain::BlockStatusProvider> block_status_;
    log::Logger logger_;
  };

}  // namespace paracol::parachain
