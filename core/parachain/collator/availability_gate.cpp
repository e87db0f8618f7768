/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/availability_gate.hpp"

#include <boost/assert.hpp>

namespace paracol::parachain {

  AvailabilityGate::AvailabilityGate(
      std::shared_ptr<const blockchain::BlockStatusProvider> block_status)
      : block_status_{std::move(block_status)},
        logger_{log::createLogger("AvailabilityGate", "collator")} {
    BOOST_ASSERT(block_status_);
  }

  bool AvailabilityGate::isBuildable(const primitives::BlockHash &hash) const {
    auto status_res = block_status_->getBlockStatus(hash);
    if (status_res.has_error()) {
      SL_ERROR(logger_,
               "Failed to get block status of {}: {}",
               hash,
               status_res.error());
      return false;
    }

    using blockchain::BlockStatus;
    switch (status_res.value()) {
      case BlockStatus::Queued:
        SL_DEBUG(logger_,
                 "Skipping candidate production, because block {} is still "
                 "queued for import",
                 hash);
        return false;
      case BlockStatus::InChainWithState:
        return true;
      case BlockStatus::InChainPruned:
        SL_ERROR(logger_,
                 "Skipping candidate production, because block {} is already "
                 "pruned",
                 hash);
        return false;
      case BlockStatus::KnownBad:
        SL_ERROR(logger_,
                 "Block {} is tagged as known bad and is included in the "
                 "relay chain! Skipping candidate production!",
                 hash);
        return false;
      case BlockStatus::Unknown:
        SL_DEBUG(logger_,
                 "Skipping candidate production, because block {} is unknown",
                 hash);
        return false;
    }
    return false;
  }

}  // namespace paracol::parachain
