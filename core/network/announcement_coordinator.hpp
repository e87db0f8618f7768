/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include "common/blob.hpp"
#include "network/block_announcer.hpp"
#include "primitives/common.hpp"

namespace paracol::network {

  /**
   * Holds announcement of own blocks back until the relay chain confirms the
   * candidate was seconded
   */
  class AnnouncementCoordinator {
   public:
    virtual ~AnnouncementCoordinator() = default;

    /**
     * Schedule announcement of the block. Returns immediately
     * @param block_hash hash of the produced block
     * @param pov_hash hash of the proof-of-validity of the candidate
     */
    virtual void waitToAnnounce(const primitives::BlockHash &block_hash,
                                const common::Hash256 &pov_hash) = 0;
  };

  /// Creates the coordinator which announces through the given announcer
  using AnnouncementCoordinatorFactory =
      std::function<std::shared_ptr<AnnouncementCoordinator>(BlockAnnouncer)>;

}  // namespace paracol::network
