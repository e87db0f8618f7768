/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "crypto/sr25519_types.hpp"
#include "parachain/types.hpp"

namespace paracol::application {

  /**
   * Parameters of the collator
   */
  class CollatorConfiguration {
   public:
    virtual ~CollatorConfiguration() = default;

    /**
     * @return id of the parachain the collator produces blocks for
     */
    virtual parachain::ParachainId paraId() const = 0;

    /**
     * @return mini secret key the collator keypair is derived from
     */
    virtual crypto::Sr25519Seed collatorSeed() const = 0;

    /**
     * @return time the proposer is given to build a block
     */
    virtual std::chrono::milliseconds proposalDeadline() const = 0;

    /**
     * @return path to the YAML logging configuration, if any
     */
    virtual const std::optional<std::string> &logConfigFile() const = 0;

    /**
     * @return logging level overrides in form of group=level or level
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace paracol::application
