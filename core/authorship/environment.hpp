/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include "authorship/proposer.hpp"
#include "primitives/block_header.hpp"

namespace paracol::authorship {

  /**
   * Factory of proposers. Stateful, so calls must not interleave
   */
  class Environment {
   public:
    using InitCallback =
        std::function<void(outcome::result<std::shared_ptr<Proposer>>)>;

    virtual ~Environment() = default;

    /**
     * Prepare a proposer building on top of the given parent
     * @param parent_header header of the block to build on
     * @param cb receives the proposer once it is ready
     */
    virtual void init(const primitives::BlockHeader &parent_header,
                      InitCallback cb) = 0;
  };

}  // namespace paracol::authorship
