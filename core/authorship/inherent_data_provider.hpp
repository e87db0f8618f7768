/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/inherent_data.hpp"

namespace paracol::authorship {

  /**
   * Source of the generic inherents (timestamp and alike) every block needs
   */
  class InherentDataProvider {
   public:
    virtual ~InherentDataProvider() = default;

    /**
     * @return freshly created inherent data or error if some of the inherents
     * could not be produced
     */
    virtual outcome::result<primitives::InherentData> createInherentData()
        const = 0;
  };

}  // namespace paracol::authorship
