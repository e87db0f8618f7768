/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace paracol::parachain {

  enum class CollatorError {
    FOLLOW_RELAY_CHAIN_FAILED = 1,
    INITIALIZE_SEND_FAILED,
    COLLATE_ON_SEND_FAILED,
  };

}  // namespace paracol::parachain

OUTCOME_HPP_DECLARE_ERROR(paracol::parachain, CollatorError);
