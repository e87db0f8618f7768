/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace paracol::application {

  enum class ConfigurationError {
    MISSING_PARA_ID = 1,
    MISSING_COLLATOR_KEY,
    MALFORMED_COLLATOR_KEY,
    ZERO_PROPOSAL_DEADLINE,
    CONFIG_FILE_UNREADABLE,
    CONFIG_FILE_MALFORMED,
  };

}  // namespace paracol::application

OUTCOME_HPP_DECLARE_ERROR(paracol::application, ConfigurationError);
