/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/configuration_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paracol::application, ConfigurationError, e) {
  using E = paracol::application::ConfigurationError;
  switch (e) {
    case E::MISSING_PARA_ID:
      return "Parachain id is not specified, use --para-id";
    case E::MISSING_COLLATOR_KEY:
      return "Collator key is not specified, use --collator-key";
    case E::MALFORMED_COLLATOR_KEY:
      return "Collator key must be 32 bytes in hex";
    case E::ZERO_PROPOSAL_DEADLINE:
      return "Proposal deadline must be positive";
    case E::CONFIG_FILE_UNREADABLE:
      return "Configuration file can not be opened";
    case E::CONFIG_FILE_MALFORMED:
      return "Configuration file is not a valid JSON";
  }
  return "Unknown configuration error";
}
