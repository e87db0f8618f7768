/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/collator_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(paracol::parachain, CollatorError, e) {
  using E = paracol::parachain::CollatorError;
  switch (e) {
    case E::FOLLOW_RELAY_CHAIN_FAILED:
      return "Failed to start following the relay chain";
    case E::INITIALIZE_SEND_FAILED:
      return "Failed to send Initialize message to the collation generation "
             "subsystem";
    case E::COLLATE_ON_SEND_FAILED:
      return "Failed to send CollateOn message to the collator protocol";
  }
  return "Unknown collator error";
}
