/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/buffer_view.hpp"
#include "primitives/inherent_data.hpp"

namespace paracol::parachain {

  namespace well_known_keys {
    /// Upward messages sent by the block, SCALE encoded Vec<Vec<u8>>
    constexpr std::string_view kUpwardMessages = ":cumulus_upward_messages:";

    /// New validation code requested by the block, raw bytes
    constexpr std::string_view kNewValidationCode =
        ":cumulus_new_validation_code:";

    /// Number of processed downward messages, SCALE encoded u32
    constexpr std::string_view kProcessedDownwardMessages =
        ":cumulus_processed_downward_messages:";

    inline common::BufferView asKey(std::string_view key) {
      return common::BufferView(std::span<const char>(key));
    }
  }  // namespace well_known_keys

  /// Identifier of the inherent carrying ValidationData
  inline const primitives::InherentIdentifier kValidationDataIdentifier =
      primitives::InherentIdentifier::fromString("valfunp0").value();

  /// Identifier of the inherent carrying downward messages
  inline const primitives::InherentIdentifier kDownwardMessagesIdentifier =
      primitives::InherentIdentifier::fromString("cumdownm").value();

}  // namespace paracol::parachain
