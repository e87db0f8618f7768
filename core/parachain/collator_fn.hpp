/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>

#include "parachain/types.hpp"

namespace paracol::parachain {

  using CollationCallback = std::function<void(std::optional<Collation>)>;

  /**
   * Function the collation generation subsystem calls to obtain a candidate
   * built on top of the given relay parent. Callback is invoked exactly once,
   * with std::nullopt if no candidate could be produced
   */
  using CollatorFn = std::function<void(const RelayHash &relay_parent,
                                        const ValidationData &validation_data,
                                        CollationCallback cb)>;

  /**
   * Retrieves downward messages queued for the parachain at the relay parent.
   * std::nullopt means retrieval failed, an empty vector means there are no
   * messages
   */
  using DownwardMessagesRetriever =
      std::function<std::optional<std::vector<InboundDownwardMessage>>(
          const RelayHash &relay_parent)>;

}  // namespace paracol::parachain
