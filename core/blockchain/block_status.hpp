/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <fmt/format.h>

namespace paracol::blockchain {

  /**
   * Status of a block, as known by the local chain
   */
  enum class BlockStatus {
    Queued,            ///< added to the import queue, state not ready yet
    InChainWithState,  ///< imported, state is available
    InChainPruned,     ///< imported, state was discarded
    KnownBad,          ///< marked invalid
    Unknown,           ///< never seen
  };

  inline std::string_view toString(BlockStatus status) {
    switch (status) {
      case BlockStatus::Queued:
        return "Queued";
      case BlockStatus::InChainWithState:
        return "InChainWithState";
      case BlockStatus::InChainPruned:
        return "InChainPruned";
      case BlockStatus::KnownBad:
        return "KnownBad";
      case BlockStatus::Unknown:
        return "Unknown";
    }
    return "?";
  }

}  // namespace paracol::blockchain

template <>
struct fmt::formatter<paracol::blockchain::BlockStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(paracol::blockchain::BlockStatus status,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        paracol::blockchain::toString(status), ctx);
  }
};
