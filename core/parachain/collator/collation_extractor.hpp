/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "blockchain/state_backend.hpp"
#include "log/logger.hpp"
#include "parachain/parachain_block_data.hpp"
#include "parachain/types.hpp"
#include "storage/state_snapshot.hpp"

namespace paracol::parachain {

  /// Outputs of a parachain block which are stored in its state
  struct CollationOutputs {
    std::vector<UpwardMessage> upward_messages;
    std::optional<ParachainRuntime> new_validation_code;
    uint32_t processed_downward_messages = 0;
    /// not sourced from the state yet
    std::vector<OutboundHrmpMessage> horizontal_messages;
    BlockNumber hrmp_watermark = 0;

    bool operator==(const CollationOutputs &) const = default;
  };

  /**
   * Reads the collation outputs from the state of a freshly imported block
   * and packs them into a collation
   */
  class CollationExtractor {
   public:
    explicit CollationExtractor(
        std::shared_ptr<const blockchain::StateBackend> state_backend);

    /**
     * Read outputs from the well-known keys. Does not modify the state
     * @param state post-execution state of the block
     * @param hrmp_watermark relay block number the candidate is built for
     * @return outputs, std::nullopt if the state could not be read or some
     * value could not be decoded
     */
    std::optional<CollationOutputs> extract(
        const storage::StateSnapshot &state, BlockNumber hrmp_watermark) const;

    /**
     * Build the collation of an imported block
     * @param block_data the block with its storage proof
     * @param block_hash hash of the block
     * @param hrmp_watermark relay block number the candidate is built for
     */
    std::optional<Collation> buildCollation(
        const ParachainBlockData &block_data,
        const primitives::BlockHash &block_hash,
        BlockNumber hrmp_watermark) const;

   private:
    std::shared_ptr<const blockchain::StateBackend> state_backend_;
    log::Logger logger_;
  };

}  // namespace paracol::parachain
