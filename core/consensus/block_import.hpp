/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <boost/variant.hpp>

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "storage/storage_changes.hpp"

namespace paracol::consensus {

  /// Where the imported block comes from
  enum class BlockOrigin {
    Genesis,
    NetworkInitialSync,
    NetworkBroadcast,
    ConsensusBroadcast,
    Own,
    File,
  };

  /// Fork choice is decided by the configured chain selection rule
  struct LongestChain {
    bool operator==(const LongestChain &) const = default;
  };

  /// Fork choice is decided by the importer
  struct Custom {
    bool is_best;

    bool operator==(const Custom &) const = default;
  };

  using ForkChoiceStrategy = boost::variant<LongestChain, Custom>;

  /**
   * Everything needed to import a block
   */
  struct BlockImportParams {
    BlockOrigin origin;
    primitives::BlockHeader header;
    std::optional<primitives::BlockBody> body;
    /// changes computed while building, saves re-execution on import
    std::optional<storage::StorageChanges> storage_changes;
    ForkChoiceStrategy fork_choice;
  };

  enum class ImportResult {
    Imported,
    AlreadyInChain,
  };

  /**
   * Imports blocks into the local chain
   */
  class BlockImport {
   public:
    virtual ~BlockImport() = default;

    /**
     * @param params block and its import parameters
     * @return import result or error if the block was rejected
     */
    virtual outcome::result<ImportResult> importBlock(
        BlockImportParams params) = 0;
  };

}  // namespace paracol::consensus
