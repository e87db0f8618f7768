/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "primitives/digest.hpp"
#include "primitives/inherent_data.hpp"
#include "primitives/storage_proof.hpp"
#include "storage/storage_changes.hpp"

namespace paracol::authorship {

  /// Whether the proposer must record the trie nodes accessed while building
  enum class RecordProof : bool { No = false, Yes = true };

  /**
   * Result of block authoring
   */
  struct Proposal {
    primitives::Block block;
    storage::StorageChanges storage_changes;
    /// present iff the proof was requested and recorded
    std::optional<primitives::StorageProof> proof;
  };

  /**
   * Create block to further proposal for consensus
   */
  class Proposer {
   public:
    using ProposeCallback = std::function<void(outcome::result<Proposal>)>;

    virtual ~Proposer() = default;

    /**
     * Creates block on top of the parent the proposer was created for
     * @param inherent_data additional data on block from unsigned extrinsics
     * @param inherent_digest chain-specific block auxiliary data
     * @param max_duration proposer must finish before this time elapses
     * @param record_proof whether storage proof should be recorded
     * @param cb receives proposed block or error, may be called on any thread
     */
    virtual void propose(primitives::InherentData inherent_data,
                         primitives::Digest inherent_digest,
                         std::chrono::milliseconds max_duration,
                         RecordProof record_proof,
                         ProposeCallback cb) = 0;
  };

}  // namespace paracol::authorship
