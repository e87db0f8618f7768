/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "authorship/environment.hpp"
#include "consensus/block_import.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "network/announcement_coordinator.hpp"
#include "parachain/collator/availability_gate.hpp"
#include "parachain/collator/collation_extractor.hpp"
#include "parachain/collator/inherent_data_assembler.hpp"
#include "parachain/collator_fn.hpp"
#include "utils/safe_object.hpp"

namespace paracol::parachain {

  /**
   * @class Collator
   * @brief Produces parachain block candidates on request of the relay chain.
   *
   * Copies are cheap and share the proposer environment, the block importer
   * and the announcement coordinator. Environment initialization and block
   * import are serialized, each under its own lock held for that call only,
   * while everything else of concurrent requests runs in parallel.
   */
  class Collator {
   public:
    static constexpr std::chrono::milliseconds kDefaultProposalDeadline{500};

    Collator(std::shared_ptr<crypto::Hasher> hasher,
             std::shared_ptr<authorship::Environment> environment,
             std::shared_ptr<consensus::BlockImport> block_import,
             std::shared_ptr<const AvailabilityGate> availability_gate,
             std::shared_ptr<const InherentDataAssembler> inherent_assembler,
             std::shared_ptr<const CollationExtractor> extractor,
             std::shared_ptr<network::AnnouncementCoordinator> coordinator,
             std::chrono::milliseconds proposal_deadline =
                 kDefaultProposalDeadline);

    /**
     * @brief Produce a candidate on top of the parachain head known to the
     * relay chain.
     *
     * The block is built, imported into the local chain, its outputs are
     * read from the post-import state and its announcement is scheduled.
     * Any failure aborts the request. A block which is already imported stays
     * imported.
     *
     * @param relay_parent relay block the candidate is built for
     * @param validation_data validation data at the relay parent
     * @param cb invoked exactly once, with the collation or std::nullopt
     */
    void produceCandidate(const RelayHash &relay_parent,
                          const ValidationData &validation_data,
                          CollationCallback cb) const;

    /// The collator as the collation generation subsystem expects it
    CollatorFn asCollatorFn() const;

   private:
    using SafeEnvironment =
        SafeObject<std::shared_ptr<authorship::Environment>, std::mutex>;
    using SafeBlockImport =
        SafeObject<std::shared_ptr<consensus::BlockImport>, std::mutex>;

    /// Result of Environment::init which arrived before init returned
    struct ProposerHandoff {
      std::mutex mutex;
      bool init_returned = false;
      std::optional<outcome::result<std::shared_ptr<authorship::Proposer>>>
          early_result;
    };

    void onProposerReady(
        outcome::result<std::shared_ptr<authorship::Proposer>> proposer_res,
        const RelayHash &relay_parent,
        const ValidationData &validation_data,
        const primitives::BlockHash &parent_hash,
        CollationCallback cb) const;

    void onProposed(outcome::result<authorship::Proposal> proposal_res,
                    BlockNumber hrmp_watermark,
                    const primitives::BlockHash &parent_hash,
                    CollationCallback cb) const;

    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<SafeEnvironment> environment_;
    std::shared_ptr<SafeBlockImport> block_import_;
    std::shared_ptr<const AvailabilityGate> availability_gate_;
    std::shared_ptr<const InherentDataAssembler> inherent_assembler_;
    std::shared_ptr<const CollationExtractor> extractor_;
    std::shared_ptr<network::AnnouncementCoordinator> coordinator_;
    std::chrono::milliseconds proposal_deadline_;
    log::Logger logger_;
  };

}  // namespace paracol::parachain
