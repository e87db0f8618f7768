/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/collator.hpp"

#include <boost/assert.hpp>

#include "parachain/parachain_block_data.hpp"

namespace paracol::parachain {

  Collator::Collator(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<authorship::Environment> environment,
      std::shared_ptr<consensus::BlockImport> block_import,
      std::shared_ptr<const AvailabilityGate> availability_gate,
      std::shared_ptr<const InherentDataAssembler> inherent_assembler,
      std::shared_ptr<const CollationExtractor> extractor,
      std::shared_ptr<network::AnnouncementCoordinator> coordinator,
      std::chrono::milliseconds proposal_deadline)
      : hasher_{std::move(hasher)},
        environment_{std::make_shared<SafeEnvironment>(std::move(environment))},
        block_import_{
            std::make_shared<SafeBlockImport>(std::move(block_import))},
        availability_gate_{std::move(availability_gate)},
        inherent_assembler_{std::move(inherent_assembler)},
        extractor_{std::move(extractor)},
        coordinator_{std::move(coordinator)},
        proposal_deadline_{proposal_deadline},
        logger_{log::createLogger("Collator", "collator")} {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(environment_->unsafeGet());
    BOOST_ASSERT(block_import_->unsafeGet());
    BOOST_ASSERT(availability_gate_);
    BOOST_ASSERT(inherent_assembler_);
    BOOST_ASSERT(extractor_);
    BOOST_ASSERT(coordinator_);
  }

  CollatorFn Collator::asCollatorFn() const {
    return [self{*this}](const RelayHash &relay_parent,
                         const ValidationData &validation_data,
                         CollationCallback cb) {
      self.produceCandidate(relay_parent, validation_data, std::move(cb));
    };
  }

  void Collator::produceCandidate(const RelayHash &relay_parent,
                                  const ValidationData &validation_data,
                                  CollationCallback cb) const {
    auto header_res = scale::decode<primitives::BlockHeader>(
        validation_data.persisted.parent_head);
    if (header_res.has_error()) {
      SL_ERROR(logger_,
               "Could not decode the head data: {}",
               header_res.error());
      return cb(std::nullopt);
    }
    auto &parent_header = header_res.value();

    auto parent_hash_res =
        primitives::calculateBlockHash(parent_header, *hasher_);
    if (parent_hash_res.has_error()) {
      SL_ERROR(logger_,
               "Could not calculate hash of the head data: {}",
               parent_hash_res.error());
      return cb(std::nullopt);
    }
    const auto &parent_hash = parent_hash_res.value();
    parent_header.hash_opt = parent_hash;

    if (not availability_gate_->isBuildable(parent_hash)) {
      return cb(std::nullopt);
    }

    SL_INFO(logger_,
            "Starting collation for relay parent {} on parent {}",
            relay_parent,
            parent_hash);

    // The environment lock covers the init call only. A proposer delivered
    // before init returns is taken over by this thread after the lock is
    // released, otherwise the callback thread continues the pipeline.
    auto handoff = std::make_shared<ProposerHandoff>();
    environment_->exclusiveAccess([&](auto &environment) {
      environment->init(
          parent_header,
          [self{*this},
           handoff,
           relay_parent,
           validation_data,
           parent_hash,
           cb](
              outcome::result<std::shared_ptr<authorship::Proposer>>
                  proposer_res) mutable {
            {
              std::lock_guard lock(handoff->mutex);
              if (not handoff->init_returned) {
                handoff->early_result.emplace(std::move(proposer_res));
                return;
              }
            }
            self.onProposerReady(std::move(proposer_res),
                                 relay_parent,
                                 validation_data,
                                 parent_hash,
                                 std::move(cb));
          });
    });

    std::optional<outcome::result<std::shared_ptr<authorship::Proposer>>>
        early_result;
    {
      std::lock_guard lock(handoff->mutex);
      handoff->init_returned = true;
      early_result = std::move(handoff->early_result);
    }
    if (early_result.has_value()) {
      onProposerReady(std::move(early_result.value()),
                      relay_parent,
                      validation_data,
                      parent_hash,
                      std::move(cb));
    }
  }

  void Collator::onProposerReady(
      outcome::result<std::shared_ptr<authorship::Proposer>> proposer_res,
      const RelayHash &relay_parent,
      const ValidationData &validation_data,
      const primitives::BlockHash &parent_hash,
      CollationCallback cb) const {
    if (proposer_res.has_error()) {
      SL_ERROR(logger_,
               "Could not create proposer on parent {}: {}",
               parent_hash,
               proposer_res.error());
      return cb(std::nullopt);
    }
    auto proposer = std::move(proposer_res.value());

    auto inherent_data =
        inherent_assembler_->assemble(validation_data, relay_parent);
    if (not inherent_data.has_value()) {
      return cb(std::nullopt);
    }

    proposer->propose(
        std::move(inherent_data.value()),
        primitives::Digest{},
        proposal_deadline_,
        authorship::RecordProof::Yes,
        [self{*this},
         proposer,
         hrmp_watermark{validation_data.persisted.block_number},
         parent_hash,
         cb](outcome::result<authorship::Proposal> proposal_res) mutable {
          self.onProposed(std::move(proposal_res),
                          hrmp_watermark,
                          parent_hash,
                          std::move(cb));
        });
  }

  void Collator::onProposed(outcome::result<authorship::Proposal> proposal_res,
                            BlockNumber hrmp_watermark,
                            const primitives::BlockHash &parent_hash,
                            CollationCallback cb) const {
    if (proposal_res.has_error()) {
      SL_ERROR(logger_,
               "Proposing failed on parent {}: {}",
               parent_hash,
               proposal_res.error());
      return cb(std::nullopt);
    }
    auto &proposal = proposal_res.value();

    if (not proposal.proof.has_value()) {
      SL_ERROR(logger_, "Proposer did not return the requested proof.");
      return cb(std::nullopt);
    }

    auto &header = proposal.block.header;
    if (header.parent_hash != parent_hash) {
      SL_ERROR(logger_,
               "Proposer built block on {} instead of requested parent {}",
               header.parent_hash,
               parent_hash);
      return cb(std::nullopt);
    }

    auto block_hash_res = primitives::calculateBlockHash(header, *hasher_);
    if (block_hash_res.has_error()) {
      SL_ERROR(logger_,
               "Could not calculate hash of the built block: {}",
               block_hash_res.error());
      return cb(std::nullopt);
    }
    const auto &block_hash = block_hash_res.value();
    header.hash_opt = block_hash;

    ParachainBlockData block_data{
        .header = header,
        .extrinsics = proposal.block.body,
        .storage_proof = std::move(proposal.proof.value()),
    };

    consensus::BlockImportParams import_params{
        .origin = consensus::BlockOrigin::Own,
        .header = std::move(header),
        .body = std::move(proposal.block.body),
        .storage_changes = std::move(proposal.storage_changes),
        .fork_choice = consensus::Custom{false},
    };

    auto import_res = block_import_->exclusiveAccess([&](auto &block_import) {
      return block_import->importBlock(std::move(import_params));
    });
    if (import_res.has_error()) {
      SL_ERROR(logger_,
               "Error importing build block (at {}): {}",
               parent_hash,
               import_res.error());
      return cb(std::nullopt);
    }

    auto collation =
        extractor_->buildCollation(block_data, block_hash, hrmp_watermark);
    if (not collation.has_value()) {
      return cb(std::nullopt);
    }

    auto encoded_pov = scale::encode(collation->proof_of_validity);
    if (encoded_pov.has_error()) {
      SL_ERROR(logger_,
               "Could not encode proof-of-validity of block {}: {}",
               block_hash,
               encoded_pov.error());
      return cb(std::nullopt);
    }
    auto pov_hash = hasher_->blake2b_256(encoded_pov.value());

    coordinator_->waitToAnnounce(block_hash, pov_hash);

    SL_INFO(logger_,
            "Produced proof-of-validity candidate {} from block {}",
            pov_hash,
            block_hash);

    cb(std::move(collation));
  }

}  // namespace paracol::parachain
