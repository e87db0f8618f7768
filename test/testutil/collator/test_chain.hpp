/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <map>
#include <mutex>

#include "authorship/environment.hpp"
#include "authorship/inherent_data_provider.hpp"
#include "blockchain/block_status_provider.hpp"
#include "blockchain/state_backend.hpp"
#include "consensus/block_import.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "parachain/types.hpp"
#include "parachain/well_known_keys.hpp"
#include "testutil/collator/test_chain_error.hpp"

/**
 * In-memory parachain used by collator end-to-end tests
 */
namespace testutil::collator {
  using paracol::common::Buffer;
  using paracol::common::BufferView;
  using paracol::primitives::BlockHash;
  using paracol::primitives::BlockHeader;

  using State = std::map<Buffer, Buffer>;

  class TestStateSnapshot : public paracol::storage::StateSnapshot {
   public:
    explicit TestStateSnapshot(State state) : state_{std::move(state)} {}

    outcome::result<std::optional<Buffer>> tryGet(
        BufferView key) const override {
      if (auto it = state_.find(Buffer(key)); it != state_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

   private:
    State state_;
  };

  /**
   * Block status, state and import of a single parachain, starting at
   * genesis block 0 with empty state
   */
  class TestChain : public paracol::blockchain::BlockStatusProvider,
                    public paracol::blockchain::StateBackend,
                    public paracol::consensus::BlockImport {
   public:
    struct Entry {
      BlockHeader header;
      paracol::blockchain::BlockStatus status;
      State state;
    };

    TestChain() {
      genesis_.number = 0;
      genesis_.hash_opt = hasher_.blake2b_256(scale::encode(genesis_).value());
      blocks_.emplace(*genesis_.hash_opt,
                      Entry{genesis_,
                            paracol::blockchain::BlockStatus::InChainWithState,
                            State{}});
    }

    const BlockHeader &genesis() const {
      return genesis_;
    }

    void setStatus(const BlockHash &hash,
                   paracol::blockchain::BlockStatus status) {
      std::lock_guard lock(mutex_);
      blocks_.at(hash).status = status;
    }

    size_t importedCount() const {
      std::lock_guard lock(mutex_);
      return imported_.size();
    }

    std::vector<paracol::consensus::BlockImportParams> imported() const {
      std::lock_guard lock(mutex_);
      return imported_;
    }

    outcome::result<paracol::blockchain::BlockStatus> getBlockStatus(
        const BlockHash &block_hash) const override {
      std::lock_guard lock(mutex_);
      if (auto it = blocks_.find(block_hash); it != blocks_.end()) {
        return it->second.status;
      }
      return paracol::blockchain::BlockStatus::Unknown;
    }

    outcome::result<std::shared_ptr<const paracol::storage::StateSnapshot>>
    stateAt(const BlockHash &block_hash) const override {
      std::lock_guard lock(mutex_);
      auto it = blocks_.find(block_hash);
      if (it == blocks_.end()) {
        return TestChainError::UNKNOWN_BLOCK;
      }
      return std::make_shared<TestStateSnapshot>(it->second.state);
    }

    outcome::result<paracol::consensus::ImportResult> importBlock(
        paracol::consensus::BlockImportParams params) override {
      std::lock_guard lock(mutex_);
      auto parent = blocks_.find(params.header.parent_hash);
      if (parent == blocks_.end()) {
        return TestChainError::UNKNOWN_PARENT;
      }
      OUTCOME_TRY(encoded, scale::encode(params.header));
      auto hash = hasher_.blake2b_256(encoded);
      if (blocks_.contains(hash)) {
        return paracol::consensus::ImportResult::AlreadyInChain;
      }

      auto state = parent->second.state;
      if (params.storage_changes.has_value()) {
        for (auto &[key, value] : params.storage_changes->main_changes) {
          if (value.has_value()) {
            state[key] = *value;
          } else {
            state.erase(key);
          }
        }
      }
      blocks_.emplace(hash,
                      Entry{params.header,
                            paracol::blockchain::BlockStatus::InChainWithState,
                            std::move(state)});
      imported_.emplace_back(std::move(params));
      return paracol::consensus::ImportResult::Imported;
    }

   private:
    paracol::crypto::HasherImpl hasher_;
    BlockHeader genesis_;
    mutable std::mutex mutex_;
    std::map<BlockHash, Entry> blocks_;
    std::vector<paracol::consensus::BlockImportParams> imported_;
  };

  /**
   * Builds a block with a single extrinsic carrying the inherent data and
   * records the number of received downward messages as processed
   */
  class TestProposer : public paracol::authorship::Proposer {
   public:
    TestProposer(BlockHeader parent, bool return_proof)
        : parent_{std::move(parent)}, return_proof_{return_proof} {}

    void propose(paracol::primitives::InherentData inherent_data,
                 paracol::primitives::Digest inherent_digest,
                 std::chrono::milliseconds max_duration,
                 paracol::authorship::RecordProof record_proof,
                 ProposeCallback cb) override {
      cb(build(inherent_data, std::move(inherent_digest), record_proof));
    }

   private:
    outcome::result<paracol::authorship::Proposal> build(
        const paracol::primitives::InherentData &inherent_data,
        paracol::primitives::Digest inherent_digest,
        paracol::authorship::RecordProof record_proof) const {
      OUTCOME_TRY(downward_messages,
                  inherent_data.getData<
                      std::vector<paracol::parachain::InboundDownwardMessage>>(
                      paracol::parachain::kDownwardMessagesIdentifier));
      OUTCOME_TRY(inherent, scale::encode(inherent_data));

      paracol::authorship::Proposal proposal;
      auto &block = proposal.block;
      block.body.emplace_back(
          paracol::primitives::Extrinsic{Buffer(std::move(inherent))});
      OUTCOME_TRY(body, scale::encode(block.body));
      block.header.parent_hash = parent_.hash_opt.value();
      block.header.number = parent_.number + 1;
      block.header.extrinsics_root = hasher_.blake2b_256(body);
      block.header.digest = std::move(inherent_digest);

      OUTCOME_TRY(processed,
                  scale::encode(
                      static_cast<uint32_t>(downward_messages.size())));
      proposal.storage_changes.main_changes.emplace(
          Buffer(paracol::parachain::well_known_keys::asKey(
              paracol::parachain::well_known_keys::
                  kProcessedDownwardMessages)),
          Buffer(std::move(processed)));

      if (record_proof == paracol::authorship::RecordProof::Yes
          and return_proof_) {
        proposal.proof =
            paracol::primitives::StorageProof{{Buffer(std::move(body))}};
      }
      return proposal;
    }

    paracol::crypto::HasherImpl hasher_;
    BlockHeader parent_;
    bool return_proof_;
  };

  /**
   * Creates TestProposer synchronously
   */
  class TestEnvironment : public paracol::authorship::Environment {
   public:
    explicit TestEnvironment(bool return_proof = true)
        : return_proof_{return_proof} {}

    void init(const BlockHeader &parent_header, InitCallback cb) override {
      ++init_calls;
      cb(std::make_shared<TestProposer>(parent_header, return_proof_));
    }

    std::atomic_size_t init_calls = 0;

   private:
    bool return_proof_;
  };

  /// Provides no inherents except the ones the collator adds
  class TestInherentDataProvider
      : public paracol::authorship::InherentDataProvider {
   public:
    outcome::result<paracol::primitives::InherentData> createInherentData()
        const override {
      return paracol::primitives::InherentData{};
    }
  };

}  // namespace testutil::collator
