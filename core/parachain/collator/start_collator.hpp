/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "authorship/environment.hpp"
#include "authorship/inherent_data_provider.hpp"
#include "blockchain/block_status_provider.hpp"
#include "blockchain/state_backend.hpp"
#include "consensus/block_import.hpp"
#include "crypto/hasher.hpp"
#include "network/announcement_coordinator.hpp"
#include "outcome/outcome.hpp"
#include "parachain/collator/collator.hpp"
#include "parachain/overseer.hpp"
#include "parachain/parachain_consensus.hpp"
#include "parachain/relay_chain_interface.hpp"

namespace paracol::parachain {

  /// Everything needed to start a collator
  struct StartCollatorParams {
    ParachainId para_id;
    CollatorPair key;
    std::chrono::milliseconds proposal_deadline =
        Collator::kDefaultProposalDeadline;

    std::shared_ptr<crypto::Hasher> hasher;
    std::shared_ptr<const blockchain::BlockStatusProvider> block_status;
    std::shared_ptr<const blockchain::StateBackend> state_backend;
    std::shared_ptr<const authorship::InherentDataProvider>
        inherent_data_provider;
    std::shared_ptr<authorship::Environment> proposer_factory;
    std::shared_ptr<consensus::BlockImport> block_import;
    /// gets the block announcer, as the relay chain follower does
    network::AnnouncementCoordinatorFactory make_announcement_coordinator;
    network::BlockAnnouncer announce_block;
    std::shared_ptr<const RelayChainInterface> relay_chain;
    std::shared_ptr<ParachainConsensus> parachain_consensus;
    std::shared_ptr<OverseerHandler> overseer_handler;
    /// runs the relay chain follower
    std::shared_ptr<boost::asio::io_context> spawner;
  };

  /// Name of the background task following the relay chain
  constexpr std::string_view kFollowRelayChainTaskName =
      "paracol-follow-relay-chain";

  /**
   * Start the collator: spawn the relay chain follower and register the
   * collator in the collation generation and collator protocol subsystems.
   * @param params collator dependencies
   * @param cb receives success once both registration messages are accepted,
   * or the error describing which step failed
   */
  void startCollator(StartCollatorParams params,
                     std::function<void(outcome::result<void>)> cb);

}  // namespace paracol::parachain
