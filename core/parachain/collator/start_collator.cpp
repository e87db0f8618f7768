/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/start_collator.hpp"

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>

#include "parachain/collator/collator_error.hpp"

namespace paracol::parachain {

  namespace {
    DownwardMessagesRetriever makeDownwardMessagesRetriever(
        std::shared_ptr<const RelayChainInterface> relay_chain,
        ParachainId para_id,
        log::Logger logger) {
      return [relay_chain{std::move(relay_chain)},
              para_id,
              logger{std::move(logger)}](const RelayHash &relay_parent)
                 -> std::optional<std::vector<InboundDownwardMessage>> {
        auto res = relay_chain->dmqContents(relay_parent, para_id);
        if (res.has_error()) {
          SL_ERROR(logger,
                   "An error occured during requesting the downward messages "
                   "at relay parent {}: {}",
                   relay_parent,
                   res.error());
          return std::nullopt;
        }
        return std::move(res.value());
      };
    }
  }  // namespace

  void startCollator(StartCollatorParams params,
                     std::function<void(outcome::result<void>)> cb) {
    BOOST_ASSERT(params.relay_chain);
    BOOST_ASSERT(params.parachain_consensus);
    BOOST_ASSERT(params.overseer_handler);
    BOOST_ASSERT(params.spawner);
    BOOST_ASSERT(params.make_announcement_coordinator);

    auto logger = log::createLogger("StartCollator", "collator");

    auto retriever = makeDownwardMessagesRetriever(
        params.relay_chain, params.para_id, logger);

    auto follow_res = params.parachain_consensus->followRelayChain(
        params.para_id, params.announce_block);
    if (follow_res.has_error()) {
      SL_ERROR(logger,
               "Failed to start following the relay chain for para {}: {}",
               params.para_id,
               follow_res.error());
      return cb(CollatorError::FOLLOW_RELAY_CHAIN_FAILED);
    }
    boost::asio::post(*params.spawner,
                      [logger, task{std::move(follow_res.value())}] {
                        SL_DEBUG(logger,
                                 "Task {} started",
                                 kFollowRelayChainTaskName);
                        task();
                      });

    Collator collator(
        params.hasher,
        params.proposer_factory,
        params.block_import,
        std::make_shared<AvailabilityGate>(params.block_status),
        std::make_shared<InherentDataAssembler>(params.inherent_data_provider,
                                                std::move(retriever)),
        std::make_shared<CollationExtractor>(params.state_backend),
        params.make_announcement_coordinator(params.announce_block),
        params.proposal_deadline);

    CollationGenerationConfig config{
        .key = params.key,
        .para_id = params.para_id,
        .collator = collator.asCollatorFn(),
    };

    auto overseer = params.overseer_handler;
    overseer->sendMessage(
        CollationGenerationMessage::Initialize{std::move(config)},
        [overseer, para_id{params.para_id}, logger, cb{std::move(cb)}](
            outcome::result<void> init_res) mutable {
          if (init_res.has_error()) {
            SL_ERROR(logger,
                     "Failed to initialize collation generation: {}",
                     init_res.error());
            return cb(CollatorError::INITIALIZE_SEND_FAILED);
          }
          overseer->sendMessage(
              CollatorProtocolMessage::CollateOn{para_id},
              [para_id, logger, cb{std::move(cb)}](
                  outcome::result<void> collate_on_res) mutable {
                if (collate_on_res.has_error()) {
                  SL_ERROR(logger,
                           "Failed to start collating on para {}: {}",
                           para_id,
                           collate_on_res.error());
                  return cb(CollatorError::COLLATE_ON_SEND_FAILED);
                }
                SL_INFO(logger, "Collator started for para {}", para_id);
                cb(outcome::success());
              });
        });
  }

}  // namespace paracol::parachain
