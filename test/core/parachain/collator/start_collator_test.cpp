/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/start_collator.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "mock/core/network/announcement_coordinator_mock.hpp"
#include "mock/core/parachain/overseer_handler_mock.hpp"
#include "mock/core/parachain/parachain_consensus_mock.hpp"
#include "mock/core/parachain/relay_chain_interface_mock.hpp"
#include "parachain/collator/collator_error.hpp"
#include "testutil/collator/test_chain.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using paracol::common::Buffer;
using paracol::crypto::Sr25519ProviderImpl;
using paracol::crypto::Sr25519Seed;
using paracol::network::AnnouncementCoordinatorMock;
using paracol::parachain::Collation;
using paracol::parachain::CollationGenerationConfig;
using paracol::parachain::CollatorError;
using paracol::parachain::CollatorPair;
using paracol::parachain::InboundDownwardMessage;
using paracol::parachain::OverseerHandlerMock;
using paracol::parachain::OverseerMessage;
using paracol::parachain::ParachainConsensus;
using paracol::parachain::ParachainConsensusMock;
using paracol::parachain::ParachainId;
using paracol::parachain::RelayChainInterfaceMock;
using paracol::parachain::RelayHash;
using paracol::parachain::StartCollatorParams;
using paracol::parachain::ValidationData;
using testutil::collator::TestChain;
using testutil::collator::TestEnvironment;
using testutil::collator::TestInherentDataProvider;
using testing::_;
using testing::Invoke;
using testing::Return;

namespace CollationGenerationMessage =
    paracol::parachain::CollationGenerationMessage;
namespace CollatorProtocolMessage = paracol::parachain::CollatorProtocolMessage;

class StartCollatorTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    chain_ = std::make_shared<TestChain>();
    relay_chain_ = std::make_shared<RelayChainInterfaceMock>();
    consensus_ = std::make_shared<ParachainConsensusMock>();
    overseer_ = std::make_shared<OverseerHandlerMock>();
    coordinator_ = std::make_shared<AnnouncementCoordinatorMock>();
    spawner_ = std::make_shared<boost::asio::io_context>();

    params_.para_id = kParaId;
    params_.key = key_;
    params_.hasher = std::make_shared<paracol::crypto::HasherImpl>();
    params_.block_status = chain_;
    params_.state_backend = chain_;
    params_.inherent_data_provider =
        std::make_shared<TestInherentDataProvider>();
    params_.proposer_factory = std::make_shared<TestEnvironment>();
    params_.block_import = chain_;
    params_.make_announcement_coordinator =
        [this](paracol::network::BlockAnnouncer announcer) {
          coordinator_announcer_ = std::move(announcer);
          return coordinator_;
        };
    params_.announce_block = [this](const auto &hash, Buffer) {
      announced_.push_back(hash);
    };
    params_.relay_chain = relay_chain_;
    params_.parachain_consensus = consensus_;
    params_.overseer_handler = overseer_;
    params_.spawner = spawner_;
  }

  /// Follower task which counts its runs
  void expectFollowSucceeds() {
    EXPECT_CALL(*consensus_, followRelayChain(kParaId, _))
        .WillOnce(Return(ParachainConsensus::FollowTask{
            [this] { ++follow_task_runs_; }}));
  }

  /// Overseer accepting or rejecting messages, recording the accepted ones
  void expectMessages(size_t accepted, bool reject_next) {
    EXPECT_CALL(*overseer_, sendMessage(_, _))
        .Times(accepted + (reject_next ? 1 : 0))
        .WillRepeatedly(
            Invoke([this, accepted](OverseerMessage message, auto cb) {
              if (messages_.size() < accepted) {
                messages_.emplace_back(std::move(message));
                return cb(outcome::success());
              }
              cb(outcome::failure(std::make_error_code(std::errc::io_error)));
            }));
  }

  outcome::result<void> start() {
    std::optional<outcome::result<void>> result;
    paracol::parachain::startCollator(
        params_, [&](outcome::result<void> res) { result = std::move(res); });
    EXPECT_TRUE(result.has_value()) << "callback was not called";
    return result.value_or(outcome::success());
  }

  static constexpr ParachainId kParaId = 2000;
  CollatorPair key_ =
      Sr25519ProviderImpl{}.generateKeypair(Sr25519Seed("collator"_hash256));

  std::shared_ptr<TestChain> chain_;
  std::shared_ptr<RelayChainInterfaceMock> relay_chain_;
  std::shared_ptr<ParachainConsensusMock> consensus_;
  std::shared_ptr<OverseerHandlerMock> overseer_;
  std::shared_ptr<AnnouncementCoordinatorMock> coordinator_;
  std::shared_ptr<boost::asio::io_context> spawner_;
  StartCollatorParams params_;

  size_t follow_task_runs_ = 0;
  std::vector<OverseerMessage> messages_;
  paracol::network::BlockAnnouncer coordinator_announcer_;
  std::vector<paracol::primitives::BlockHash> announced_;
};

/**
 * @given all subsystems accepting messages
 * @when collator is started
 * @then follower is spawned, announcement coordinator is made with the block
 * announcer, collation generation gets initialized with the collator keypair
 * and the collator protocol collates on the parachain
 */
TEST_F(StartCollatorTest, Success) {
  expectFollowSucceeds();
  expectMessages(2, false);

  EXPECT_OUTCOME_TRUE_1(start());

  ASSERT_TRUE(coordinator_announcer_);
  coordinator_announcer_("block"_hash256, Buffer{});
  EXPECT_EQ(announced_,
            std::vector<paracol::primitives::BlockHash>{"block"_hash256});

  ASSERT_EQ(messages_.size(), 2u);
  auto *initialize =
      boost::get<CollationGenerationMessage::Initialize>(&messages_[0]);
  ASSERT_NE(initialize, nullptr);
  EXPECT_EQ(initialize->config.para_id, kParaId);
  EXPECT_EQ(initialize->config.key, key_);
  EXPECT_TRUE(initialize->config.collator);

  auto *collate_on =
      boost::get<CollatorProtocolMessage::CollateOn>(&messages_[1]);
  ASSERT_NE(collate_on, nullptr);
  EXPECT_EQ(collate_on->para_id, kParaId);

  EXPECT_EQ(follow_task_runs_, 0u);
  spawner_->run();
  EXPECT_EQ(follow_task_runs_, 1u);
}

/**
 * @given started collator
 * @when registered collator function is asked for a candidate
 * @then downward messages are requested for the relay parent and parachain,
 * the candidate is produced
 */
TEST_F(StartCollatorTest, RegisteredCollatorProduces) {
  expectFollowSucceeds();
  expectMessages(2, false);
  EXPECT_OUTCOME_TRUE_1(start());
  ASSERT_EQ(messages_.size(), 2u);
  auto collator_fn =
      boost::get<CollationGenerationMessage::Initialize>(messages_[0])
          .config.collator;

  auto relay_parent = "relay_parent"_hash256;
  EXPECT_CALL(*relay_chain_, dmqContents(relay_parent, kParaId))
      .WillOnce(Return(std::vector<InboundDownwardMessage>{
          {.sent_at = 1, .msg = Buffer{0x01}},
      }));
  EXPECT_CALL(*coordinator_, waitToAnnounce(_, _));

  ValidationData validation_data{};
  validation_data.persisted.parent_head =
      Buffer(scale::encode(chain_->genesis()).value());
  validation_data.persisted.block_number = 10;

  std::optional<Collation> collation;
  collator_fn(relay_parent,
              validation_data,
              [&](std::optional<Collation> c) { collation = std::move(c); });

  ASSERT_TRUE(collation.has_value());
  EXPECT_EQ(collation->processed_downward_messages, 1u);
  EXPECT_EQ(collation->hrmp_watermark, 10u);
  EXPECT_EQ(chain_->importedCount(), 1u);
}

/**
 * @given started collator and relay chain unable to provide downward messages
 * @when registered collator function is asked for a candidate
 * @then nothing is produced
 */
TEST_F(StartCollatorTest, DownwardMessagesFailure) {
  expectFollowSucceeds();
  expectMessages(2, false);
  EXPECT_OUTCOME_TRUE_1(start());
  ASSERT_EQ(messages_.size(), 2u);
  auto collator_fn =
      boost::get<CollationGenerationMessage::Initialize>(messages_[0])
          .config.collator;

  EXPECT_CALL(*relay_chain_, dmqContents(_, kParaId))
      .WillOnce(Return(
          outcome::failure(std::make_error_code(std::errc::io_error))));

  ValidationData validation_data{};
  validation_data.persisted.parent_head =
      Buffer(scale::encode(chain_->genesis()).value());

  std::optional<std::optional<Collation>> result;
  collator_fn("relay_parent"_hash256,
              validation_data,
              [&](std::optional<Collation> c) { result = std::move(c); });

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->has_value());
  EXPECT_EQ(chain_->importedCount(), 0u);
}

/**
 * @given parachain consensus unable to follow the relay chain
 * @when collator is started
 * @then start fails before any message is sent
 */
TEST_F(StartCollatorTest, FollowFailure) {
  EXPECT_CALL(*consensus_, followRelayChain(kParaId, _))
      .WillOnce(Return(
          outcome::failure(std::make_error_code(std::errc::io_error))));
  EXPECT_CALL(*overseer_, sendMessage(_, _)).Times(0);

  EXPECT_EC(start(), CollatorError::FOLLOW_RELAY_CHAIN_FAILED);
  EXPECT_EQ(spawner_->run(), 0u);
}

/**
 * @given collation generation rejecting the Initialize message
 * @when collator is started
 * @then start fails and CollateOn is not sent
 */
TEST_F(StartCollatorTest, InitializeFailure) {
  expectFollowSucceeds();
  expectMessages(0, true);

  EXPECT_EC(start(), CollatorError::INITIALIZE_SEND_FAILED);
  EXPECT_TRUE(messages_.empty());
}

/**
 * @given collator protocol rejecting the CollateOn message
 * @when collator is started
 * @then start fails after collation generation is initialized
 */
TEST_F(StartCollatorTest, CollateOnFailure) {
  expectFollowSucceeds();
  expectMessages(1, true);

  EXPECT_EC(start(), CollatorError::COLLATE_ON_SEND_FAILED);
  ASSERT_EQ(messages_.size(), 1u);
  EXPECT_NE(boost::get<CollationGenerationMessage::Initialize>(&messages_[0]),
            nullptr);
}
