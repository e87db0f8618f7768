/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/collator/availability_gate.hpp"

#include <gtest/gtest.h>

#include "mock/core/blockchain/block_status_provider_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"

using paracol::blockchain::BlockStatus;
using paracol::blockchain::BlockStatusProviderMock;
using paracol::parachain::AvailabilityGate;
using testing::Return;

class AvailabilityGateTest
    : public testing::TestWithParam<std::pair<BlockStatus, bool>> {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    block_status_ = std::make_shared<BlockStatusProviderMock>();
    gate_ = std::make_shared<AvailabilityGate>(block_status_);
  }

  std::shared_ptr<BlockStatusProviderMock> block_status_;
  std::shared_ptr<AvailabilityGate> gate_;

  paracol::primitives::BlockHash hash_ = "parent"_hash256;
};

/**
 * @given block with the given import status
 * @when availability is checked
 * @then only a block in chain with its state is buildable
 */
TEST_P(AvailabilityGateTest, StatusPolicy) {
  auto [status, buildable] = GetParam();
  EXPECT_CALL(*block_status_, getBlockStatus(hash_)).WillOnce(Return(status));

  EXPECT_EQ(gate_->isBuildable(hash_), buildable);
}

INSTANTIATE_TEST_SUITE_P(
    BlockStatuses,
    AvailabilityGateTest,
    testing::Values(std::make_pair(BlockStatus::Queued, false),
                    std::make_pair(BlockStatus::InChainWithState, true),
                    std::make_pair(BlockStatus::InChainPruned, false),
                    std::make_pair(BlockStatus::KnownBad, false),
                    std::make_pair(BlockStatus::Unknown, false)));

/**
 * @given block status provider failing to answer
 * @when availability is checked
 * @then block is not buildable
 */
TEST_F(AvailabilityGateTest, StatusQueryFailure) {
  EXPECT_CALL(*block_status_, getBlockStatus(hash_))
      .WillOnce(Return(
          outcome::failure(std::make_error_code(std::errc::io_error))));

  EXPECT_FALSE(gate_->isBuildable(hash_));
}
