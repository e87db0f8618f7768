/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/block_status_provider.hpp"

#include <gmock/gmock.h>

namespace paracol::blockchain {

  class BlockStatusProviderMock : public BlockStatusProvider {
   public:
    MOCK_METHOD(outcome::result<BlockStatus>,
                getBlockStatus,
                (const primitives::BlockHash &),
                (const, override));
  };

}  // namespace paracol::blockchain
