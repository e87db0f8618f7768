/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/state_backend.hpp"

#include <gmock/gmock.h>

namespace paracol::blockchain {

  class StateBackendMock : public StateBackend {
   public:
    MOCK_METHOD(outcome::result<std::shared_ptr<const storage::StateSnapshot>>,
                stateAt,
                (const primitives::BlockHash &),
                (const, override));
  };

}  // namespace paracol::blockchain
