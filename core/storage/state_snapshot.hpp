/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace paracol::storage {

  /**
   * @brief Read-only view of the state at some block. Contents never change
   * while the snapshot is alive
   */
  class StateSnapshot {
   public:
    virtual ~StateSnapshot() = default;

    /**
     * @brief Get value by key
     * @param key storage key
     * @return value if it is present, std::nullopt if it is absent, error if
     * the backend failed to read it
     */
    virtual outcome::result<std::optional<common::Buffer>> tryGet(
        common::BufferView key) const = 0;
  };

}  // namespace paracol::storage
