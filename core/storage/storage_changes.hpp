/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>

#include "common/buffer.hpp"

namespace paracol::storage {

  /**
   * Storage changes produced by block execution, ready to be committed on
   * import. Absent value means the key was removed
   */
  struct StorageChanges {
    std::map<common::Buffer, std::optional<common::Buffer>> main_changes;

    bool empty() const {
      return main_changes.empty();
    }

    bool operator==(const StorageChanges &) const = default;
  };

}  // namespace paracol::storage
