/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include "common/buffer.hpp"
#include "primitives/common.hpp"

namespace paracol::network {

  /// Announces a block to the parachain network, with optional extra data
  using BlockAnnouncer =
      std::function<void(const primitives::BlockHash &, common::Buffer)>;

}  // namespace paracol::network
