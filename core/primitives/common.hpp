/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"

namespace paracol::primitives {
  using BlockNumber = uint32_t;
  using BlockHash = common::Hash256;
}  // namespace paracol::primitives
