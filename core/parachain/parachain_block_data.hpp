/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/block.hpp"
#include "primitives/storage_proof.hpp"

namespace paracol::parachain {

  /**
   * The parachain block that is sent to the relay chain validators as the
   * proof-of-validity payload
   */
  struct ParachainBlockData {
    primitives::BlockHeader header;
    primitives::BlockBody extrinsics;
    primitives::StorageProof storage_proof;

    bool operator==(const ParachainBlockData &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const ParachainBlockData &v) {
    return s << v.header << v.extrinsics << v.storage_proof;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, ParachainBlockData &v) {
    return s >> v.header >> v.extrinsics >> v.storage_proof;
  }

}  // namespace paracol::parachain
