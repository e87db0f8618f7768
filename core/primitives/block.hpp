/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/block_header.hpp"
#include "primitives/extrinsic.hpp"

namespace paracol::primitives {
  using BlockBody = std::vector<Extrinsic>;

  /**
   * @brief Block class represents parachain block primitive
   */
  struct Block {
    BlockHeader header;  ///< block header
    BlockBody body{};    ///< extrinsics collection
    bool operator==(const Block &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Block &b) {
    return s << b.header << b.body;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Block &b) {
    return s >> b.header >> b.body;
  }

}  // namespace paracol::primitives
