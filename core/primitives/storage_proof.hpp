/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <scale/scale.hpp>

#include "common/buffer.hpp"

namespace paracol::primitives {

  /**
   * Set of encoded trie nodes, which were accessed while a block was built.
   * Together with the parent state root it is enough to re-execute the block.
   */
  struct StorageProof {
    std::vector<common::Buffer> trie_nodes;

    bool empty() const {
      return trie_nodes.empty();
    }

    bool operator==(const StorageProof &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const StorageProof &v) {
    return s << v.trie_nodes;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, StorageProof &v) {
    return s >> v.trie_nodes;
  }

}  // namespace paracol::primitives
