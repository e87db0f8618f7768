/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <type_traits>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace paracol::primitives {
  /**
   * @struct BlockHeader represents header of a block
   */
  struct BlockHeader {
    BlockHash parent_hash{};              ///< Parent block hash
    BlockNumber number{};                 ///< Block number (height)
    common::Hash256 state_root{};         ///< Merkle tree root of state
    common::Hash256 extrinsics_root{};    ///< Hash of included extrinsics
    Digest digest{};                      ///< Chain-specific auxiliary data
    std::optional<BlockHash> hash_opt{};  ///< Block hash if calculated

    bool operator==(const BlockHeader &rhs) const {
      return std::tie(parent_hash, number, state_root, extrinsics_root, digest)
          == std::tie(rhs.parent_hash,
                      rhs.number,
                      rhs.state_root,
                      rhs.extrinsics_root,
                      rhs.digest);
    }

    bool operator!=(const BlockHeader &rhs) const {
      return !operator==(rhs);
    }
  };

  /**
   * @brief outputs object of type BlockHeader to stream
   * @tparam Stream output stream type
   * @param s stream reference
   * @param bh value to output
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << scale::CompactInteger(bh.number)
             << bh.state_root << bh.extrinsics_root << bh.digest;
  }

  /**
   * @brief decodes object of type BlockHeader from stream
   * @tparam Stream input stream type
   * @param s stream reference
   * @param bh value to input
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    scale::CompactInteger number_compact;
    s >> bh.parent_hash >> number_compact >> bh.state_root >> bh.extrinsics_root
        >> bh.digest;
    if (number_compact > std::numeric_limits<BlockNumber>::max()) {
      scale::raise(scale::DecodeError::TOO_MANY_ITEMS);
    }
    bh.number = number_compact.convert_to<BlockNumber>();
    bh.hash_opt.reset();
    return s;
  }

  /**
   * Hash of the SCALE-encoded header. Cached value in hash_opt is ignored
   */
  outcome::result<BlockHash> calculateBlockHash(const BlockHeader &header,
                                                const crypto::Hasher &hasher);

}  // namespace paracol::primitives
