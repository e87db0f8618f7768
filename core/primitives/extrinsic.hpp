/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "common/buffer.hpp"

namespace paracol::primitives {

  /**
   * @brief Extrinsic class represents extrinsic
   */
  struct Extrinsic {
    common::Buffer data;  ///< extrinsic content as byte array

    bool operator==(const Extrinsic &) const = default;
  };

  /// Extrinsic is encoded as its opaque bytes, length prefixed
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Extrinsic &v) {
    return s << v.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Extrinsic &v) {
    return s >> v.data;
  }
}  // namespace paracol::primitives
