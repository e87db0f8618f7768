/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace paracol::primitives {
  /**
   * @brief inherent data encode/decode error codes
   */
  enum class InherentDataError {
    IDENTIFIER_ALREADY_EXISTS = 1,
    IDENTIFIER_DOES_NOT_EXIST
  };
}  // namespace paracol::primitives

OUTCOME_HPP_DECLARE_ERROR(paracol::primitives, InherentDataError);

namespace paracol::primitives {
  using InherentIdentifier = common::Blob<8u>;

  /**
   * Inherent data to include in a block
   */
  struct InherentData {
    /** Put data for an inherent into the internal storage.
     *
     * @arg identifier need to be unique, otherwise decoding of these
     * values will not work!
     * @arg inherent value to be encoded and stored
     * @returns success if the data could be inserted and no data for an
     * inherent with the same identifier existed before
     */
    template <typename T>
    outcome::result<void> putData(InherentIdentifier identifier,
                                  const T &inherent) {
      if (data.contains(identifier)) {
        return InherentDataError::IDENTIFIER_ALREADY_EXISTS;
      }
      OUTCOME_TRY(encoded, scale::encode(inherent));
      data.emplace(std::move(identifier), common::Buffer(std::move(encoded)));
      return outcome::success();
    }

    /**
     * @returns the data for the requested inherent.
     */
    template <typename T>
    outcome::result<T> getData(const InherentIdentifier &identifier) const {
      auto inherent = data.find(identifier);
      if (inherent != data.end()) {
        return scale::decode<T>(inherent->second);
      }
      return InherentDataError::IDENTIFIER_DOES_NOT_EXIST;
    }

    bool contains(const InherentIdentifier &identifier) const {
      return data.contains(identifier);
    }

    bool operator==(const InherentData &rhs) const = default;

    std::map<InherentIdentifier, common::Buffer> data;
  };

  /**
   * @brief output InherentData object instance to stream
   * @tparam Stream stream type
   * @param s stream reference
   * @param v value to output
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const InherentData &v) {
    std::vector<std::pair<InherentIdentifier, common::Buffer>> vec(
        v.data.begin(), v.data.end());
    return s << vec;
  }

  /**
   * @brief decodes InherentData object instance from stream
   * @tparam Stream input stream type
   * @param s stream reference
   * @param v value to decode
   * @return reference to stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, InherentData &v) {
    std::vector<std::pair<InherentIdentifier, common::Buffer>> vec;
    s >> vec;

    for (auto &item : vec) {
      if (not v.data.emplace(std::move(item)).second) {
        scale::raise(InherentDataError::IDENTIFIER_ALREADY_EXISTS);
      }
    }

    return s;
  }
}  // namespace paracol::primitives
