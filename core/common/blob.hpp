/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

namespace paracol::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Fixed size byte array: hashes, keys and identifiers.
   * Encoded by the scale codec without length prefix.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    /// Lowercase hex without prefix
    std::string toHex() const {
      return hex_lower(BufferView(*this));
    }

    /**
     * Take bytes of the string as is, e.g. for 8-byte inherent identifiers
     * @return INCORRECT_LENGTH unless the string is exactly of blob size
     */
    static outcome::result<Blob<size_>> fromString(std::string_view data) {
      return fromSpan(BufferView(
          reinterpret_cast<const uint8_t *>(data.data()),  // NOLINT
          data.size()));
    }

    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY(res, unhexWith0x(hex));
      return fromSpan(res);
    }

    /// Hex with or without 0x, as users tend to give keys in either form
    static outcome::result<Blob<size_>> fromHexAnyPrefix(std::string_view hex) {
      return hex.starts_with("0x") ? fromHexWithPrefix(hex) : fromHex(hex);
    }

    static outcome::result<Blob<size_>> fromSpan(const BufferView &span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  // consensus engine ids, inherent identifiers, balances and hashes
  extern template class Blob<4ul>;
  extern template class Blob<8ul>;
  extern template class Blob<16ul>;
  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace paracol::common

namespace paracol {
  using common::Hash256;
}  // namespace paracol

template <size_t N>
struct std::hash<paracol::common::Blob<N>> {
  auto operator()(const paracol::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

/// Formats as BufferView does: short form by default, `{:l}` for full hex
template <size_t N>
struct fmt::formatter<paracol::common::Blob<N>>
    : fmt::formatter<paracol::common::BufferView> {
  template <typename FormatContext>
  auto format(const paracol::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<paracol::common::BufferView>::format(
        paracol::common::BufferView(blob), ctx);
  }
};

OUTCOME_HPP_DECLARE_ERROR(paracol::common, BlobError);
