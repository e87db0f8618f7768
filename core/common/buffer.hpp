/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <boost/container_hash/hash.hpp>

#include "common/blob.hpp"
#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace paracol::common {

  /**
   * Owning byte buffer: encoded values, storage keys and values, messages.
   * Encoded by the scale codec with compact length prefix.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    static constexpr bool is_static_collection = false;

    Buffer() = default;

    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    using Base::Base;
    using Base::operator=;

    /// Append bytes of the string
    Buffer &put(std::string_view view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    Buffer &put(const BufferView &view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return outcome::success(Buffer(std::move(bytes)));
    }

    /// Bytes as characters, no encoding is checked
    std::string_view asString() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return std::string_view(reinterpret_cast<const char *>(Base::data()),
                              Base::size());
    }

    static Buffer fromString(std::string_view src) {
      return {src.begin(), src.end()};
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << BufferView(buffer);
  }

}  // namespace paracol::common

namespace paracol {
  using common::Buffer;
}  // namespace paracol

template <>
struct std::hash<paracol::common::Buffer> {
  size_t operator()(const paracol::common::Buffer &x) const {
    return boost::hash_range(x.begin(), x.end());
  }
};

template <>
struct fmt::formatter<paracol::common::Buffer>
    : fmt::formatter<paracol::common::BufferView> {};
