/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <compare>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace paracol::common {

  /**
   * Non-owning view over a contiguous sequence of bytes
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    auto operator<=>(const BufferView &other) const {
      return std::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    bool operator==(const BufferView &other) const {
      return (*this <=> other) == std::strong_ordering::equal;
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

}  // namespace paracol::common

namespace paracol {
  using common::BufferView;
}  // namespace paracol

template <>
struct fmt::formatter<paracol::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  // Parses format specifications of the form ['s' | 'l'].
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }

    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }

    return it;
  }

  template <typename FormatContext>
  auto format(const paracol::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }

    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(ctx.out(),
                            "0x{}…{}",
                            paracol::common::hex_lower(view.first(2)),
                            paracol::common::hex_lower(view.last(2)));
    }

    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
