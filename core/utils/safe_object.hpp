/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <type_traits>

namespace paracol {

  // clang-format off
  /**
   * Protected object wrapper. Lock is held only while the functor runs.
   * @tparam T object type
   * @tparam M mutex type
   * Example:
   * @code
   *  SafeObject<std::string> obj("1");
   *  obj.exclusiveAccess([](auto &str) {
   *      str = "2";
   *  });
   * @endcode
   */
  // clang-format on
  template <typename T, typename M = std::mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    T &unsafeGet() {
      return t_;
    }

    const T &unsafeGet() const {
      return t_;
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace paracol
