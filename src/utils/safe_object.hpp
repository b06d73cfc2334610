/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <variant>

namespace weave::utils {

  /**
   * @brief Thread-safe wrapper for any object
   *
   * Every access to the wrapped object goes through a functor executed under
   * the lock, so no reference to the object escapes the critical section
   * unless the functor leaks it on purpose.
   *
   * @tparam T The type of object to wrap
   * @tparam M The mutex type (defaults to std::shared_mutex)
   */
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    /// Applies `f` to the object under an exclusive lock
    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    /**
     * Applies `f` only when the lock is free right now.
     * @return result of `f` wrapped in optional, or empty optional when the
     * lock was busy
     */
    template <typename F>
    inline auto try_exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_, std::try_to_lock);
      using ResultType = decltype(std::forward<F>(f)(t_));
      constexpr bool is_void = std::is_void_v<ResultType>;
      using OptionalType = std::conditional_t<is_void,
                                              std::optional<std::monostate>,
                                              std::optional<ResultType>>;

      if (lock.owns_lock()) {
        if constexpr (is_void) {
          std::forward<F>(f)(t_);
          return OptionalType(std::in_place);
        } else {
          return OptionalType(std::forward<F>(f)(t_));
        }
      }
      return OptionalType();
    }

    /// Applies `f` to the object under a shared lock
    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;
    mutable M cs_;
  };

}  // namespace weave::utils
