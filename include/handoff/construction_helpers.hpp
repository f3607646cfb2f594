#pragma once
#include <handoff/concepts.hpp>
#include <handoff/core.hpp>
#include <new>

namespace handoff {

struct construction_helpers {
  /**
   * @brief Initializes an object at an uninitialized location, choosing the
   * construction strategy at compile time.
   *
   * 1. **In-place fallible**: `has_try_construct` placement-news a shell and
   * completes it with `storage->try_construct()`.
   * 2. **Factory fallible**: `has_try_create` builds a temporary and
   * move-constructs it into storage.
   * 3. **Nothrow**: plain placement-new with the forwarded arguments.
   *
   * @note A failed stage leaves @p storage uninitialized.
   */
  template <typename T, typename... Args>
  static result<void> try_construct(T *storage, Args &&...args) noexcept {
    if constexpr (has_try_construct<T, Args...>) {
      static_assert(std::is_nothrow_default_constructible_v<T>,
                    "Two-phase construction requires a noexcept default "
                    "constructor for the shell.");
      new (storage) T();
      auto res = storage->try_construct(std::forward<Args>(args)...);
      if (!res) {
        storage->~T();
        return res;
      }
      return {};
    } else if constexpr (has_try_create<T, Args...>) {
      auto res = T::try_create(std::forward<Args>(args)...);
      if (!res)
        return unexpected(res.error());
      new (storage) T(std::move(*res));
      return {};
    } else {
      static_assert(std::is_nothrow_constructible_v<T, Args...>,
                    "Type must be either fallible via try_construct, "
                    "try_create or nothrow constructible");
      new (storage) T(std::forward<Args>(args)...);
      return {};
    }
  }

  /**
   * @brief Fallible deep copy.
   * Prefers `try_clone(alloc)`, then `try_clone()`, then a nothrow copy.
   */
  template <typename T>
  static result<T> try_clone(fallible_allocator &alloc,
                             const T &source) noexcept {
    static_assert(
        std::is_nothrow_move_constructible_v<T>,
        "handoff requires noexcept move-construction to return values.");
    if constexpr (requires { source.try_clone(alloc); }) {
      return source.try_clone(alloc);
    } else if constexpr (requires { source.try_clone(); }) {
      return source.try_clone();
    } else {
      static_assert(
          std::is_nothrow_copy_constructible_v<T>,
          "Type must implement try_clone or be nothrow copy constructible.");
      return T(source);
    }
  }

  /**
   * @brief Fallible deep copy straight into uninitialized storage.
   * Uses `T::try_clone_at` when present, otherwise clones a temporary and
   * move-constructs it into place. Copyable types are copied in place.
   */
  template <typename T>
  static result<void> try_clone_at(fallible_allocator &alloc, T *storage,
                                   const T &source) noexcept {
    if constexpr (has_try_clone_at<T>) {
      return T::try_clone_at(alloc, storage, source);
    } else if constexpr (has_try_clone<T>) {
      auto res = try_clone<T>(alloc, source);
      if (!res)
        return unexpected(res.error());
      new (storage) T(std::move(*res));
      return {};
    } else {
      static_assert(
          std::is_nothrow_copy_constructible_v<T>,
          "Type must implement try_clone or be nothrow copy constructible.");
      new (storage) T(source);
      return {};
    }
  }
};

} // namespace handoff
