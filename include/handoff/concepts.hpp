#pragma once
#include <handoff/core.hpp>
#include <type_traits>

namespace handoff {

/**
 * @brief Types providing a static factory that reports failure instead of
 * throwing.
 * @return Must return a handoff::result<T>.
 */
template <typename T, typename... Args>
concept has_try_create = requires(Args &&...args) {
  { T::try_create(std::forward<Args>(args)...) } -> std::same_as<result<T>>;
};

/**
 * @brief Types supporting two-phase, in-place fallible construction.
 * The object is first placement-newed into a "shell" (noexcept default
 * constructor), then completed by try_construct().
 * @note On failure the caller destroys the shell before reclaiming memory.
 */
template <typename T, typename... Args>
concept has_try_construct = requires(T *storage, Args &&...args) {
  {
    storage->try_construct(std::forward<Args>(args)...)
  } -> std::same_as<result<void>>;
};

template <typename T>
concept has_try_clone = requires(const T &source, fallible_allocator &alloc) {
  { source.try_clone(alloc) } -> std::same_as<result<T>>;
} || requires(const T &source) {
  { source.try_clone() } -> std::same_as<result<T>>;
};

/**
 * @brief Types providing a clone directly into uninitialized storage.
 */
template <typename T>
concept has_try_clone_at =
    requires(fallible_allocator &alloc, T *storage, const T &source) {
      { T::try_clone_at(alloc, storage, source) } -> std::same_as<result<void>>;
    };

// A payload that can be duplicated when a shared owner asks to take it.
template <typename T>
concept clonable = has_try_clone<T> || has_try_clone_at<T> ||
                   std::is_nothrow_copy_constructible_v<T>;

// Relocation moves the object and ends the source; neither step may fail.
template <typename T>
concept nothrow_relocatable =
    std::is_object_v<T> && !std::is_array_v<T> &&
    std::is_nothrow_move_constructible_v<T> &&
    std::is_nothrow_destructible_v<T>;

} // namespace handoff
