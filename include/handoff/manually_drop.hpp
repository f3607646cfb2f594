#pragma once
#include <functional>
#include <handoff/assert.hpp>
#include <handoff/concepts.hpp>
#include <handoff/core.hpp>
#include <handoff/relocate.hpp>
#include <utility>

namespace handoff {

/**
 * @brief Non-owning view of a payload whose destructor has been suppressed.
 *
 * Every take operation hands one of these to the caller's extraction step.
 * The step may mutate the payload in place, move it out with take(), destroy
 * it with drop_in_place(), or leave it alone, in which case the payload is
 * forgotten: its storage is released by the shell but its destructor never
 * runs.
 *
 * The view records whether the payload is gone. Any access after that is a
 * contract violation and trips HANDOFF_ASSERT.
 */
template <typename T> class suppressed_ref {
  static_assert(std::is_object_v<T>, "suppressed_ref needs an object type");

  T *m_ptr;
  bool m_taken = false;

public:
  using element_type = T;

  explicit suppressed_ref(T *ptr) noexcept : m_ptr(ptr) {
    HANDOFF_ASSERT(ptr != nullptr, "suppressed_ref over a null payload");
  }

  suppressed_ref(const suppressed_ref &) = delete;
  suppressed_ref &operator=(const suppressed_ref &) = delete;

  [[nodiscard]] bool taken() const noexcept { return m_taken; }

  [[nodiscard]] T &operator*() const noexcept {
    HANDOFF_ASSERT(!m_taken, "payload was already taken from this view");
    return *m_ptr;
  }

  [[nodiscard]] T *operator->() const noexcept {
    HANDOFF_ASSERT(!m_taken, "payload was already taken from this view");
    return m_ptr;
  }

  [[nodiscard]] T *unsafe_get() const noexcept { return m_ptr; }

  /**
   * @brief Moves the payload out. Callable once per view.
   */
  [[nodiscard]] T take() noexcept
    requires nothrow_relocatable<T>
  {
    HANDOFF_ASSERT(!m_taken, "payload was already taken from this view");
    m_taken = true;
    return relocate_out(m_ptr);
  }

  [[nodiscard]] result<T> try_take() noexcept
    requires nothrow_relocatable<T>
  {
    if (m_taken) [[unlikely]]
      return unexpected(error::already_taken);
    m_taken = true;
    return relocate_out(m_ptr);
  }

  // Runs the destructor the shell skipped.
  void drop_in_place() noexcept {
    HANDOFF_ASSERT(!m_taken, "payload was already taken from this view");
    m_taken = true;
    std::destroy_at(m_ptr);
  }

  // For conversions that relocate the payload through unsafe_get().
  void unsafe_mark_taken() noexcept { m_taken = true; }
};

/**
 * @brief View of a run of elements whose destructors have been suppressed.
 * This is the "unsized" payload of sequences and array boxes: its length is
 * only known at run time.
 */
template <typename T> class suppressed_ref<T[]> {
  T *m_data;
  std::size_t m_size;
  bool m_taken = false;

public:
  using element_type = T;

  suppressed_ref(T *data, std::size_t size) noexcept
      : m_data(data), m_size(size) {
    HANDOFF_ASSERT(data != nullptr || size == 0,
                   "suppressed_ref over a null run");
  }

  suppressed_ref(const suppressed_ref &) = delete;
  suppressed_ref &operator=(const suppressed_ref &) = delete;

  [[nodiscard]] std::size_t size() const noexcept { return m_size; }
  [[nodiscard]] bool empty() const noexcept { return m_size == 0; }
  [[nodiscard]] bool taken() const noexcept { return m_taken; }

  [[nodiscard]] T *data() const noexcept {
    HANDOFF_ASSERT(!m_taken, "run was already taken from this view");
    return m_data;
  }

  [[nodiscard]] T *unsafe_data() const noexcept { return m_data; }

  [[nodiscard]] T &operator[](std::size_t index) const noexcept {
    HANDOFF_ASSERT(!m_taken, "run was already taken from this view");
    HANDOFF_DEBUG_ASSERT(index < m_size, "suppressed_ref index out of bounds");
    return m_data[index];
  }

  [[nodiscard]] T *begin() const noexcept { return data(); }
  [[nodiscard]] T *end() const noexcept { return data() + m_size; }

  void drop_in_place() noexcept {
    HANDOFF_ASSERT(!m_taken, "run was already taken from this view");
    m_taken = true;
    destroy_n_reverse(m_data, m_size);
  }

  void unsafe_mark_taken() noexcept { m_taken = true; }
};

namespace detail {

// Runs an extraction step whose outcome is reported through result<R>.
template <typename R, typename F, typename View>
result<R> invoke_into_result(F &&f, View &view) {
  if constexpr (std::is_void_v<R>) {
    std::invoke(std::forward<F>(f), view);
    return {};
  } else {
    return result<R>(std::invoke(std::forward<F>(f), view));
  }
}

} // namespace detail

namespace detail {

// Storage for a T whose destructor never runs implicitly.
template <typename T> union suppressed_storage {
  T value;

  suppressed_storage() noexcept {}
  ~suppressed_storage() {}
};

} // namespace detail

/**
 * @brief Owns a T but never destroys it implicitly.
 *
 * The payload lives in a union, so leaving scope runs no destructor.
 * Ownership ends in exactly one of three ways: into_inner() moves the value
 * out, unsafe_drop() destroys it, or take_with() hands it to an extraction
 * step. Doing none of them forgets the value. Once ownership has ended the
 * wrapper is spent; a second attempt trips HANDOFF_ASSERT.
 *
 * The wrapper is pinned: it cannot be copied or moved, only consumed where
 * it stands.
 */
template <typename T> class manually_drop {
  static_assert(std::is_object_v<T> && !std::is_array_v<T>,
                "manually_drop needs a complete object type");
  static_assert(sizeof(detail::suppressed_storage<T>) == sizeof(T) &&
                    alignof(detail::suppressed_storage<T>) == alignof(T),
                "payload storage must be layout-compatible with T");

  detail::suppressed_storage<T> m_storage;
  bool m_taken = false;

  T *payload() noexcept {
    HANDOFF_ASSERT(!m_taken, "manually_drop payload was already taken");
    return &m_storage.value;
  }

  const T *payload() const noexcept {
    HANDOFF_ASSERT(!m_taken, "manually_drop payload was already taken");
    return &m_storage.value;
  }

  // Ends ownership; the caller does whatever it ends with.
  T *release() noexcept {
    T *p = payload();
    m_taken = true;
    return p;
  }

public:
  using element_type = T;

  explicit manually_drop(T &&value) noexcept(
      std::is_nothrow_move_constructible_v<T>) {
    new (&m_storage.value) T(std::move(value));
  }

  template <typename... Args>
  explicit manually_drop(std::in_place_t, Args &&...args) noexcept(
      std::is_nothrow_constructible_v<T, Args...>) {
    new (&m_storage.value) T(std::forward<Args>(args)...);
  }

  manually_drop(const manually_drop &) = delete;
  manually_drop &operator=(const manually_drop &) = delete;
  manually_drop(manually_drop &&) = delete;
  manually_drop &operator=(manually_drop &&) = delete;

  ~manually_drop() = default;

  [[nodiscard]] bool taken() const noexcept { return m_taken; }

  [[nodiscard]] T &operator*() noexcept { return *payload(); }
  [[nodiscard]] const T &operator*() const noexcept { return *payload(); }
  [[nodiscard]] T *operator->() noexcept { return payload(); }
  [[nodiscard]] const T *operator->() const noexcept { return payload(); }
  [[nodiscard]] T *unsafe_get() noexcept { return &m_storage.value; }

  [[nodiscard]] T into_inner() && noexcept
    requires nothrow_relocatable<T>
  {
    return relocate_out(release());
  }

  void unsafe_drop() noexcept { std::destroy_at(release()); }

  /**
   * @brief Calls @p f with a view of the payload and returns its result.
   * No allocation or deallocation takes place. The wrapper is spent even if
   * @p f unwinds.
   */
  template <typename F> decltype(auto) take_with(F &&f) && {
    suppressed_ref<T> view(release());
    return std::invoke(std::forward<F>(f), view);
  }
};

} // namespace handoff
