#pragma once
#include <functional>
#include <handoff/assert.hpp>
#include <handoff/construction_helpers.hpp>
#include <handoff/core.hpp>
#include <handoff/manually_drop.hpp>
#include <handoff/relocate.hpp>
#include <handoff/rvalue_safety.hpp>
#include <utility>

namespace handoff {

/**
 * @brief Exclusive heap box around a run of T whose length is fixed at
 * allocation time.
 * Move-only. Destroys its elements back to front and returns the block to
 * its allocator on scope exit.
 */
template <typename T> class [[nodiscard]] array_box {
  friend class allocator_helper;

  constexpr array_box(T *ptr, std::size_t count,
                      fallible_allocator *alloc) noexcept
      : m_ptr(ptr), m_count(count), m_alloc(alloc) {}

  void release() noexcept {
    if (m_ptr && m_alloc) {
      destroy_n_reverse(m_ptr, m_count);
      m_alloc->deallocate(m_ptr, m_count * sizeof(T));
    }
  }

public:
  using element_type = T;

  constexpr array_box() noexcept
      : m_ptr(nullptr), m_count(0), m_alloc(nullptr) {}

  array_box(const array_box &) = delete;
  array_box &operator=(const array_box &) = delete;

  constexpr array_box(array_box &&other) noexcept
      : m_ptr(std::exchange(other.m_ptr, nullptr)),
        m_count(std::exchange(other.m_count, 0)),
        m_alloc(std::exchange(other.m_alloc, nullptr)) {}

  ~array_box() { release(); }

  array_box &operator=(array_box &&other) noexcept {
    if (this != &other) {
      release();
      m_ptr = std::exchange(other.m_ptr, nullptr);
      m_count = std::exchange(other.m_count, 0);
      m_alloc = std::exchange(other.m_alloc, nullptr);
    }
    return *this;
  }

  HANDOFF_BLOCK_RVALUE_ACCESS(T);

  [[nodiscard]] constexpr T *unsafe_get() const & noexcept { return m_ptr; }
  [[nodiscard]] constexpr std::size_t size() const noexcept { return m_count; }
  [[nodiscard]] constexpr bool empty() const noexcept { return m_count == 0; }
  [[nodiscard]] constexpr explicit operator bool() const noexcept {
    return m_ptr != nullptr;
  }

  [[nodiscard]] T *begin() const & noexcept { return m_ptr; }
  [[nodiscard]] T *end() const & noexcept { return m_ptr + m_count; }

  [[nodiscard]] constexpr T &operator[](std::size_t index) const & noexcept {
    HANDOFF_ASSERT(index < m_count, "array_box index out of bounds");
    return m_ptr[index];
  }

  [[nodiscard]] result<std::reference_wrapper<T>>
  at(std::size_t index) const & noexcept {
    if (index >= m_count)
      return unexpected(error::out_of_bounds);
    return std::ref(m_ptr[index]);
  }

  [[nodiscard]] T &unsafe_at(std::size_t index) const & noexcept {
    HANDOFF_DEBUG_ASSERT(index < m_count, "array_box index out of bounds");
    return m_ptr[index];
  }

  /**
   * @brief Consumes the box and hands its elements to @p f as a suppressed
   * run. The block goes back to the allocator when @p f returns or unwinds;
   * no element destructor runs on the box's behalf.
   */
  template <typename F> decltype(auto) take_with(F &&f) && {
    HANDOFF_ASSERT(m_ptr != nullptr, "take from an empty array_box");
    T *elements = std::exchange(m_ptr, nullptr);
    const std::size_t count = std::exchange(m_count, 0);
    detail::scoped_deallocation shell(std::exchange(m_alloc, nullptr),
                                      elements, count * sizeof(T));
    suppressed_ref<T[]> view(elements, count);
    return std::invoke(std::forward<F>(f), view);
  }

private:
  T *m_ptr;
  std::size_t m_count;
  fallible_allocator *m_alloc;
};

class allocator_helper {
public:
  constexpr explicit allocator_helper(fallible_allocator &alloc) noexcept
      : m_alloc(&alloc) {}

  /**
   * @brief Allocates @p count elements, each built from @p args.
   * Transactional: if any element fails to construct, the ones already
   * built are destroyed and the block is released.
   */
  template <typename T, typename... Args>
  [[nodiscard]] result<array_box<T>>
  allocate_array(std::size_t count, const Args &...args) const noexcept {
    if (count == 0)
      return unexpected(error::invalid_argument);

    std::size_t total_bytes;
    if (detail::check_mul(count, sizeof(T), &total_bytes))
      return unexpected(error::integer_overflow);

    auto block_res = m_alloc->allocate(total_bytes, alignof(T));
    if (!block_res)
      return unexpected(block_res.error());

    T *elements = static_cast<T *>(block_res->ptr);

    for (std::size_t built = 0; built < count; ++built) {
      auto res = construction_helpers::try_construct(&elements[built], args...);
      if (!res) {
        destroy_n_reverse(elements, built);
        m_alloc->deallocate(elements, total_bytes);
        return unexpected(res.error());
      }
    }

    return array_box<T>(elements, count, m_alloc);
  }

  fallible_allocator &get_allocator() const noexcept { return *m_alloc; }

private:
  fallible_allocator *m_alloc;
};

} // namespace handoff
