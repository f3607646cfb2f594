#pragma once
#include <cstddef>
#include <handoff/expected.hpp>
#include <limits>
#include <type_traits>

namespace handoff {

enum class error : int {
  allocation_failed = 1,
  in_place_growth_failed,
  unsupported_operation,
  out_of_range,
  out_of_bounds,
  invalid_argument,
  integer_overflow,
  empty_pointer,
  pointer_expired,
  already_taken
};

template <typename T> using result = expected<T, error>;

struct mem_block {
  void *ptr;
  std::size_t size;
};

class fallible_allocator {
public:
  virtual ~fallible_allocator() noexcept = default;

  [[nodiscard]] virtual result<mem_block>
  allocate(std::size_t bytes, std::size_t alignment) noexcept = 0;

  [[nodiscard]] virtual result<std::size_t>
  expand_in_place(void *ptr, std::size_t old_size,
                  std::size_t new_size) noexcept = 0;

  [[nodiscard]] virtual result<mem_block>
  reallocate(void *ptr, std::size_t old_size, std::size_t new_size,
             std::size_t alignment) noexcept = 0;

  virtual void deallocate(void *ptr, std::size_t bytes) noexcept = 0;
};

// A relocatable type may change address by a plain byte copy, after which the
// source bytes are abandoned without running the destructor. Trivially
// copyable types qualify; specialize for owning handles such as
// std::unique_ptr.
template <typename T> struct is_relocatable : std::is_trivially_copyable<T> {};

template <typename T>
inline constexpr bool is_relocatable_v = is_relocatable<T>::value;

namespace detail {

/**
 * @brief Overflow-checked multiplication: *result = a * b.
 * @return true if the product does not fit.
 */
template <typename T>
[[nodiscard]] constexpr bool check_mul(T a, T b, T *result) noexcept {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_mul_overflow(a, b, result);
#else
  if (a > 0 && b > std::numeric_limits<T>::max() / a)
    return true;
  *result = a * b;
  return false;
#endif
}

} // namespace detail

} // namespace handoff
