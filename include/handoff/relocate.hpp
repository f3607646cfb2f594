#pragma once
#include <cstring>
#include <handoff/concepts.hpp>
#include <handoff/core.hpp>
#include <memory>
#include <new>

namespace handoff {

/**
 * @brief Moves the object at @p src into uninitialized @p dst and ends the
 * lifetime of @p src.
 * Relocatable types are byte-copied and the source is abandoned without a
 * destructor call; every other type is move-constructed and the moved-from
 * husk destroyed.
 */
template <nothrow_relocatable T> T *relocate_at(T *src, T *dst) noexcept {
  if constexpr (is_relocatable_v<T>) {
    std::memcpy(static_cast<void *>(dst), static_cast<const void *>(src),
                sizeof(T));
    return std::launder(dst);
  } else {
    T *moved = new (dst) T(std::move(*src));
    std::destroy_at(src);
    return moved;
  }
}

// Element order is preserved; the ranges must not overlap.
template <nothrow_relocatable T>
void relocate_n(T *src, std::size_t count, T *dst) noexcept {
  if (count == 0)
    return;
  if constexpr (is_relocatable_v<T>) {
    std::memcpy(static_cast<void *>(dst), static_cast<const void *>(src),
                count * sizeof(T));
  } else {
    for (std::size_t i = 0; i < count; ++i) {
      new (dst + i) T(std::move(src[i]));
      std::destroy_at(src + i);
    }
  }
}

/**
 * @brief Relocates the object at @p src into the returned value.
 * A by-value result is always built by a constructor, so every T, relocatable
 * or not, is move-constructed once and the husk destroyed. Use relocate_at
 * when the destination is storage and a byte copy is wanted.
 * @p src holds no object afterwards; reading or destroying it again is
 * undefined.
 */
template <nothrow_relocatable T> [[nodiscard]] T relocate_out(T *src) noexcept {
  T out(std::move(*src));
  std::destroy_at(src);
  return out;
}

// Destroys a run back to front, the reverse of construction order.
template <typename T> void destroy_n_reverse(T *first, std::size_t count) noexcept {
  if constexpr (!std::is_trivially_destructible_v<T>) {
    for (std::size_t i = count; i > 0; --i)
      std::destroy_at(first + i - 1);
  }
}

namespace detail {

// Returns a shell's raw storage to its allocator on scope exit, unwinding
// included. Never touches the object that lived there.
class scoped_deallocation {
public:
  scoped_deallocation(fallible_allocator *alloc, void *ptr,
                      std::size_t bytes) noexcept
      : alloc_(alloc), ptr_(ptr), bytes_(bytes) {}

  scoped_deallocation(const scoped_deallocation &) = delete;
  scoped_deallocation &operator=(const scoped_deallocation &) = delete;

  ~scoped_deallocation() {
    if (ptr_ && alloc_)
      alloc_->deallocate(ptr_, bytes_);
  }

private:
  fallible_allocator *alloc_;
  void *ptr_;
  std::size_t bytes_;
};

} // namespace detail

} // namespace handoff
