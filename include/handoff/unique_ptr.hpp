#pragma once
#include <handoff/allocator.hpp>
#include <handoff/concepts.hpp>
#include <handoff/construction_helpers.hpp>
#include <memory>

namespace handoff {

/**
 * @brief Deleter that destroys the payload and returns its storage to the
 * allocator it came from.
 * A default-constructed deleter has no allocator and releases nothing.
 */
template <typename T> class allocator_deleter {
  fallible_allocator *alloc_;

public:
  constexpr allocator_deleter() noexcept : alloc_(nullptr) {}
  constexpr explicit allocator_deleter(fallible_allocator *a) noexcept
      : alloc_(a) {}

  void operator()(T *ptr) const noexcept {
    if (ptr && alloc_) {
      std::destroy_at(ptr);
      alloc_->deallocate(ptr, sizeof(T));
    }
  }

  [[nodiscard]] fallible_allocator *get_allocator() const noexcept {
    return alloc_;
  }
};

// Exclusive heap box whose storage comes from a fallible_allocator.
template <typename T>
using unique_ptr = std::unique_ptr<T, allocator_deleter<T>>;

/**
 * @brief Allocates a T from @p alloc and builds it in place.
 * Construction goes through construction_helpers::try_construct, so two-phase
 * and factory types report their own errors. On any failure the block is
 * returned before the error is.
 */
template <typename T, typename... Args>
[[nodiscard]] result<unique_ptr<T>>
make_unique_fallible(fallible_allocator &alloc, Args &&...args) noexcept {
  static_assert(!std::is_array_v<T>, "runs are allocated with array_box");

  auto block = alloc.allocate(sizeof(T), alignof(T));
  if (!block)
    return unexpected(block.error());

  T *slot = static_cast<T *>(block->ptr);
  auto built =
      construction_helpers::try_construct(slot, std::forward<Args>(args)...);
  if (!built) {
    alloc.deallocate(slot, sizeof(T));
    return unexpected(built.error());
  }
  return unique_ptr<T>(std::launder(slot), allocator_deleter<T>(&alloc));
}

template <typename T, typename... Args>
[[nodiscard]] result<unique_ptr<T>> make_unique(Args &&...args) noexcept {
  return make_unique_fallible<T>(get_default_allocator(),
                                 std::forward<Args>(args)...);
}

// Boxes own their payload through a single pointer; the deleter carries no
// back-reference to the box, so a byte copy moves ownership.
template <typename T, typename D>
struct is_relocatable<std::unique_ptr<T, D>> : std::true_type {};

} // namespace handoff
