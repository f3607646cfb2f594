#pragma once
#include <atomic>
#include <boost/intrusive_ptr.hpp>
#include <cstddef>
#include <handoff/allocator.hpp>
#include <handoff/assert.hpp>
#include <handoff/concepts.hpp>
#include <handoff/construction_helpers.hpp>
#include <handoff/core.hpp>
#include <handoff/deref_take.hpp>
#include <handoff/manually_drop.hpp>
#include <handoff/relocate.hpp>
#include <new>
#include <type_traits>

namespace handoff {

/**
 * @brief Embeds the reference count and the owning allocator in the payload
 * itself, for use with boost::intrusive_ptr.
 * Copies and moves start a fresh count: the count belongs to the heap slot,
 * not to the value.
 */
template <typename Derived> class intrusive_base {
protected:
  mutable std::atomic<std::size_t> ref_count_{0};
  fallible_allocator *alloc_ = nullptr;

public:
  constexpr intrusive_base() noexcept = default;
  constexpr intrusive_base(const intrusive_base &) noexcept
      : ref_count_{0}, alloc_{nullptr} {}
  constexpr intrusive_base &operator=(const intrusive_base &) noexcept {
    return *this;
  }
  constexpr intrusive_base(intrusive_base &&) noexcept
      : ref_count_{0}, alloc_{nullptr} {}
  constexpr intrusive_base &operator=(intrusive_base &&) noexcept {
    return *this;
  }

  void set_handoff_context(fallible_allocator *a) noexcept { alloc_ = a; }

  [[nodiscard]] fallible_allocator *get_allocator() const noexcept {
    return alloc_;
  }

  [[nodiscard]] std::size_t use_count() const noexcept {
    return ref_count_.load(std::memory_order_relaxed);
  }

  /**
   * @brief Moves the count from 1 to 0 without destroying the object.
   * On success the caller owns the payload and its storage outright.
   */
  [[nodiscard]] bool try_claim() const noexcept {
    std::size_t expected_count = 1;
    return ref_count_.compare_exchange_strong(expected_count, 0,
                                              std::memory_order_acq_rel,
                                              std::memory_order_relaxed);
  }

  friend void intrusive_ptr_add_ref(const intrusive_base<Derived> *p) noexcept {
    p->ref_count_.fetch_add(1, std::memory_order_relaxed);
  }

  friend void intrusive_ptr_release(const intrusive_base<Derived> *p) noexcept {
    if (p->ref_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      fallible_allocator *a = p->alloc_;

      constexpr std::size_t sz = sizeof(Derived);

      auto *derived_ptr = static_cast<const Derived *>(p);
      derived_ptr->~Derived();

      if (a) {
        a->deallocate(const_cast<Derived *>(derived_ptr), sz);
      }
    }
  }
};

template <typename T>
concept derives_from_intrusive_base = std::is_base_of_v<intrusive_base<T>, T>;

template <typename T, typename... Args>
[[nodiscard]] result<boost::intrusive_ptr<T>>
try_allocate_intrusive(fallible_allocator &alloc, Args &&...args) noexcept {
  auto block = alloc.allocate(sizeof(T), alignof(T));
  if (!block)
    return unexpected(block.error());

  T *ptr = static_cast<T *>(block->ptr);

  auto built =
      construction_helpers::try_construct(ptr, std::forward<Args>(args)...);
  if (!built) {
    alloc.deallocate(ptr, sizeof(T));
    return unexpected(built.error());
  }

  ptr->set_handoff_context(&alloc);
  return boost::intrusive_ptr<T>(ptr);
}

template <typename T, typename... Args>
[[nodiscard]] result<boost::intrusive_ptr<T>>
try_make_intrusive(Args &&...args) noexcept {
  return try_allocate_intrusive<T>(get_default_allocator(),
                                   std::forward<Args>(args)...);
}

/**
 * Taking from an intrusive box follows the shared box: the sole owner gets
 * the payload itself and the slot is released without ~T, otherwise the
 * payload is cloned and this reference dropped.
 */
template <typename T>
  requires derives_from_intrusive_base<T>
struct deref_take_traits<boost::intrusive_ptr<T>> {
  using target_type = T;

  template <typename F>
    requires clonable<T>
  static auto take_with(boost::intrusive_ptr<T> &&ptr, F &&f) {
    using R = std::invoke_result_t<F, suppressed_ref<T> &>;
    HANDOFF_ASSERT(ptr != nullptr, "take from an empty intrusive_ptr");

    T *raw = ptr.detach();

    if (raw->try_claim()) {
      detail::scoped_deallocation shell(raw->get_allocator(), raw, sizeof(T));
      suppressed_ref<T> view(raw);
      return detail::invoke_into_result<R>(std::forward<F>(f), view);
    }

    // Adopt the detached reference so that it is dropped on every path.
    boost::intrusive_ptr<T> owner(raw, false);

    fallible_allocator *alloc = raw->get_allocator();
    alignas(T) std::byte storage[sizeof(T)];
    T *copy = reinterpret_cast<T *>(storage);
    auto cloned = construction_helpers::try_clone_at(
        alloc ? *alloc : get_default_allocator(), copy, *raw);
    if (!cloned)
      return result<R>(unexpected(cloned.error()));
    owner.reset();

    suppressed_ref<T> view(std::launder(copy));
    return detail::invoke_into_result<R>(std::forward<F>(f), view);
  }

  static result<T> take(boost::intrusive_ptr<T> &&ptr) {
    return take_with(std::move(ptr),
                     [](suppressed_ref<T> &payload) { return payload.take(); });
  }

  static bool is_empty(const boost::intrusive_ptr<T> &ptr) noexcept {
    return !ptr;
  }
};

} // namespace handoff
