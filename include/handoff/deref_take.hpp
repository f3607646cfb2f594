#pragma once
#include <functional>
#include <handoff/allocator_helper.hpp>
#include <handoff/assert.hpp>
#include <handoff/core.hpp>
#include <handoff/manually_drop.hpp>
#include <handoff/owned_conversion.hpp>
#include <handoff/relocate.hpp>
#include <handoff/shared_ptr.hpp>
#include <handoff/unique_ptr.hpp>
#include <handoff/vector.hpp>
#include <memory>
#include <new>
#include <type_traits>

namespace handoff {

/**
 * @brief Describes how an owning container gives up its payload.
 *
 * A specialization for container type `C` provides:
 * - `target_type`: the payload type, `U[]` for runs;
 * - `static decltype(auto) take_with(C &&, F &&)`: consumes the container,
 *   calls `f(suppressed_ref<target_type> &)` and releases the shell's
 *   storage without running the payload destructor;
 * - `static bool is_empty(const C &) noexcept`: true when there is no payload
 *   to take (a null box);
 * - optionally `static bool is_taken(const C &) noexcept`, for containers
 *   that stay in place after a take and remember it;
 * - optionally `static auto take(C &&)`, replacing the default conversion.
 *
 * The primary template is empty, so `deref_takeable` is false for any type
 * without a specialization, references included.
 */
template <typename C> struct deref_take_traits {};

template <typename C>
concept deref_takeable =
    requires { typename deref_take_traits<C>::target_type; };

template <typename C>
using deref_target_t = typename deref_take_traits<C>::target_type;

namespace detail {

// Frees storage obtained from a new-expression without running ~T.
template <typename T> class scoped_operator_delete {
public:
  explicit scoped_operator_delete(T *ptr) noexcept : ptr_(ptr) {}

  scoped_operator_delete(const scoped_operator_delete &) = delete;
  scoped_operator_delete &operator=(const scoped_operator_delete &) = delete;

  ~scoped_operator_delete() {
    if constexpr (alignof(T) > __STDCPP_DEFAULT_NEW_ALIGNMENT__) {
      ::operator delete(static_cast<void *>(ptr_), sizeof(T),
                        std::align_val_t{alignof(T)});
    } else {
      ::operator delete(static_cast<void *>(ptr_), sizeof(T));
    }
  }

private:
  T *ptr_;
};

} // namespace detail

template <typename T> struct deref_take_traits<manually_drop<T>> {
  using target_type = T;

  template <typename F>
  static decltype(auto) take_with(manually_drop<T> &&wrapper, F &&f) {
    return std::move(wrapper).take_with(std::forward<F>(f));
  }

  static bool is_empty(const manually_drop<T> &) noexcept { return false; }

  static bool is_taken(const manually_drop<T> &wrapper) noexcept {
    return wrapper.taken();
  }
};

template <typename T>
struct deref_take_traits<std::unique_ptr<T, allocator_deleter<T>>> {
  using target_type = T;

  template <typename F>
  static decltype(auto) take_with(std::unique_ptr<T, allocator_deleter<T>> &&box,
                                  F &&f) {
    HANDOFF_ASSERT(box != nullptr, "take from an empty unique_ptr");
    fallible_allocator *alloc = box.get_deleter().get_allocator();
    T *payload = box.release();
    detail::scoped_deallocation shell(alloc, payload, sizeof(T));
    suppressed_ref<T> view(payload);
    return std::invoke(std::forward<F>(f), view);
  }

  static bool
  is_empty(const std::unique_ptr<T, allocator_deleter<T>> &box) noexcept {
    return box == nullptr;
  }
};

// Boxes created with `new T`. The storage is returned with the sized global
// operator delete, so T must not bring its own allocation functions.
template <typename T>
struct deref_take_traits<std::unique_ptr<T, std::default_delete<T>>> {
  static_assert(!std::is_array_v<T>,
                "take from a run box goes through array_box");
  static_assert(!std::is_polymorphic_v<T> || std::is_final_v<T>,
                "the box may hold a derived object of a different size");

  using target_type = T;

  template <typename F>
  static decltype(auto) take_with(std::unique_ptr<T> &&box, F &&f) {
    HANDOFF_ASSERT(box != nullptr, "take from an empty unique_ptr");
    T *payload = box.release();
    detail::scoped_operator_delete<T> shell(payload);
    suppressed_ref<T> view(payload);
    return std::invoke(std::forward<F>(f), view);
  }

  static bool is_empty(const std::unique_ptr<T> &box) noexcept {
    return box == nullptr;
  }
};

template <typename T> struct deref_take_traits<array_box<T>> {
  using target_type = T[];

  template <typename F>
  static decltype(auto) take_with(array_box<T> &&box, F &&f) {
    return std::move(box).take_with(std::forward<F>(f));
  }

  static bool is_empty(const array_box<T> &box) noexcept {
    return !static_cast<bool>(box);
  }
};

template <typename T, typename A> struct deref_take_traits<vector<T, A>> {
  using target_type = T[];

  template <typename F>
  static decltype(auto) take_with(vector<T, A> &&seq, F &&f) {
    return std::move(seq).take_with(std::forward<F>(f));
  }

  // The owned run comes from the sequence's own allocator.
  static result<vector<T, A>> take(vector<T, A> &&seq) {
    A &alloc = seq.get_allocator();
    return std::move(seq).take_with([&alloc](suppressed_ref<T[]> &run) {
      return convert_to_owned(run, alloc);
    });
  }

  static bool is_empty(const vector<T, A> &) noexcept { return false; }
};

template <typename T> struct deref_take_traits<shared_ptr<T>> {
  using target_type = T;

  // Returns result<R>: duplicating a payload that is still shared may fail.
  template <typename F> static auto take_with(shared_ptr<T> &&ptr, F &&f) {
    return std::move(ptr).take_with(std::forward<F>(f));
  }

  static result<T> take(shared_ptr<T> &&ptr) {
    return std::move(ptr).take_with(
        [](suppressed_ref<T> &payload) { return payload.take(); });
  }

  static bool is_empty(const shared_ptr<T> &ptr) noexcept { return !ptr; }
};

/**
 * @brief Consumes @p container and calls @p f with a destructor-suppressed
 * view of its payload.
 * Only rvalues are accepted: the container is gone after the call. The
 * shell's storage is released when @p f returns or unwinds.
 * @return Whatever @p f returns; `result<R>` for reference-counted boxes.
 */
template <typename C, typename F>
  requires deref_takeable<C>
decltype(auto) deref_take_with(C &&container, F &&f) {
  return deref_take_traits<C>::take_with(std::move(container),
                                         std::forward<F>(f));
}

/**
 * @brief Consumes @p container and returns the owned form of its payload:
 * the value itself for sized payloads, a vector for runs.
 */
template <typename C>
  requires deref_takeable<C>
[[nodiscard]] auto deref_take(C &&container) {
  using traits = deref_take_traits<C>;
  using target = deref_target_t<C>;
  if constexpr (requires(C &&c) { traits::take(std::move(c)); }) {
    return traits::take(std::move(container));
  } else {
    return traits::take_with(std::move(container),
                             [](suppressed_ref<target> &payload) {
                               return convert_to_owned(payload);
                             });
  }
}

/**
 * @brief As deref_take(), but a container with nothing in it yields
 * error::empty_pointer, and one already taken from yields
 * error::already_taken, instead of tripping an assertion.
 */
template <typename C>
  requires deref_takeable<C>
[[nodiscard]] auto try_deref_take(C &&container)
    -> decltype(deref_take(std::move(container))) {
  using traits = deref_take_traits<C>;
  if constexpr (requires(const C &c) { traits::is_taken(c); }) {
    if (traits::is_taken(container))
      return unexpected(error::already_taken);
  }
  if (traits::is_empty(container))
    return unexpected(error::empty_pointer);
  return deref_take(std::move(container));
}

} // namespace handoff
