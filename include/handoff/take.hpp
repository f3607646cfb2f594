#pragma once
#include <handoff/allocator.hpp>
#include <handoff/allocator_helper.hpp>
#include <handoff/concepts.hpp>
#include <handoff/core.hpp>
#include <handoff/deref_take.hpp>
#include <handoff/manually_drop.hpp>
#include <handoff/owned_conversion.hpp>
#include <handoff/unique_ptr.hpp>
#include <handoff/vector.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace handoff {

/**
 * @brief Opt-in relation "a value of type S can give up a T".
 *
 * Lets generic code take a T out of a source without knowing which container
 * kind the source is. A specialization provides `source_type` and
 * `static decltype(auto) take_with(S &&, F &&)` calling
 * `f(suppressed_ref<T> &)`.
 *
 * Provided relations:
 * | S                      | T     |
 * |------------------------|-------|
 * | `T`                    | `T`   |
 * | `manually_drop<T>`     | `T`   |
 * | `unique_ptr<T>`        | `T`   |
 * | `std::unique_ptr<T>`   | `T`   |
 * | `array_box<T>`         | `T[]` |
 * | `vector<T, A>`         | `T[]` |
 */
template <typename S, typename T> struct take_relation {};

namespace detail {

template <typename S> struct take_through_deref {
  using source_type = S;

  template <typename F> static decltype(auto) take_with(S &&source, F &&f) {
    return deref_take_with(std::move(source), std::forward<F>(f));
  }
};

} // namespace detail

// A plain value is parked in a manually_drop holder for the duration of f.
template <typename T>
  requires(std::is_object_v<T> && !std::is_array_v<T>)
struct take_relation<T, T> {
  using source_type = T;

  template <typename F> static decltype(auto) take_with(T &&value, F &&f) {
    manually_drop<T> holder(std::move(value));
    return std::move(holder).take_with(std::forward<F>(f));
  }
};

template <typename T>
struct take_relation<manually_drop<T>, T>
    : detail::take_through_deref<manually_drop<T>> {};

template <typename T>
struct take_relation<std::unique_ptr<T, allocator_deleter<T>>, T>
    : detail::take_through_deref<std::unique_ptr<T, allocator_deleter<T>>> {};

template <typename T>
struct take_relation<std::unique_ptr<T, std::default_delete<T>>, T>
    : detail::take_through_deref<std::unique_ptr<T, std::default_delete<T>>> {
};

template <typename T>
struct take_relation<array_box<T>, T[]>
    : detail::take_through_deref<array_box<T>> {};

template <typename T, typename A>
struct take_relation<vector<T, A>, T[]>
    : detail::take_through_deref<vector<T, A>> {};

// False for lvalue sources: S deduces to a reference and matches nothing.
template <typename S, typename T>
concept takes_from =
    requires { typename take_relation<S, T>::source_type; };

/**
 * @brief Consumes @p source and calls @p f with a destructor-suppressed view
 * of the T it holds.
 * @code
 * auto doubled = handoff::take_with<int>(std::move(box),
 *     [](handoff::suppressed_ref<int> &v) { return *v * 2; });
 * @endcode
 */
template <typename T, typename S, typename F>
  requires takes_from<S, T>
decltype(auto) take_with(S &&source, F &&f) {
  return take_relation<S, T>::take_with(std::move(source), std::forward<F>(f));
}

// Reads a sized T straight out of the source.
template <typename T, typename S>
  requires takes_from<S, T> && nothrow_relocatable<T>
[[nodiscard]] T take_sized(S &&source) {
  return take_with<T>(std::move(source),
                      [](suppressed_ref<T> &payload) { return payload.take(); });
}

/**
 * @brief Takes the owned form of T out of @p source: T itself for sized
 * payloads, a vector drawing on @p alloc for runs.
 */
template <typename T, typename S, typename Alloc>
  requires takes_from<S, T> && convertible_to_owned<T, Alloc>
[[nodiscard]] result<owned_t<T, Alloc>> take_owned(S &&source, Alloc &alloc) {
  return take_with<T>(std::move(source),
                      [&alloc](suppressed_ref<T> &payload) {
                        return convert_to_owned(payload, alloc);
                      });
}

template <typename T, typename S>
  requires takes_from<S, T> && convertible_to_owned<T>
[[nodiscard]] result<owned_t<T>> take_owned(S &&source) {
  return take_owned<T>(std::move(source), get_default_allocator());
}

} // namespace handoff
