#pragma once
#include <functional>
#include <handoff/assert.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace handoff {

template <typename E> class unexpected {
  E m_error;

public:
  constexpr explicit unexpected(E e) : m_error(std::move(e)) {}
  constexpr E &value() & noexcept { return m_error; }
  constexpr const E &value() const & noexcept { return m_error; }
  constexpr E &&value() && noexcept { return std::move(m_error); }
};

template <typename E> unexpected(E) -> unexpected<E>;

namespace detail {
template <typename T> struct is_unexpected : std::false_type {};
template <typename E> struct is_unexpected<unexpected<E>> : std::true_type {};
} // namespace detail

template <typename T, typename E> class expected;

namespace detail {
template <typename T> struct is_expected : std::false_type {};
template <typename T, typename E>
struct is_expected<expected<T, E>> : std::true_type {};
} // namespace detail

/**
 * @brief Value-or-error return type used by every fallible operation.
 * Both alternatives must be nothrow move constructible so that a result can
 * always be handed back to the caller without a second failure mode.
 */
template <typename T, typename E> class [[nodiscard]] expected {
  static_assert(std::is_nothrow_move_constructible_v<T>,
                "T must be nothrow move constructible");
  static_assert(std::is_nothrow_move_constructible_v<E>,
                "E must be nothrow move constructible");

  union {
    T m_value;
    E m_error;
  };
  bool m_has_value;

  void destroy() noexcept {
    if (m_has_value)
      std::destroy_at(&m_value);
    else
      std::destroy_at(&m_error);
  }

  template <typename Other> void construct_from(Other &&other) {
    m_has_value = other.m_has_value;
    if (m_has_value)
      new (&m_value) T(std::forward<Other>(other).m_value);
    else
      new (&m_error) E(std::forward<Other>(other).m_error);
  }

public:
  using value_type = T;
  using error_type = E;

  expected()
    requires std::is_nothrow_default_constructible_v<T>
      : m_has_value(true) {
    new (&m_value) T();
  }

  expected(T &&val) noexcept : m_has_value(true) {
    new (&m_value) T(std::move(val));
  }

  template <typename U>
    requires(!std::is_same_v<std::remove_cvref_t<U>, expected> &&
             !detail::is_unexpected<std::remove_cvref_t<U>>::value &&
             std::is_constructible_v<T, U &&>)
  expected(U &&val) : m_has_value(true) {
    new (&m_value) T(std::forward<U>(val));
  }

  template <typename G>
    requires std::is_constructible_v<E, G &&>
  expected(unexpected<G> &&err) noexcept : m_has_value(false) {
    new (&m_error) E(std::move(err).value());
  }

  template <typename G>
    requires std::is_constructible_v<E, const G &>
  expected(const unexpected<G> &err) : m_has_value(false) {
    new (&m_error) E(err.value());
  }

  expected(expected &&other) noexcept { construct_from(std::move(other)); }

  expected(const expected &other)
    requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
  {
    construct_from(other);
  }

  expected &operator=(expected &&other) noexcept {
    if (this != &other) {
      destroy();
      construct_from(std::move(other));
    }
    return *this;
  }

  ~expected() { destroy(); }

  constexpr bool has_value() const noexcept { return m_has_value; }
  constexpr explicit operator bool() const noexcept { return m_has_value; }

  constexpr T &value() & {
    HANDOFF_ASSERT(m_has_value && "Result does not contain a value");
    return m_value;
  }

  constexpr const T &value() const & {
    HANDOFF_ASSERT(m_has_value && "Result does not contain a value");
    return m_value;
  }

  constexpr T &&value() && {
    HANDOFF_ASSERT(m_has_value && "Result does not contain a value");
    return std::move(m_value);
  }

  constexpr E &error() & {
    HANDOFF_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  constexpr const E &error() const & {
    HANDOFF_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  constexpr E &&error() && {
    HANDOFF_ASSERT(!m_has_value && "Result does not contain an error");
    return std::move(m_error);
  }

  template <typename U> T value_or(U &&fallback) const & {
    return m_has_value ? m_value : static_cast<T>(std::forward<U>(fallback));
  }

  template <typename U> T value_or(U &&fallback) && {
    return m_has_value ? std::move(m_value)
                       : static_cast<T>(std::forward<U>(fallback));
  }

  // Chains a step returning another expected with the same error type.
  template <typename F> auto and_then(F &&f) & {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T &>>;
    static_assert(detail::is_expected<R>::value,
                  "and_then requires a callable returning expected");
    if (m_has_value)
      return std::invoke(std::forward<F>(f), m_value);
    return R(unexpected(m_error));
  }

  template <typename F> auto and_then(F &&f) && {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T &&>>;
    static_assert(detail::is_expected<R>::value,
                  "and_then requires a callable returning expected");
    if (m_has_value)
      return std::invoke(std::forward<F>(f), std::move(m_value));
    return R(unexpected(std::move(m_error)));
  }

  template <typename F> auto transform(F &&f) && {
    using U = std::remove_cvref_t<std::invoke_result_t<F, T &&>>;
    if (m_has_value)
      return expected<U, E>(std::invoke(std::forward<F>(f), std::move(m_value)));
    return expected<U, E>(unexpected(std::move(m_error)));
  }

  constexpr T *operator->() noexcept { return &value(); }
  constexpr const T *operator->() const noexcept { return &value(); }

  constexpr T &operator*() & noexcept { return value(); }
  constexpr const T &operator*() const & noexcept { return value(); }
  constexpr T &&operator*() && noexcept { return std::move(value()); }

  bool operator==(const expected &other) const {
    if (m_has_value != other.m_has_value)
      return false;
    if (m_has_value)
      return m_value == other.m_value;
    return m_error == other.m_error;
  }
};

template <typename E> class [[nodiscard]] expected<void, E> {
  static_assert(std::is_nothrow_move_constructible_v<E>,
                "E must be nothrow move constructible");

  union {
    E m_error;
  };
  bool m_has_value;

public:
  using value_type = void;
  using error_type = E;

  constexpr expected() noexcept : m_has_value(true) {}

  template <typename G>
    requires std::is_constructible_v<E, G &&>
  expected(unexpected<G> &&err) noexcept : m_has_value(false) {
    new (&m_error) E(std::move(err).value());
  }

  expected(expected &&other) noexcept : m_has_value(other.m_has_value) {
    if (!m_has_value)
      new (&m_error) E(std::move(other.m_error));
  }

  expected(const expected &other)
    requires std::is_copy_constructible_v<E>
      : m_has_value(other.m_has_value) {
    if (!m_has_value)
      new (&m_error) E(other.m_error);
  }

  ~expected() {
    if (!m_has_value)
      std::destroy_at(&m_error);
  }

  constexpr bool has_value() const noexcept { return m_has_value; }
  constexpr explicit operator bool() const noexcept { return m_has_value; }

  void value() const {
    HANDOFF_ASSERT(m_has_value && "Result contains an error");
  }

  constexpr E &error() & {
    HANDOFF_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  constexpr const E &error() const & {
    HANDOFF_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  constexpr E &&error() && {
    HANDOFF_ASSERT(!m_has_value && "Result does not contain an error");
    return std::move(m_error);
  }

  bool operator==(const expected &other) const {
    if (m_has_value != other.m_has_value)
      return false;
    return m_has_value || m_error == other.m_error;
  }
};

} // namespace handoff
