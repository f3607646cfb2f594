#pragma once
#include <cstdio>
#include <cstdlib>

#if defined(__clang__) || defined(__GNUC__)
#define HANDOFF_TRAP() __builtin_trap()
#elif defined(_MSC_VER)
#define HANDOFF_TRAP() __debugbreak()
#else
#define HANDOFF_TRAP() std::abort()
#endif

namespace handoff {
// Called with the failed expression before the process traps. Replace it to
// route contract violations into an application log.
using assert_handler_t = void (*)(const char *expression, const char *file,
                                  int line, const char *message);

namespace detail {
inline void default_assert_handler(const char *expr, const char *file, int line,
                                   const char *msg) {
  std::fprintf(stderr,
               "[HANDOFF ASSERT] Failure: %s\nAt: %s:%d\nMessage: %s\n", expr,
               file, line, msg);
  std::fflush(stderr);
}

inline assert_handler_t &get_handler_ptr() noexcept {
  static assert_handler_t handler = default_assert_handler;
  return handler;
}
} // namespace detail

inline void set_assert_handler(assert_handler_t new_handler) noexcept {
  detail::get_handler_ptr() =
      new_handler ? new_handler : detail::default_assert_handler;
}

inline assert_handler_t get_assert_handler() noexcept {
  return detail::get_handler_ptr();
}
} // namespace handoff

#if defined(HANDOFF_DISABLE_ASSERT)
#if defined(__clang__) || defined(__GNUC__)
#define HANDOFF_ASSERT(cond, ...)                                              \
  do {                                                                         \
    if (!(cond))                                                               \
      __builtin_unreachable();                                                 \
  } while (0)
#else
#define HANDOFF_ASSERT(cond, ...) (void)0
#endif
#else
#define HANDOFF_ASSERT(cond, ...)                                              \
  do {                                                                         \
    if (!(cond)) [[unlikely]] {                                                \
      ::handoff::detail::get_handler_ptr()(#cond, __FILE__, __LINE__,          \
                                           "" __VA_ARGS__);                    \
      HANDOFF_TRAP();                                                          \
    }                                                                          \
  } while (0)
#endif

// Bounds and bookkeeping checks on hot paths; gone in release builds.
#if defined(NDEBUG)
#define HANDOFF_DEBUG_ASSERT(cond, ...) (void)0
#else
#define HANDOFF_DEBUG_ASSERT(cond, ...) HANDOFF_ASSERT(cond, __VA_ARGS__)
#endif
