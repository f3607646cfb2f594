#pragma once
#include <handoff/posix_allocator.hpp>

namespace handoff {

using core_allocator = posix_allocator;

/**
 * @brief Process-wide allocator used by every factory and conversion that is
 * not handed one explicitly.
 */
[[nodiscard]] inline core_allocator &get_default_allocator() noexcept {
  static core_allocator instance;
  return instance;
}

} // namespace handoff
