#pragma once

/**
 * @def HANDOFF_BLOCK_RVALUE_ACCESS
 * @brief Deletes the rvalue overloads of an owning handle's accessors.
 * @details Without it, this compiles and dangles:
 * @code
 * auto &ref = (*helper.allocate_array<int>(5, 0))[0]; // box is a temporary
 * @endcode
 * Rvalue handles should be consumed (moved into a take operation), not
 * peeked at.
 * @param Type The element type.
 */
#define HANDOFF_BLOCK_RVALUE_ACCESS(Type)                                      \
  /** @name Rvalue Safety Guards */                                            \
  /** @{ */                                                                    \
  Type &operator[](std::size_t) const && = delete;                             \
  auto at(std::size_t) const && = delete;                                      \
  auto unsafe_at(std::size_t) const && = delete;                               \
  auto begin() const && = delete;                                              \
  auto end() const && = delete;                                                \
  auto unsafe_get() const && = delete;                                         \
  /** @} */
