#pragma once
#include <handoff/allocator.hpp>
#include <handoff/assert.hpp>
#include <handoff/concepts.hpp>
#include <handoff/core.hpp>
#include <handoff/manually_drop.hpp>
#include <handoff/relocate.hpp>
#include <handoff/vector.hpp>

namespace handoff {

/**
 * @brief Customization point turning a suppressed payload into an
 * independently owned value by moving, not copying, its contents.
 *
 * A specialization provides:
 * - `template <typename Alloc> using owned_for`: the owned type produced when
 *   storage comes from `Alloc`;
 * - `static result<owned_for<Alloc>> convert(suppressed_ref<T> &, Alloc &)`.
 *
 * After a successful convert() the view is marked taken and its memory holds
 * no live object; the caller still owns (and must release) that memory.
 * Converting the same view twice is a contract violation.
 */
template <typename T> struct owned_conversion {
  template <typename Alloc> using owned_for = T;

  // Sized payloads are relocated out; no allocation is involved.
  template <typename Alloc>
    requires nothrow_relocatable<T>
  static result<T> convert(suppressed_ref<T> &src, Alloc &) noexcept {
    return src.take();
  }
};

template <typename T> struct owned_conversion<T[]> {
  template <typename Alloc> using owned_for = vector<T, Alloc>;

  /**
   * @brief Moves a run into a freshly allocated vector of the same length.
   * On allocation failure the elements are destroyed in place so the run is
   * neither leaked nor left for a second destruction.
   */
  template <typename Alloc>
    requires nothrow_relocatable<T>
  static result<vector<T, Alloc>> convert(suppressed_ref<T[]> &src,
                                          Alloc &alloc) noexcept {
    HANDOFF_ASSERT(!src.taken(), "run was already converted");

    vector<T, Alloc> out(alloc);
    const std::size_t count = src.size();
    if (count > 0) {
      auto res = out.try_reserve(count);
      if (!res) {
        src.drop_in_place();
        return unexpected(res.error());
      }
      relocate_n(src.unsafe_data(), count, out.data());
      out.unsafe_set_size(count);
    }
    src.unsafe_mark_taken();
    return out;
  }
};

template <typename T, typename Alloc = core_allocator>
using owned_t = typename owned_conversion<T>::template owned_for<Alloc>;

template <typename T, typename Alloc = core_allocator>
concept convertible_to_owned =
    requires(suppressed_ref<T> &src, Alloc &alloc) {
      {
        owned_conversion<T>::convert(src, alloc)
      } -> std::same_as<result<owned_t<T, Alloc>>>;
    };

template <typename T, typename Alloc>
  requires convertible_to_owned<T, Alloc>
[[nodiscard]] result<owned_t<T, Alloc>>
convert_to_owned(suppressed_ref<T> &src, Alloc &alloc) noexcept {
  return owned_conversion<T>::convert(src, alloc);
}

template <typename T>
  requires convertible_to_owned<T>
[[nodiscard]] result<owned_t<T>>
convert_to_owned(suppressed_ref<T> &src) noexcept {
  return owned_conversion<T>::convert(src, get_default_allocator());
}

} // namespace handoff
