#pragma once
#include <cstdlib>
#include <cstring>
#include <handoff/core.hpp>
#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace handoff {

class posix_allocator final : public fallible_allocator {
public:
  result<mem_block> allocate(std::size_t bytes,
                             std::size_t alignment) noexcept override {
    // posix_memalign wants a power of two that is a multiple of sizeof(void*)
    if (alignment < sizeof(void *))
      alignment = sizeof(void *);

    void *ptr = nullptr;
    if (::posix_memalign(&ptr, alignment, bytes == 0 ? 1 : bytes) != 0) {
      return unexpected(error::allocation_failed);
    }
    return mem_block{ptr, bytes};
  }

  result<std::size_t> expand_in_place(void *ptr, std::size_t old_size,
                                      std::size_t new_size) noexcept override {
    if (!ptr || new_size < old_size)
      return unexpected(error::invalid_argument);
#if defined(__GLIBC__)
    // The heap rounds blocks up; growth inside the slack needs no move.
    if (::malloc_usable_size(ptr) >= new_size)
      return new_size;
    return unexpected(error::in_place_growth_failed);
#else
    return unexpected(error::unsupported_operation);
#endif
  }

  result<mem_block> reallocate(void *ptr, std::size_t old_size,
                               std::size_t new_size,
                               std::size_t alignment) noexcept override {
    if (!ptr)
      return allocate(new_size, alignment);
    if (new_size <= old_size)
      return mem_block{ptr, old_size};

    if (auto res = expand_in_place(ptr, old_size, new_size); res) {
      return mem_block{ptr, *res};
    }

    if (alignment <= alignof(std::max_align_t)) {
      void *new_ptr = ::realloc(ptr, new_size);
      if (!new_ptr)
        return unexpected(error::allocation_failed);
      return mem_block{new_ptr, new_size};
    }

    // realloc only promises fundamental alignment.
    auto new_block = allocate(new_size, alignment);
    if (!new_block)
      return unexpected(new_block.error());

    std::memcpy(new_block->ptr, ptr, old_size);
    ::free(ptr);
    return *new_block;
  }

  void deallocate(void *ptr, std::size_t) noexcept override { ::free(ptr); }
};

} // namespace handoff
