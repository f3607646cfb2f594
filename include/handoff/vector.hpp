#pragma once
#include <functional>
#include <handoff/allocator.hpp>
#include <handoff/assert.hpp>
#include <handoff/concepts.hpp>
#include <handoff/construction_helpers.hpp>
#include <handoff/manually_drop.hpp>
#include <handoff/relocate.hpp>
#include <iterator>
#include <utility>

namespace handoff {

template <typename T, typename Alloc = core_allocator> class vector {
  Alloc *alloc_;
  T *data_ = nullptr;
  std::size_t size_ = 0;
  std::size_t cap_ = 0;

  void release_buffer() noexcept {
    clear();
    if (data_)
      alloc_->deallocate(data_, cap_ * sizeof(T));
    data_ = nullptr;
    cap_ = 0;
  }

public:
  using value_type = T;
  using allocator_type = Alloc;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using reference = T &;
  using const_reference = const T &;
  using pointer = T *;
  using const_pointer = const T *;
  using iterator = T *;
  using const_iterator = const T *;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  vector() noexcept : alloc_(&get_default_allocator()) {}
  explicit vector(Alloc &a) noexcept : alloc_(&a) {}

  // Move-only
  vector(const vector &) = delete;
  vector &operator=(const vector &) = delete;

  vector(vector &&other) noexcept
      : alloc_(other.alloc_), data_(std::exchange(other.data_, nullptr)),
        size_(std::exchange(other.size_, 0)),
        cap_(std::exchange(other.cap_, 0)) {}

  vector &operator=(vector &&other) noexcept {
    if (this != &other) {
      release_buffer();
      alloc_ = other.alloc_;
      data_ = std::exchange(other.data_, nullptr);
      size_ = std::exchange(other.size_, 0);
      cap_ = std::exchange(other.cap_, 0);
    }
    return *this;
  }

  ~vector() { release_buffer(); }

  static result<vector> try_create(std::size_t initial_cap = 0) noexcept {
    vector v;
    if (initial_cap > 0) {
      auto res = v.try_reserve(initial_cap);
      if (!res)
        return unexpected(res.error());
    }
    return v;
  }

  iterator begin() noexcept { return data_; }
  iterator end() noexcept { return data_ + size_; }
  const_iterator begin() const noexcept { return data_; }
  const_iterator end() const noexcept { return data_ + size_; }
  reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
  reverse_iterator rend() noexcept { return reverse_iterator(begin()); }
  const_reverse_iterator rbegin() const noexcept {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const noexcept {
    return const_reverse_iterator(begin());
  }

  size_type size() const noexcept { return size_; }
  size_type capacity() const noexcept { return cap_; }
  bool empty() const noexcept { return size_ == 0; }
  pointer data() noexcept { return data_; }
  const_pointer data() const noexcept { return data_; }
  Alloc &get_allocator() const noexcept { return *alloc_; }

  reference operator[](size_type pos) noexcept {
    HANDOFF_DEBUG_ASSERT(pos < size_, "vector index out of bounds");
    return data_[pos];
  }
  const_reference operator[](size_type pos) const noexcept {
    HANDOFF_DEBUG_ASSERT(pos < size_, "vector index out of bounds");
    return data_[pos];
  }

  /**
   * @brief Overrides the element count without constructing or destroying.
   * Elements in [size(), n) must already be live, and elements in
   * [n, size()) become the caller's responsibility.
   */
  void unsafe_set_size(size_type n) noexcept {
    HANDOFF_ASSERT(n <= cap_, "vector size beyond capacity");
    size_ = n;
  }

  [[nodiscard]] result<void> try_reserve(size_type new_cap) noexcept {
    if (new_cap <= cap_)
      return {};

    std::size_t new_bytes = 0;
    if (detail::check_mul(new_cap, sizeof(T), &new_bytes))
      return unexpected(error::integer_overflow);

    if (data_) {
      if (auto res = alloc_->expand_in_place(data_, cap_ * sizeof(T),
                                             new_bytes);
          res) {
        cap_ = new_cap;
        return {};
      }
    }

    if constexpr (is_relocatable_v<T>) {
      auto res =
          alloc_->reallocate(data_, cap_ * sizeof(T), new_bytes, alignof(T));
      if (!res)
        return unexpected(error::allocation_failed);
      data_ = static_cast<T *>(res->ptr);
      cap_ = new_cap;
    } else {
      auto res = alloc_->allocate(new_bytes, alignof(T));
      if (!res)
        return unexpected(error::allocation_failed);

      T *new_ptr = static_cast<T *>(res->ptr);
      relocate_n(data_, size_, new_ptr);
      if (data_)
        alloc_->deallocate(data_, cap_ * sizeof(T));
      data_ = new_ptr;
      cap_ = new_cap;
    }
    return {};
  }

  template <typename... Args>
  [[nodiscard]] result<T *> try_emplace_back(Args &&...args) noexcept {
    if (size_ == cap_) {
      auto res = try_reserve(cap_ == 0 ? 8 : cap_ * 2);
      if (!res)
        return unexpected(res.error());
    }

    T *ptr = data_ + size_;

    if constexpr (has_try_create<T, Args...>) {
      auto res = T::try_create(std::forward<Args>(args)...);
      if (!res)
        return unexpected(res.error());
      new (ptr) T(std::move(*res));
    } else {
      new (ptr) T(std::forward<Args>(args)...);
    }

    size_++;
    return ptr;
  }

  [[nodiscard]] result<T *> try_push_back(T &&val) noexcept {
    if (size_ == cap_) {
      auto res = try_reserve(cap_ == 0 ? 8 : cap_ * 2);
      if (!res)
        return unexpected(res.error());
    }

    T *ptr = new (data_ + size_) T(std::move(val));
    size_++;
    return ptr;
  }

  [[nodiscard]] result<void> try_pop_back() noexcept {
    if (size_ == 0)
      return unexpected(error::out_of_range);
    std::destroy_at(data_ + --size_);
    return {};
  }

  void clear() noexcept {
    destroy_n_reverse(data_, size_);
    size_ = 0;
  }

  [[nodiscard]] result<vector> try_clone() const noexcept {
    vector clone(*alloc_);
    auto res = clone.try_reserve(size_);
    if (!res)
      return unexpected(res.error());

    for (size_type i = 0; i < size_; ++i) {
      if constexpr (has_try_clone<T> || has_try_clone_at<T>) {
        auto cloned = construction_helpers::try_clone_at(
            *alloc_, clone.data_ + i, data_[i]);
        if (!cloned)
          return unexpected(cloned.error());
      } else {
        new (clone.data_ + i) T(data_[i]);
      }
      clone.size_++;
    }
    return clone;
  }

  [[nodiscard]] result<T *> try_at(const size_type index) noexcept {
    if (index >= size_)
      return unexpected(error::out_of_range);
    return &data_[index];
  }

  /**
   * @brief Consumes the vector and hands its elements to @p f as a
   * suppressed run.
   *
   * The length is zeroed before @p f runs, so if @p f unwinds the buffer is
   * freed with no element destroyed. The buffer is always returned to the
   * allocator once @p f is done; the elements are whatever @p f left behind.
   */
  template <typename F> decltype(auto) take_with(F &&f) && {
    const size_type len = size_;
    size_ = 0;
    vector shell(std::move(*this));
    suppressed_ref<T[]> view(shell.data_, len);
    return std::invoke(std::forward<F>(f), view);
  }
};

template <typename T, typename A>
struct is_relocatable<vector<T, A>> : std::true_type {};

} // namespace handoff
