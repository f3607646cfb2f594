#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <handoff/allocator.hpp>
#include <handoff/assert.hpp>
#include <handoff/concepts.hpp>
#include <handoff/construction_helpers.hpp>
#include <handoff/core.hpp>
#include <handoff/manually_drop.hpp>
#include <type_traits>
#include <utility>

namespace handoff {

namespace detail {

struct sp_control_block {
  std::atomic<std::size_t> shared_count_{1};
  std::atomic<std::size_t> weak_count_{1};
  void *ptr_;

  explicit sp_control_block(void *p) : ptr_(p) {}

  virtual ~sp_control_block() = default;

  // Destroys the payload and releases its storage.
  virtual void delete_ptr() noexcept = 0;

  // Releases the payload's storage without destroying the payload.
  virtual void release_storage() noexcept = 0;

  virtual void delete_control_block() noexcept = 0;

  void release_shared() noexcept {
    if (shared_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete_ptr();
      release_weak();
    }
  }

  void release_weak() noexcept {
    if (weak_count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete_control_block();
    }
  }

  /**
   * @brief Moves the strong count from 1 to 0 without destroying the
   * payload. On success the caller is the payload's only owner and must
   * finish with release_claimed().
   */
  [[nodiscard]] bool try_claim() noexcept {
    std::size_t expected_count = 1;
    return shared_count_.compare_exchange_strong(expected_count, 0,
                                                 std::memory_order_acq_rel,
                                                 std::memory_order_relaxed);
  }

  void release_claimed() noexcept {
    release_storage();
    release_weak();
  }
};

template <typename T, typename Alloc>
struct sp_control_block_no_dp : sp_control_block {
  Alloc *alloc_;

  sp_control_block_no_dp(T *p, Alloc *a) : sp_control_block(p), alloc_(a) {}

  void delete_ptr() noexcept override {
    std::destroy_at(static_cast<T *>(this->ptr_));
    release_storage();
  }

  void release_storage() noexcept override {
    alloc_->deallocate(this->ptr_, sizeof(T));
  }

  void delete_control_block() noexcept override {
    Alloc *a = alloc_;
    this->~sp_control_block_no_dp();
    a->deallocate(this, sizeof(sp_control_block_no_dp));
  }
};

template <typename T, typename Alloc>
struct sp_combined_block : sp_control_block {
  Alloc *alloc_;
  alignas(T) std::byte storage_[sizeof(T)];

  // ReSharper disable once CppUninitializedDependentBaseClass
  explicit sp_combined_block(Alloc *a) : sp_control_block(nullptr), alloc_(a) {
    this->ptr_ = storage_;
  }

  void delete_ptr() noexcept override {
    std::destroy_at(static_cast<T *>(this->ptr_));
  }

  // The payload shares the control block's allocation.
  void release_storage() noexcept override {}

  void delete_control_block() noexcept override {
    Alloc *a = this->alloc_;
    this->~sp_combined_block();
    a->deallocate(this, sizeof(sp_combined_block));
  }
};

} // namespace detail

template <typename T> class weak_ptr;

/**
 * @brief Reference-counted shared box.
 * The strong and weak counts are atomic; everything else about an instance is
 * owned by the thread holding it.
 */
template <typename T> class shared_ptr {
  detail::sp_control_block *block_ = nullptr;
  T *ptr_ = nullptr;

  explicit shared_ptr(detail::sp_control_block *cb, T *p) noexcept
      : block_(cb), ptr_(p) {}

  template <typename U> friend class weak_ptr;
  template <typename U> friend class shared_ptr;

public:
  using element_type = T;

  shared_ptr() noexcept = default;

  ~shared_ptr() {
    if (block_)
      block_->release_shared();
  }

  shared_ptr(const shared_ptr &other) noexcept
      : block_(other.block_), ptr_(other.ptr_) {
    if (block_)
      block_->shared_count_.fetch_add(1, std::memory_order_relaxed);
  }

  shared_ptr(shared_ptr &&other) noexcept
      : block_(std::exchange(other.block_, nullptr)),
        ptr_(std::exchange(other.ptr_, nullptr)) {}

  shared_ptr &operator=(const shared_ptr &other) noexcept {
    if (this != &other) {
      shared_ptr(other).swap(*this);
    }
    return *this;
  }

  shared_ptr &operator=(shared_ptr &&other) noexcept {
    if (this != &other) {
      shared_ptr(std::move(other)).swap(*this);
    }
    return *this;
  }

  void swap(shared_ptr &other) noexcept {
    std::swap(block_, other.block_);
    std::swap(ptr_, other.ptr_);
  }

  T *operator->() const noexcept { return ptr_; }
  T &operator*() const noexcept { return *ptr_; }
  T *get() const noexcept { return ptr_; }
  explicit operator bool() const noexcept { return ptr_ != nullptr; }

  std::size_t use_count() const noexcept {
    return block_ ? block_->shared_count_.load(std::memory_order_relaxed) : 0;
  }

  // Point-in-time answer; another thread holding a copy may change it.
  [[nodiscard]] bool unique() const noexcept { return use_count() == 1; }

  void reset() noexcept {
    if (block_) {
      block_->release_shared();
      block_ = nullptr;
      ptr_ = nullptr;
    }
  }

  /**
   * @brief Consumes this owner and hands the payload to @p f.
   *
   * When this is the only strong owner the payload itself is handed over;
   * afterwards its storage and the control block are released without
   * running the payload destructor, and weak observers see the pointer
   * expire. When other owners exist the payload is cloned into local storage
   * first, this owner's reference is dropped, and @p f receives the clone, so
   * the remaining owners never observe the take.
   *
   * @return The result of @p f, or the clone's error.
   */
  template <typename F>
    requires clonable<T>
  auto take_with(F &&f) && {
    using R = std::invoke_result_t<F, suppressed_ref<T> &>;
    HANDOFF_ASSERT(block_ != nullptr, "take from an empty shared_ptr");

    shared_ptr owner(std::move(*this));

    if (owner.block_->try_claim()) {
      struct claim_release {
        detail::sp_control_block *block;
        ~claim_release() { block->release_claimed(); }
      } guard{std::exchange(owner.block_, nullptr)};

      suppressed_ref<T> view(std::exchange(owner.ptr_, nullptr));
      return detail::invoke_into_result<R>(std::forward<F>(f), view);
    }

    alignas(T) std::byte storage[sizeof(T)];
    T *copy = reinterpret_cast<T *>(storage);
    auto cloned = construction_helpers::try_clone_at(get_default_allocator(),
                                                     copy, *owner.ptr_);
    if (!cloned)
      return result<R>(unexpected(cloned.error()));
    owner.reset();

    suppressed_ref<T> view(std::launder(copy));
    return detail::invoke_into_result<R>(std::forward<F>(f), view);
  }

  template <typename Tp, typename Alloc, typename... Args>
  friend result<shared_ptr<Tp>> try_allocate_shared(Alloc &alloc,
                                                    Args &&...args) noexcept;

  template <typename Tp, typename Alloc, typename... Args>
  friend result<shared_ptr<Tp>>
  try_allocate_combined_shared(Alloc &alloc, Args &&...args) noexcept;
};

template <typename T>
bool operator==(const shared_ptr<T> &lhs, std::nullptr_t) noexcept {
  return lhs.get() == nullptr;
}

template <typename T, typename U>
bool operator==(const shared_ptr<T> &lhs, const shared_ptr<U> &rhs) noexcept {
  return lhs.get() == rhs.get();
}

template <typename T> class weak_ptr {
  detail::sp_control_block *block_ = nullptr;
  T *ptr_ = nullptr;

public:
  constexpr weak_ptr() noexcept = default;

  weak_ptr(const shared_ptr<T> &other) noexcept
      : block_(other.block_), ptr_(other.ptr_) {
    if (block_)
      block_->weak_count_.fetch_add(1, std::memory_order_relaxed);
  }

  ~weak_ptr() {
    if (block_)
      block_->release_weak();
  }

  weak_ptr(const weak_ptr &other) noexcept
      : block_(other.block_), ptr_(other.ptr_) {
    if (block_)
      block_->weak_count_.fetch_add(1, std::memory_order_relaxed);
  }

  weak_ptr(weak_ptr &&other) noexcept
      : block_(std::exchange(other.block_, nullptr)),
        ptr_(std::exchange(other.ptr_, nullptr)) {}

  weak_ptr &operator=(const weak_ptr &other) noexcept {
    if (this != &other) {
      weak_ptr(other).swap(*this);
    }
    return *this;
  }

  weak_ptr &operator=(weak_ptr &&other) noexcept {
    if (this != &other) {
      weak_ptr(std::move(other)).swap(*this);
    }
    return *this;
  }

  void swap(weak_ptr &other) noexcept {
    std::swap(block_, other.block_);
    std::swap(ptr_, other.ptr_);
  }

  [[nodiscard]] bool expired() const noexcept {
    return !block_ ||
           block_->shared_count_.load(std::memory_order_relaxed) == 0;
  }

  [[nodiscard]] result<shared_ptr<T>> lock() const noexcept {
    if (!block_)
      return unexpected(error::empty_pointer);

    auto count = block_->shared_count_.load(std::memory_order_relaxed);
    while (count != 0) {
      if (block_->shared_count_.compare_exchange_weak(
              count, count + 1, std::memory_order_acq_rel,
              std::memory_order_relaxed)) {
        return shared_ptr<T>(block_, ptr_);
      }
    }
    return unexpected(error::pointer_expired);
  }
};

template <typename T, typename Alloc, typename... Args>
[[nodiscard]] result<shared_ptr<T>>
try_allocate_shared(Alloc &alloc, Args &&...args) noexcept {
  auto block_t = alloc.allocate(sizeof(T), alignof(T));
  if (!block_t)
    return unexpected(block_t.error());

  T *raw_ptr = static_cast<T *>(block_t->ptr);
  auto built = construction_helpers::try_construct(raw_ptr,
                                                   std::forward<Args>(args)...);
  if (!built) {
    alloc.deallocate(block_t->ptr, sizeof(T));
    return unexpected(built.error());
  }

  using block_type = detail::sp_control_block_no_dp<T, Alloc>;
  auto block_cb = alloc.allocate(sizeof(block_type), alignof(block_type));
  if (!block_cb) {
    std::destroy_at(raw_ptr);
    alloc.deallocate(block_t->ptr, sizeof(T));
    return unexpected(block_cb.error());
  }

  auto *cb = new (block_cb->ptr) block_type(raw_ptr, &alloc);
  return shared_ptr<T>(cb, raw_ptr);
}

template <typename T, typename Alloc, typename... Args>
[[nodiscard]] result<shared_ptr<T>>
try_allocate_combined_shared(Alloc &alloc, Args &&...args) noexcept {
  using combined_type = detail::sp_combined_block<T, Alloc>;

  auto block_t = alloc.allocate(sizeof(combined_type), alignof(combined_type));
  if (!block_t)
    return unexpected(block_t.error());

  auto *combined = new (block_t->ptr) combined_type(&alloc);
  T *raw_ptr = static_cast<T *>(combined->ptr_);

  auto built = construction_helpers::try_construct(raw_ptr,
                                                   std::forward<Args>(args)...);
  if (!built) {
    combined->~combined_type();
    alloc.deallocate(block_t->ptr, sizeof(combined_type));
    return unexpected(built.error());
  }

  return shared_ptr<T>(combined, std::launder(raw_ptr));
}

template <typename T, typename... Args>
[[nodiscard]] result<shared_ptr<T>>
try_make_combined_shared(Args &&...args) noexcept {
  return try_allocate_combined_shared<T>(get_default_allocator(),
                                         std::forward<Args>(args)...);
}

template <typename T, typename... Args>
[[nodiscard]] result<shared_ptr<T>> try_make_shared(Args &&...args) noexcept {
  return try_allocate_shared<T>(get_default_allocator(),
                                std::forward<Args>(args)...);
}

} // namespace handoff
