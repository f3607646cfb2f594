#include "support/drop_check.hpp"
#include "support/tracking_allocator.hpp"

#include <atomic>
#include <cstdint>
#include <gtest/gtest.h>
#include <handoff/deref_take.hpp>
#include <handoff/shared_ptr.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

using handoff_test::drop_counter;
using handoff_test::drop_token;

struct TrackedNode {
  static std::atomic<int> instances;
  int id;

  static handoff::result<TrackedNode> try_create(int id) {
    return TrackedNode(id);
  }

  explicit TrackedNode(int id) : id(id) { instances.fetch_add(1); }
  ~TrackedNode() { instances.fetch_sub(1); }
  TrackedNode(TrackedNode &&other) noexcept : id(other.id) {
    instances.fetch_add(1);
  }
  TrackedNode(const TrackedNode &) = delete;
  TrackedNode &operator=(const TrackedNode &) = delete;
};

std::atomic<int> TrackedNode::instances{0};

struct FlakyClone {
  int value;
  bool fail_on_clone = false;

  [[nodiscard]] handoff::result<FlakyClone> try_clone() const noexcept {
    if (fail_on_clone)
      return handoff::unexpected(handoff::error::allocation_failed);
    return FlakyClone{value, false};
  }
};

static_assert(!handoff::clonable<TrackedNode>);
static_assert(handoff::clonable<FlakyClone>);
static_assert(handoff::deref_takeable<handoff::shared_ptr<drop_token>>);

class SmartPointerTest : public ::testing::Test {
protected:
  handoff_test::tracking_allocator alloc;
  drop_counter counter;

  void SetUp() override { TrackedNode::instances = 0; }
};

TEST_F(SmartPointerTest, AllocationLifecycle) {
  {
    auto res = handoff::try_allocate_shared<TrackedNode>(alloc, 42);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(TrackedNode::instances, 1);
    EXPECT_EQ((*res)->id, 42);
    EXPECT_EQ(res->use_count(), 1);
  }
  // Object should be destroyed and memory reclaimed here
  EXPECT_EQ(TrackedNode::instances, 0);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SmartPointerTest, CombinedAllocationLifecycle) {
  {
    auto res = handoff::try_allocate_combined_shared<TrackedNode>(alloc, 42);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(TrackedNode::instances, 1);
    EXPECT_EQ((*res)->id, 42);
    EXPECT_EQ(res->use_count(), 1);
    EXPECT_EQ(alloc.live.size(), 1u);
  }
  EXPECT_EQ(TrackedNode::instances, 0);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SmartPointerTest, CopyAndMoveSemantics) {
  auto res = handoff::try_allocate_shared<TrackedNode>(alloc, 1);
  auto ptr1 = std::move(*res);

  {
    handoff::shared_ptr<TrackedNode> ptr2 = ptr1; // Copy
    EXPECT_EQ(ptr1.use_count(), 2);
    EXPECT_EQ(ptr2.use_count(), 2);
    EXPECT_FALSE(ptr1.unique());

    handoff::shared_ptr<TrackedNode> ptr3 = std::move(ptr2); // Move
    EXPECT_EQ(ptr1.use_count(), 2);
    EXPECT_EQ(ptr3.use_count(), 2);
    EXPECT_EQ(ptr2.get(), nullptr);
    EXPECT_TRUE(ptr3 == ptr1);
  }
  EXPECT_EQ(ptr1.use_count(), 1);
  EXPECT_TRUE(ptr1.unique());
}

TEST_F(SmartPointerTest, WeakPtrLocking) {
  handoff::weak_ptr<TrackedNode> w;
  {
    auto s = handoff::try_allocate_shared<TrackedNode>(alloc, 100).value();
    w = s;
    EXPECT_FALSE(w.expired());

    auto locked = w.lock();
    ASSERT_TRUE(locked.has_value());
    EXPECT_EQ((*locked)->id, 100);
    EXPECT_EQ(locked->use_count(), 2);
  }
  // Shared count is 0, but weak count is 1.
  // Control block should still exist, but object is destroyed.
  EXPECT_TRUE(w.expired());
  EXPECT_EQ(TrackedNode::instances, 0);

  auto locked_fail = w.lock();
  ASSERT_FALSE(locked_fail.has_value());
  EXPECT_EQ(locked_fail.error(), handoff::error::pointer_expired);
}

TEST_F(SmartPointerTest, CombinedWeakPtrLocking) {
  handoff::weak_ptr<TrackedNode> w;
  {
    auto s =
        handoff::try_allocate_combined_shared<TrackedNode>(alloc, 100).value();
    w = s;
    EXPECT_FALSE(w.expired());

    auto locked = w.lock();
    ASSERT_TRUE(locked.has_value());
    EXPECT_EQ((*locked)->id, 100);
    EXPECT_EQ(locked->use_count(), 2);
  }
  EXPECT_TRUE(w.expired());
  EXPECT_EQ(TrackedNode::instances, 0);

  auto locked_fail = w.lock();
  EXPECT_FALSE(locked_fail.has_value());
}

TEST_F(SmartPointerTest, EmptyWeakPtrLock) {
  handoff::weak_ptr<TrackedNode> w;
  auto res = w.lock();
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), handoff::error::empty_pointer);
}

TEST_F(SmartPointerTest, SeparateAllocationFailsCleanly) {
  alloc.fail_on = 2;

  // Attempt separate allocation
  auto res = handoff::try_allocate_shared<TrackedNode>(alloc, 1);
  ASSERT_FALSE(res.has_value());
  // Instances should be 0 because the object was destroyed
  // when the control block allocation failed.
  EXPECT_EQ(TrackedNode::instances, 0);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SmartPointerTest, DefaultAllocatorCombinedIntegration) {
  auto res = handoff::try_make_combined_shared<TrackedNode>(99);

  ASSERT_TRUE(res.has_value());
  EXPECT_EQ((*res)->id, 99);
  EXPECT_EQ(TrackedNode::instances, 1);

  res->reset();
  EXPECT_EQ(TrackedNode::instances, 0);
}

TEST_F(SmartPointerTest, DefaultAllocatorIntegration) {
  auto res = handoff::try_make_shared<TrackedNode>(99);

  ASSERT_TRUE(res.has_value());
  EXPECT_EQ((*res)->id, 99);
  EXPECT_EQ(TrackedNode::instances, 1);

  res->reset();
  EXPECT_EQ(TrackedNode::instances, 0);
}

TEST_F(SmartPointerTest, CombinedRespectsStrictAlignment) {
  struct alignas(64) AlignedType {
    float data[16];
    static handoff::result<AlignedType> try_create() { return AlignedType{}; }
  };

  auto res = handoff::try_allocate_combined_shared<AlignedType>(alloc);

  ASSERT_TRUE(res.has_value());
  uintptr_t addr = reinterpret_cast<uintptr_t>(res->get());
  EXPECT_EQ(addr % 64, 0) << "Object in combined block not aligned to 64 bytes";
}

TEST_F(SmartPointerTest, ThreadSafeReferenceCounting) {
  auto res = handoff::try_make_combined_shared<TrackedNode>(1);
  auto main_ptr = std::move(*res);

  const int kThreadCount = 8;
  const int kCopiesPerThread = 1000;
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreadCount; ++i) {
    threads.emplace_back([main_ptr, kCopiesPerThread]() {
      for (int j = 0; j < kCopiesPerThread; ++j) {
        handoff::shared_ptr<TrackedNode> local_copy = main_ptr;
        (void)local_copy;
      }
    });
  }

  for (auto &t : threads)
    t.join();

  EXPECT_EQ(main_ptr.use_count(), 1);
  EXPECT_EQ(TrackedNode::instances, 1);
}

class SharedTakeTest : public SmartPointerTest {};

TEST_F(SharedTakeTest, SoleOwnerTakesWithoutClone) {
  {
    auto owner = handoff::try_allocate_shared<drop_token>(alloc, counter, 4)
                     .value();
    handoff::weak_ptr<drop_token> observer = owner;

    auto res = handoff::deref_take(std::move(owner));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->id(), 4);
    EXPECT_EQ(owner.get(), nullptr);
    EXPECT_EQ(counter.clones, 0);
    EXPECT_EQ(counter.drops, 0);

    EXPECT_TRUE(observer.expired());
    auto relock = observer.lock();
    ASSERT_FALSE(relock.has_value());
    EXPECT_EQ(relock.error(), handoff::error::pointer_expired);
  }
  EXPECT_EQ(counter.drops, 1);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SharedTakeTest, SoleOwnerOfCombinedBlock) {
  {
    auto owner =
        handoff::try_allocate_combined_shared<drop_token>(alloc, counter, 8)
            .value();
    auto res = handoff::deref_take(std::move(owner));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->id(), 8);
    EXPECT_EQ(counter.clones, 0);
    EXPECT_TRUE(alloc.balanced());
  }
  EXPECT_EQ(counter.drops, 1);
}

TEST_F(SharedTakeTest, SharedOwnerTakesClone) {
  auto owner_a =
      handoff::try_allocate_shared<drop_token>(alloc, counter, 11).value();
  auto owner_b = owner_a;
  ASSERT_EQ(owner_b.use_count(), 2);

  {
    auto res = handoff::deref_take(std::move(owner_a));
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->id(), 11);
    EXPECT_EQ(counter.clones, 1);
    EXPECT_EQ(counter.drops, 0);

    // The sibling still sees the original, alone.
    EXPECT_EQ(owner_b.use_count(), 1);
    EXPECT_TRUE(owner_b->live());
    EXPECT_EQ(owner_b->id(), 11);

    owner_b.reset();
    EXPECT_EQ(counter.drops, 1);
  }
  EXPECT_EQ(counter.drops, 2);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SharedTakeTest, TakeWithMutatesOnlyTheClone) {
  auto owner_a = handoff::try_make_shared<FlakyClone>(FlakyClone{5}).value();
  auto owner_b = owner_a;

  auto res = handoff::deref_take_with(
      std::move(owner_a), [](handoff::suppressed_ref<FlakyClone> &view) {
        view->value = 50;
        return view.take().value;
      });
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(*res, 50);
  EXPECT_EQ(owner_b->value, 5);
}

TEST_F(SharedTakeTest, FailedCloneKeepsOtherOwnersIntact) {
  auto owner_a =
      handoff::try_allocate_shared<FlakyClone>(alloc, FlakyClone{1, true})
          .value();
  auto owner_b = owner_a;

  auto res = handoff::deref_take(std::move(owner_a));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), handoff::error::allocation_failed);
  EXPECT_EQ(owner_a.get(), nullptr);
  EXPECT_EQ(owner_b.use_count(), 1);
  EXPECT_EQ(owner_b->value, 1);

  owner_b.reset();
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SharedTakeTest, VoidExtractionStep) {
  auto owner = handoff::try_allocate_shared<drop_token>(alloc, counter).value();
  auto res = handoff::deref_take_with(
      std::move(owner),
      [](handoff::suppressed_ref<drop_token> &view) { view.drop_in_place(); });
  EXPECT_TRUE(res.has_value());
  EXPECT_EQ(counter.drops, 1);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SharedTakeTest, ThrowingStepOnSoleOwnerReleasesBlock) {
  {
    auto owner =
        handoff::try_allocate_shared<drop_token>(alloc, counter, 3).value();
    handoff::weak_ptr<drop_token> observer = owner;

    EXPECT_THROW((void)handoff::deref_take_with(
                     std::move(owner),
                     [](handoff::suppressed_ref<drop_token> &) -> int {
                       throw std::runtime_error("extraction failed");
                     }),
                 std::runtime_error);
    EXPECT_EQ(owner.get(), nullptr);
    EXPECT_TRUE(observer.expired());
  }
  EXPECT_EQ(counter.drops, 0);
  EXPECT_EQ(counter.clones, 0);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SharedTakeTest, ThrowingStepOnCloneLeavesSiblingIntact) {
  auto owner_a =
      handoff::try_allocate_shared<drop_token>(alloc, counter, 12).value();
  auto owner_b = owner_a;

  EXPECT_THROW((void)handoff::deref_take_with(
                   std::move(owner_a),
                   [](handoff::suppressed_ref<drop_token> &) -> int {
                     throw std::runtime_error("extraction failed");
                   }),
               std::runtime_error);

  EXPECT_EQ(counter.clones, 1);
  EXPECT_EQ(counter.drops, 0);
  EXPECT_EQ(owner_b.use_count(), 1);
  EXPECT_TRUE(owner_b->live());
  EXPECT_EQ(owner_b->id(), 12);

  owner_b.reset();
  EXPECT_EQ(counter.drops, 1);
  EXPECT_TRUE(alloc.balanced());
}

TEST_F(SharedTakeTest, EmptyPointerReportsError) {
  handoff::shared_ptr<drop_token> empty;
  auto res = handoff::try_deref_take(std::move(empty));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), handoff::error::empty_pointer);
}

TEST_F(SharedTakeTest, ConcurrentTakesDropEveryTokenOnce) {
  for (int trial = 0; trial < 100; ++trial) {
    drop_counter local;
    {
      auto first = handoff::try_make_shared<drop_token>(local, trial).value();
      auto second = first;
      std::atomic start{false};
      int first_id = -1;
      int second_id = -1;

      std::thread t1([&]() {
        while (!start)
          std::this_thread::yield();
        auto res = handoff::deref_take(std::move(first));
        if (res)
          first_id = res->id();
      });

      std::thread t2([&]() {
        while (!start)
          std::this_thread::yield();
        auto res = handoff::deref_take(std::move(second));
        if (res)
          second_id = res->id();
      });

      start = true;
      t1.join();
      t2.join();

      EXPECT_EQ(first_id, trial);
      EXPECT_EQ(second_id, trial);
    }
    // Each take produced one token; the original was either handed over or
    // destroyed by the last owner.
    EXPECT_EQ(local.drops, local.clones + 1);
    EXPECT_LE(local.clones, 2);
  }
}
