// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for riskledger::ThreadSafeQueue<T>, the buffer between the
// EventBus bridge and the IPC telemetry thread.
//
// Validates:
//   - FIFO ordering through try_pop()
//   - try_pop() on an empty queue
//   - A consumer polling with try_pop() sees a push from another thread
//   - No lost or duplicated items under concurrent producers and consumers
// =============================================================================

#include "riskledger/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <set>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  riskledger::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Items come back in push order.
// Why: telemetry must reach subscribers in the order the controller emitted it.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    auto v = queue.try_pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() on an empty queue returns immediately with nothing.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. A polling consumer picks up a value pushed from another thread.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PollingConsumerSeesPush) {
  std::thread producer([this] { queue.push(7); });

  std::optional<int> v;
  while (!(v = queue.try_pop())) {
    std::this_thread::yield();
  }
  producer.join();

  EXPECT_EQ(*v, 7);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 5. Four producers and four consumers: every value is seen exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(kProducers);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }

  std::vector<std::thread> consumers;
  for (int c = 0; c < kProducers; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (auto v = queue.try_pop()) {
          seen[c].push_back(*v);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::set<int> unique;
  std::size_t count = 0;
  for (const auto& bucket : seen) {
    unique.insert(bucket.begin(), bucket.end());
    count += bucket.size();
  }
  EXPECT_EQ(count, static_cast<std::size_t>(kTotal));
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kTotal));
  EXPECT_TRUE(queue.empty());
}
