// =============================================================================
// bounded_queue_test.cpp
// =============================================================================
// Unit tests for tether::BoundedQueue<T>.
//
// Validates:
//   - FIFO semantics and non-blocking try_pop()
//   - Drop-oldest behaviour at capacity, and the drop counter
//   - Thread-safety with one producer and one polling consumer
// =============================================================================

#include "tether/concurrent/bounded_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class BoundedQueueTest : public ::testing::Test {
 protected:
  tether::BoundedQueue<int> queue{4};
};

// -----------------------------------------------------------------------------
// 1. A newly constructed queue is empty and try_pop() returns nullopt.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_EQ(queue.capacity(), 4u);
}

// -----------------------------------------------------------------------------
// 2. Items come back in insertion order.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, FIFOOrder) {
  for (int i = 0; i < 4; ++i) {
    EXPECT_FALSE(queue.push(i));
  }
  for (int i = 0; i < 4; ++i) {
    std::optional<int> v = queue.try_pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. At capacity, push() evicts the oldest entry and reports it.
// Why: Telemetry producers must never block; the newest state matters most.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, FullQueueDropsOldest) {
  for (int i = 0; i < 4; ++i) {
    queue.push(i);
  }
  EXPECT_TRUE(queue.push(4));
  EXPECT_TRUE(queue.push(5));

  EXPECT_EQ(queue.size(), 4u);
  EXPECT_EQ(queue.dropped(), 2u);
  EXPECT_EQ(queue.try_pop().value_or(-1), 2);
}

// -----------------------------------------------------------------------------
// 4. Capacity zero discards everything.
// -----------------------------------------------------------------------------
TEST(BoundedQueueEdgeTest, ZeroCapacityDiscards) {
  tether::BoundedQueue<std::string> q(0);
  EXPECT_TRUE(q.push("lost"));
  EXPECT_TRUE(q.empty());
  EXPECT_EQ(q.dropped(), 1u);
}

// -----------------------------------------------------------------------------
// 5. One producer, one polling consumer: nothing is duplicated and every
//    value is either received or counted as dropped.
// -----------------------------------------------------------------------------
TEST(BoundedQueueConcurrencyTest, ProducerConsumerAccountsForEveryItem) {
  constexpr int kItems = 10'000;
  tether::BoundedQueue<int> q(64);
  std::atomic<bool> done{false};
  std::vector<int> received;

  std::thread consumer([&] {
    while (true) {
      if (auto v = q.try_pop()) {
        received.push_back(*v);
        continue;
      }
      if (done.load()) {
        while (auto rest = q.try_pop()) {
          received.push_back(*rest);
        }
        return;
      }
      std::this_thread::yield();
    }
  });

  for (int i = 0; i < kItems; ++i) {
    q.push(i);
  }
  done.store(true);
  consumer.join();

  EXPECT_EQ(received.size() + q.dropped(), static_cast<std::size_t>(kItems));
  for (std::size_t i = 1; i < received.size(); ++i) {
    EXPECT_LT(received[i - 1], received[i]) << "order violated at " << i;
  }
}
