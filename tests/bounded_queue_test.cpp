// =============================================================================
// bounded_queue_test.cpp
// =============================================================================
// Unit tests for recon::BoundedQueue<T> and the QueueStreamSource built on it.
//
// Validates:
//   - FIFO ordering; try_pop() on empty and non-empty queues
//   - pop_for() times out on an empty queue and wakes early on push
//   - Overflow discards the oldest item and counts it
//   - close(): pushes are refused, buffered items still drain, waiting
//     consumers wake immediately
//   - Move-only payloads
//   - No lost or duplicated items under multi-producer / multi-consumer load
//   - QueueStreamSource: injected failures and close() surface as StreamError
//
// Threading model:
//   Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "recon/concurrent/bounded_queue.hpp"
#include "recon/stream/queue_stream_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using recon::PushResult;

class BoundedQueueTest : public ::testing::Test {
 protected:
  recon::BoundedQueue<int> queue{4};
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// Why: stream frames are applied in arrival order; reordering here would
//      let a stale status overtake a fresh one.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, FifoOrder) {
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(queue.push(i), PushResult::Accepted);
  }
  EXPECT_EQ(queue.size(), 4u);

  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(queue.try_pop(), i);
  }
  EXPECT_EQ(queue.try_pop(), std::nullopt);
}

// -----------------------------------------------------------------------------
// 2. A zero capacity is a programming error.
// -----------------------------------------------------------------------------
TEST(BoundedQueueConstructionTest, ZeroCapacityThrows) {
  EXPECT_THROW(recon::BoundedQueue<int>{0}, std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. A full queue keeps the newest items.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, OverflowDropsOldest) {
  for (int i = 0; i < 4; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.push(4), PushResult::DroppedOldest);
  EXPECT_EQ(queue.push(5), PushResult::DroppedOldest);

  EXPECT_EQ(queue.dropped(), 2u);
  EXPECT_EQ(queue.size(), 4u);
  EXPECT_EQ(queue.try_pop(), 2);
}

// -----------------------------------------------------------------------------
// 4. pop_for() on an empty queue gives up after roughly its timeout.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, PopForTimesOut) {
  const auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(queue.pop_for(30ms), std::nullopt);
  EXPECT_GE(std::chrono::steady_clock::now() - started, 25ms);
}

// -----------------------------------------------------------------------------
// 5. A push from another thread wakes a waiting consumer well before the
//    timeout.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, PopForWakesOnPush) {
  std::thread producer([this] {
    std::this_thread::sleep_for(20ms);
    queue.push(42);
  });

  const auto started = std::chrono::steady_clock::now();
  auto value = queue.pop_for(5s);
  const auto waited = std::chrono::steady_clock::now() - started;
  producer.join();

  EXPECT_EQ(value, 42);
  EXPECT_LT(waited, 2s);
}

// -----------------------------------------------------------------------------
// 6. close(): refuse new items, drain old ones, never wait again.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, CloseDrainsThenStopsWaiting) {
  queue.push(1);
  queue.close();

  EXPECT_TRUE(queue.closed());
  EXPECT_EQ(queue.push(2), PushResult::Closed);
  EXPECT_EQ(queue.pop_for(5s), 1);

  const auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(queue.pop_for(5s), std::nullopt);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}

// -----------------------------------------------------------------------------
// 7. close() from another thread releases a blocked consumer.
// -----------------------------------------------------------------------------
TEST_F(BoundedQueueTest, CloseWakesWaitingConsumer) {
  std::thread closer([this] {
    std::this_thread::sleep_for(20ms);
    queue.close();
  });

  const auto started = std::chrono::steady_clock::now();
  EXPECT_EQ(queue.pop_for(10s), std::nullopt);
  const auto waited = std::chrono::steady_clock::now() - started;
  closer.join();

  EXPECT_LT(waited, 5s);
}

// -----------------------------------------------------------------------------
// 8. Move-only payloads compile and transfer ownership.
// -----------------------------------------------------------------------------
TEST(BoundedQueueMoveOnlyTest, UniquePtrPayload) {
  recon::BoundedQueue<std::unique_ptr<std::string>> frames{2};
  frames.push(std::make_unique<std::string>("frame"));

  auto out = frames.try_pop();
  ASSERT_TRUE(out.has_value());
  ASSERT_NE(*out, nullptr);
  EXPECT_EQ(**out, "frame");
}

// -----------------------------------------------------------------------------
// 9. Several producers and consumers: every item is seen exactly once.
// How: capacity is large enough that nothing is dropped; consumers stop once
//      the queue is closed and drained.
// -----------------------------------------------------------------------------
TEST(BoundedQueueConcurrencyTest, NoLostOrDuplicatedItems) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 2'500;
  constexpr int kConsumers = 3;
  recon::BoundedQueue<int> shared{kProducers * kPerProducer};

  std::vector<std::vector<int>> seen(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([&shared, &seen, c] {
      for (;;) {
        if (auto value = shared.pop_for(50ms)) {
          seen[c].push_back(*value);
        } else if (shared.closed()) {
          break;
        }
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&shared, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        shared.push(p * kPerProducer + i);
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }
  shared.close();
  for (auto& t : consumers) {
    t.join();
  }

  std::vector<int> all;
  for (const auto& part : seen) {
    all.insert(all.end(), part.begin(), part.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(all.size(), static_cast<std::size_t>(kProducers * kPerProducer));
  for (int i = 0; i < kProducers * kPerProducer; ++i) {
    EXPECT_EQ(all[i], i);
  }
  EXPECT_EQ(shared.dropped(), 0u);
}

// -----------------------------------------------------------------------------
// 10. QueueStreamSource turns injected failures and close() into
//     StreamError, after delivering what was buffered.
// -----------------------------------------------------------------------------
TEST(QueueStreamSourceTest, FailuresAndCloseSurfaceAsStreamError) {
  recon::QueueStreamSource source{2};

  EXPECT_EQ(source.next(5ms), std::nullopt);

  source.push("a");
  source.injectFailure("reset");
  EXPECT_EQ(source.next(5ms), "a");
  EXPECT_THROW(source.next(5ms), recon::StreamError);

  source.push("b");
  source.push("c");
  EXPECT_EQ(source.push("d"), PushResult::DroppedOldest);
  EXPECT_EQ(source.dropped(), 1u);

  source.close();
  EXPECT_EQ(source.push("e"), PushResult::Closed);
  EXPECT_EQ(source.next(5ms), "c");
  EXPECT_EQ(source.next(5ms), "d");
  EXPECT_THROW(source.next(5ms), recon::StreamError);
  EXPECT_EQ(source.pending(), 0u);
}
