// ============================================================================
// BOUNDED QUEUE UNIT TESTS
// ============================================================================
// Capacity, overflow policies and close() semantics
// ============================================================================

#include <gtest/gtest.h>
#include <gelfbridge/core/queues/bounded_queue.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace GelfBridge;
using namespace std::chrono_literals;

// ============================================================================
// OVERFLOW POLICY TESTS
// ============================================================================

TEST(BoundedQueue, DropNewRejectsWhenFull) {
    BoundedQueue<int> q(2, OverflowPolicy::DROP_NEW);

    EXPECT_EQ(q.push(1), PushResult::OK);
    EXPECT_EQ(q.push(2), PushResult::OK);
    EXPECT_EQ(q.push(3), PushResult::DROPPED);
    EXPECT_EQ(q.size(), 2u);

    auto first = q.pop(10ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 1);
    EXPECT_EQ(q.push(4), PushResult::OK);
}

TEST(BoundedQueue, BlockingProducerWaitsForSpace) {
    BoundedQueue<int> q(1, OverflowPolicy::BLOCK_PRODUCER);
    ASSERT_EQ(q.push(1), PushResult::OK);

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        EXPECT_EQ(q.push(2), PushResult::OK);
        pushed.store(true);
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(pushed.load());

    auto item = q.pop(100ms);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 1);

    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(q.size(), 1u);
}

TEST(BoundedQueue, PushForTimesOutAndKeepsItem) {
    BoundedQueue<std::string> q(1, OverflowPolicy::BLOCK_PRODUCER);
    ASSERT_EQ(q.push("first"), PushResult::OK);

    std::string item = "second";
    EXPECT_EQ(q.pushFor(item, 20ms), PushResult::TIMEOUT);
    EXPECT_EQ(item, "second");
}

// ============================================================================
// CLOSE TESTS
// ============================================================================

TEST(BoundedQueue, CloseWakesBlockedProducer) {
    BoundedQueue<int> q(1, OverflowPolicy::BLOCK_PRODUCER);
    ASSERT_EQ(q.push(1), PushResult::OK);

    std::thread producer([&] {
        EXPECT_EQ(q.push(2), PushResult::CLOSED);
    });

    std::this_thread::sleep_for(50ms);
    q.close();
    producer.join();
}

TEST(BoundedQueue, ConsumersDrainAfterClose) {
    BoundedQueue<int> q(4);
    q.push(1);
    q.push(2);
    q.close();

    EXPECT_EQ(q.push(3), PushResult::CLOSED);
    auto batch = q.popBatch(10, 10ms);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0], 1);
    EXPECT_EQ(batch[1], 2);

    EXPECT_FALSE(q.pop(10ms).has_value());
    EXPECT_TRUE(q.isClosed());
}

TEST(BoundedQueue, PopBatchRespectsMaximum) {
    BoundedQueue<int> q(10);
    for (int i = 0; i < 5; ++i) q.push(i);

    auto batch = q.popBatch(3, 10ms);
    EXPECT_EQ(batch.size(), 3u);
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.drain().size(), 2u);
    EXPECT_TRUE(q.empty());
}
