#include "gtest/gtest.h"
#include "core/MessageQueue.h"

#include <string>
#include <thread>

using ConverterPro::MessageQueue;

TEST(MessageQueueTest, StartsEmpty) {
    MessageQueue<int> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_FALSE(queue.tryPop().has_value());
    EXPECT_TRUE(queue.drain().empty());
}

TEST(MessageQueueTest, PopsInPushOrder) {
    MessageQueue<std::string> queue;
    queue.push("first");
    queue.push("second");
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.tryPop().value(), "first");
    EXPECT_EQ(queue.tryPop().value(), "second");
    EXPECT_TRUE(queue.empty());
}

TEST(MessageQueueTest, DrainReturnsAllOldestFirst) {
    MessageQueue<int> queue;
    for (int i = 0; i < 5; ++i) {
        queue.push(i);
    }
    const std::vector<int> items = queue.drain();
    ASSERT_EQ(items.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(items[static_cast<size_t>(i)], i);
    }
    EXPECT_TRUE(queue.empty());
}

TEST(MessageQueueTest, ProducerAndConsumerOnDifferentThreads) {
    MessageQueue<int> queue;
    constexpr int count = 10000;

    std::thread producer([&queue] {
        for (int i = 0; i < count; ++i) {
            queue.push(i);
        }
    });

    std::vector<int> received;
    while (received.size() < static_cast<size_t>(count)) {
        for (int value : queue.drain()) {
            received.push_back(value);
        }
    }
    producer.join();

    for (int i = 0; i < count; ++i) {
        ASSERT_EQ(received[static_cast<size_t>(i)], i);
    }
}
