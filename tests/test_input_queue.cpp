#include <gtest/gtest.h>
#include "input/InputQueue.hpp"
#include <thread>

namespace {

KeyEvent key(char c) {
    return KeyEvent::character(std::string(1, c));
}

std::string texts(const std::vector<KeyEvent>& events) {
    std::string out;
    for (auto& e : events) out += e.text;
    return out;
}

} // namespace

TEST(InputQueueTest, DrainKeepsArrivalOrder) {
    InputQueue q(10);
    for (char c : std::string("abc")) q.push(key(c));

    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(texts(q.drain()), "abc");
    EXPECT_EQ(q.size(), 0u);
}

TEST(InputQueueTest, DropOldestKeepsNewestEvents) {
    InputQueue q(3, InputQueue::DropPolicy::DropOldest);
    EXPECT_TRUE(q.push(key('a')));
    EXPECT_TRUE(q.push(key('b')));
    EXPECT_TRUE(q.push(key('c')));
    EXPECT_FALSE(q.push(key('d')));
    EXPECT_FALSE(q.push(key('e')));

    EXPECT_EQ(texts(q.drain()), "cde");
    EXPECT_EQ(q.droppedCount(), 2u);
}

TEST(InputQueueTest, DropNewestRejectsIncoming) {
    InputQueue q(3, InputQueue::DropPolicy::DropNewest);
    for (char c : std::string("abcde")) q.push(key(c));

    EXPECT_EQ(texts(q.drain()), "abc");
    EXPECT_EQ(q.droppedCount(), 2u);
}

TEST(InputQueueTest, DroppedSinceLastResets) {
    InputQueue q(1);
    q.push(key('a'));
    q.push(key('b'));
    EXPECT_EQ(q.takeDroppedSinceLast(), 1u);
    EXPECT_EQ(q.takeDroppedSinceLast(), 0u);

    q.push(key('c'));
    EXPECT_EQ(q.takeDroppedSinceLast(), 1u);
    EXPECT_EQ(q.droppedCount(), 2u);
}

TEST(InputQueueTest, ZeroCapacityBecomesOne) {
    InputQueue q(0);
    EXPECT_EQ(q.capacity(), 1u);
}

TEST(InputQueueTest, TryPopOnEmpty) {
    InputQueue q;
    KeyEvent out;
    EXPECT_FALSE(q.tryPop(out));

    q.push(key('x'));
    ASSERT_TRUE(q.tryPop(out));
    EXPECT_TRUE(out.is('x'));
}

TEST(InputQueueTest, WaitForWakesOnPush) {
    InputQueue q;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        q.push(key('z'));
    });

    EXPECT_TRUE(q.waitFor(2000));
    producer.join();
    EXPECT_EQ(q.size(), 1u);
}

TEST(InputQueueTest, WaitForTimesOut) {
    InputQueue q;
    EXPECT_FALSE(q.waitFor(10));
}

TEST(InputQueueTest, ConcurrentProducersNeverExceedCapacity) {
    InputQueue q(50);
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; t++) {
        producers.emplace_back([&] {
            for (int i = 0; i < 200; i++) q.push(key('k'));
        });
    }
    for (auto& p : producers) p.join();

    EXPECT_EQ(q.size(), 50u);
    EXPECT_EQ(q.droppedCount(), 800u - 50u);
}
