#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace validator;

TEST(ConcurrentQueueTest, FifoOrder) {
    concurrent_queue<int> q;
    for (int i = 0; i < 5; ++i) EXPECT_TRUE(q.try_push(i));
    int value;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(q.try_pop(value));
        EXPECT_EQ(value, i);
    }
    EXPECT_FALSE(q.try_pop(value));
}

TEST(ConcurrentQueueTest, BoundedCapacity) {
    concurrent_queue<int> q(2);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_FALSE(q.try_push(3));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q.pop(), 1);
    EXPECT_TRUE(q.try_push(3));
}

TEST(ConcurrentQueueTest, RemoveIfKeepsOrder) {
    concurrent_queue<int> q;
    for (int i = 1; i <= 4; ++i) q.try_push(i);
    int removed = 0;
    EXPECT_TRUE(q.remove_if([](int v) { return v == 2; }, removed));
    EXPECT_EQ(removed, 2);
    EXPECT_FALSE(q.remove_if([](int v) { return v == 2; }, removed));
    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 3);
    EXPECT_EQ(q.pop(), 4);
}

TEST(ConcurrentQueueTest, ConcurrentProducers) {
    concurrent_queue<int> q;
    vector<thread> producers;
    for (int t = 0; t < 4; ++t)
        producers.emplace_back([&q, t] {
            for (int i = 0; i < 100; ++i) q.try_push(t * 100 + i);
        });
    for (auto &producer : producers) producer.join();

    vector<bool> seen(400, false);
    int value;
    while (q.try_pop(value)) seen[value] = true;
    for (bool s : seen) EXPECT_TRUE(s);
}
