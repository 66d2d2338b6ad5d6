/**
 * @file test_event_bus.cpp
 * @brief Unit tests for the backend-to-UI event queue
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Courier/Shell/EventBus.hpp>
#include <set>
#include <thread>
#include <vector>

using namespace Courier::Shell;

TEST(EventBusTest, SequenceStartsAtOne) {
    EventBus bus;

    EXPECT_EQ(bus.lastSeq(), 0u);
    EXPECT_EQ(bus.emit("log", {{"message", "first"}}), 1u);
    EXPECT_EQ(bus.emit("log", {{"message", "second"}}), 2u);
    EXPECT_EQ(bus.lastSeq(), 2u);
    EXPECT_EQ(bus.size(), 2u);
}

TEST(EventBusTest, SinceReturnsNewerEventsInOrder) {
    EventBus bus;
    bus.emit("a", 1);
    bus.emit("b", 2);
    bus.emit("c", 3);

    auto all = bus.since(0);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "a");
    EXPECT_EQ(all[2].name, "c");

    auto tail = bus.since(2);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].seq, 3u);
    EXPECT_EQ(tail[0].payload, 3);

    EXPECT_TRUE(bus.since(3).empty());
    EXPECT_TRUE(bus.since(100).empty());
}

TEST(EventBusTest, OldestDroppedWhenFull) {
    EventBus bus(3);
    for (int i = 0; i < 5; ++i) {
        bus.emit("tick", i);
    }

    EXPECT_EQ(bus.size(), 3u);
    EXPECT_EQ(bus.dropped(), 2u);

    auto events = bus.since(0);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().seq, 3u);
    EXPECT_EQ(events.back().seq, 5u);
}

TEST(EventBusTest, ConcurrentEmitAssignsUniqueSeq) {
    EventBus bus(1000);
    const int numThreads = 4;
    const int perThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&bus, t]() {
            for (int i = 0; i < perThread; ++i) {
                bus.emit("tick", t);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto events = bus.since(0);
    ASSERT_EQ(events.size(), static_cast<size_t>(numThreads * perThread));

    std::set<uint64_t> seen;
    for (size_t i = 0; i < events.size(); ++i) {
        seen.insert(events[i].seq);
        if (i > 0) {
            EXPECT_LT(events[i - 1].seq, events[i].seq);
        }
    }
    EXPECT_EQ(seen.size(), events.size());
}
