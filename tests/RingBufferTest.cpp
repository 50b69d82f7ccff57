#include "core/RingBuffer.hpp"
#include <gtest/gtest.h>

using core::RingBuffer;

TEST(RingBufferTest, StartsEmpty) {
    RingBuffer<int, 5> buffer;
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.full());
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.capacity(), 5u);
}

TEST(RingBufferTest, KeepsInsertionOrder) {
    RingBuffer<int, 5> buffer;
    buffer.push(1);
    buffer.push(2);
    buffer.push(3);

    ASSERT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer.front(), 1);
    EXPECT_EQ(buffer.back(), 3);
    EXPECT_EQ(buffer[1], 2);
}

TEST(RingBufferTest, NeverExceedsCapacity) {
    RingBuffer<int, 5> buffer;
    for (int i = 0; i < 23; ++i) {
        buffer.push(i);
        EXPECT_LE(buffer.size(), 5u);
    }
    EXPECT_TRUE(buffer.full());
}

TEST(RingBufferTest, EvictsOldestWhenFull) {
    RingBuffer<int, 5> buffer;
    for (int i = 0; i < 6; ++i) {
        buffer.push(i);
    }

    ASSERT_EQ(buffer.size(), 5u);
    for (size_t i = 0; i < buffer.size(); ++i) {
        EXPECT_EQ(buffer[i], static_cast<int>(i) + 1);
    }
    EXPECT_EQ(buffer.front(), 1);
    EXPECT_EQ(buffer.back(), 5);
}

TEST(RingBufferTest, ClearResets) {
    RingBuffer<int, 3> buffer;
    buffer.push(7);
    buffer.push(8);
    buffer.clear();
    EXPECT_TRUE(buffer.empty());

    buffer.push(9);
    EXPECT_EQ(buffer.front(), 9);
    EXPECT_EQ(buffer.back(), 9);
}
