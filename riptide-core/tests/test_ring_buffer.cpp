#include <gtest/gtest.h>
#include "ring_buffer.hpp"

#include <chrono>
#include <thread>

using riptide::RingBuffer;

TEST(RingBufferTest, FifoOrder) {
  RingBuffer<int, 8> buf;
  buf.push(1);
  buf.push(2);
  buf.push(3);

  EXPECT_EQ(buf.size(), 3u);
  EXPECT_EQ(*buf.pop_for(std::chrono::milliseconds(0)), 1);
  EXPECT_EQ(*buf.pop_for(std::chrono::milliseconds(0)), 2);
  EXPECT_EQ(*buf.pop_for(std::chrono::milliseconds(0)), 3);
  EXPECT_FALSE(buf.pop_for(std::chrono::milliseconds(0)).has_value());
  EXPECT_TRUE(buf.empty());
}

TEST(RingBufferTest, FullBufferOverwritesOldest) {
  RingBuffer<int, 4> buf;
  for (int i = 0; i < 6; i++) {
    buf.push(i);
  }

  EXPECT_EQ(buf.size(), 4u);
  EXPECT_EQ(buf.drops(), 2u);
  EXPECT_EQ(*buf.pop_for(std::chrono::milliseconds(0)), 2);
  EXPECT_EQ(buf.size(), 3u);
  EXPECT_EQ(buf.drops(), 2u);
}

TEST(RingBufferTest, PopForTimesOutWhenEmpty) {
  RingBuffer<int, 4> buf;
  auto start = std::chrono::steady_clock::now();
  auto item = buf.pop_for(std::chrono::milliseconds(20));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(item.has_value());
  EXPECT_GE(elapsed, std::chrono::milliseconds(15));
}

TEST(RingBufferTest, PopForWakesOnPush) {
  RingBuffer<int, 4> buf;
  std::thread producer([&buf]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    buf.push(42);
  });

  auto item = buf.pop_for(std::chrono::seconds(5));
  producer.join();

  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 42);
}

TEST(RingBufferTest, CapacityIsFixed) {
  EXPECT_EQ((RingBuffer<int, 4>::capacity()), 4u);
  EXPECT_EQ((RingBuffer<int, 1024>::capacity()), 1024u);
}
