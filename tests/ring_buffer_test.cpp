#include <gtest/gtest.h>

#include <vector>

#include "ring_buffer.hpp"

TEST(RingBufferTest, WriteStopsAtCapacity) {
  RingBuffer ring(8);
  const uint8_t data[10] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
  EXPECT_EQ(8u, ring.write(data, sizeof(data)));
  EXPECT_EQ(0u, ring.free_space());
  EXPECT_EQ(0u, ring.write(data, 1));
}

TEST(RingBufferTest, WrapsAroundInOrder) {
  RingBuffer ring(8);
  uint8_t out[8];
  uint8_t next = 0;
  uint8_t expected = 0;
  for (int round = 0; round < 20; ++round) {
    uint8_t in[5];
    for (uint8_t &b : in) {
      b = next++;
    }
    ASSERT_EQ(5u, ring.write(in, 5));
    ASSERT_EQ(5u, ring.read(out, 5));
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(expected++, out[i]);
    }
  }
  EXPECT_TRUE(ring.empty());
}

TEST(RingBufferTest, ReadMoreThanAvailable) {
  RingBuffer ring(4);
  const uint8_t data[3] = {7, 8, 9};
  ring.write(data, 3);
  uint8_t out[4] = {0};
  EXPECT_EQ(3u, ring.read(out, 4));
  EXPECT_EQ(9, out[2]);
  EXPECT_EQ(0u, ring.read(out, 4));
}
