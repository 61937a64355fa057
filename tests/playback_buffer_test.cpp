#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "byte_order.hpp"
#include "playback_buffer.hpp"

static AudioFormat int16_format(uint8_t channels) {
  AudioFormat format;
  format.sample_rate = 8000;
  format.channels = channels;
  format.bits_per_sample = 16;
  format.sample_kind = SampleKind::Int;
  return format;
}

static std::vector<uint8_t> int16_bytes(const std::vector<int16_t> &samples) {
  std::vector<uint8_t> bytes(samples.size() * 2);
  for (size_t i = 0; i < samples.size(); ++i) {
    put_sample_le<int16_t>(bytes.data() + i * 2, samples[i]);
  }
  return bytes;
}

TEST(PlaybackBufferTest, UnderrunWritesSilence) {
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(int16_format(2)));

  // one sample of a two-channel frame
  std::vector<uint8_t> partial = int16_bytes({1234});
  ASSERT_TRUE(buffer.push(partial.data(), partial.size()));

  int16_t output[2] = {99, 99};
  buffer.fill_output(output, 1);
  EXPECT_EQ(0, output[0]);
  EXPECT_EQ(0, output[1]);
  EXPECT_EQ(1u, buffer.underrun_frames());
  // nothing is dropped
  EXPECT_EQ(2u, buffer.buffered());
}

TEST(PlaybackBufferTest, FloatSilenceIsZero) {
  AudioFormat format = int16_format(1);
  format.bits_per_sample = 32;
  format.sample_kind = SampleKind::Float;
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(format));

  float output[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  buffer.fill_output(output, 4);
  for (float sample : output) {
    EXPECT_EQ(0.0f, sample);
  }
}

TEST(PlaybackBufferTest, PlaysSamplesInPushOrder) {
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));

  std::vector<int16_t> samples;
  for (int i = 0; i < 100; ++i) {
    samples.push_back(static_cast<int16_t>(i * 300 - 15000));
  }
  std::vector<uint8_t> bytes = int16_bytes(samples);
  // pushed in uneven pieces, split in the middle of a sample
  ASSERT_TRUE(buffer.push(bytes.data(), 3));
  ASSERT_TRUE(buffer.push(bytes.data() + 3, 50));
  ASSERT_TRUE(buffer.push(bytes.data() + 53, bytes.size() - 53));

  for (int16_t expected : samples) {
    int16_t output = 0;
    buffer.fill_output(&output, 1);
    EXPECT_EQ(expected, output);
  }
  EXPECT_EQ(0u, buffer.underrun_frames());
}

TEST(PlaybackBufferTest, DecodesInterleavedInt32Frames) {
  AudioFormat format = int16_format(2);
  format.bits_per_sample = 32;
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(format));

  uint8_t bytes[16];
  put_sample_le<int32_t>(bytes, -1);
  put_sample_le<int32_t>(bytes + 4, 2147483647);
  put_sample_le<int32_t>(bytes + 8, -2147483647 - 1);
  put_sample_le<int32_t>(bytes + 12, 42);
  ASSERT_TRUE(buffer.push(bytes, sizeof(bytes)));

  int32_t output[6] = {7, 7, 7, 7, 7, 7};
  buffer.fill_output(output, 3);
  EXPECT_EQ(-1, output[0]);
  EXPECT_EQ(2147483647, output[1]);
  EXPECT_EQ(-2147483647 - 1, output[2]);
  EXPECT_EQ(42, output[3]);
  EXPECT_EQ(0, output[4]);
  EXPECT_EQ(0, output[5]);
}

TEST(PlaybackBufferTest, DrainSignalFiresOncePerCycle) {
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));
  int16_t output[8];

  std::vector<uint8_t> first = int16_bytes({1, 2, 3, 4});
  ASSERT_TRUE(buffer.push(first.data(), first.size()));
  buffer.fill_output(output, 8);
  EXPECT_EQ(1u, buffer.drain_count());
  EXPECT_TRUE(buffer.wait_for_drain(std::chrono::milliseconds(0)));

  // staying empty does not fire again
  buffer.fill_output(output, 8);
  EXPECT_EQ(1u, buffer.drain_count());

  std::vector<uint8_t> second = int16_bytes({5, 6});
  ASSERT_TRUE(buffer.push(second.data(), second.size()));
  EXPECT_FALSE(buffer.wait_for_drain(std::chrono::milliseconds(0)));
  buffer.fill_output(output, 1);
  EXPECT_EQ(1u, buffer.drain_count());
  buffer.fill_output(output, 1);
  EXPECT_EQ(2u, buffer.drain_count());
  EXPECT_TRUE(buffer.wait_for_drain(std::chrono::milliseconds(0)));
}

TEST(PlaybackBufferTest, WaitForDrainWakesOnConsumer) {
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));
  std::vector<uint8_t> bytes = int16_bytes({1, 2, 3, 4, 5, 6, 7, 8});
  ASSERT_TRUE(buffer.push(bytes.data(), bytes.size()));

  std::thread consumer([&buffer] {
    int16_t output[2];
    for (int i = 0; i < 8; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      buffer.fill_output(output, 2);
    }
  });
  EXPECT_TRUE(buffer.wait_for_drain(std::chrono::seconds(5)));
  consumer.join();
  EXPECT_EQ(1u, buffer.drain_count());
}

TEST(PlaybackBufferTest, ByteAccountingInvariant) {
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(int16_format(2)));
  std::vector<uint8_t> bytes(37, 1);
  ASSERT_TRUE(buffer.push(bytes.data(), bytes.size()));

  int16_t output[6];
  buffer.fill_output(output, 3);
  EXPECT_EQ(12u, buffer.bytes_consumed());
  EXPECT_EQ(buffer.bytes_pushed(),
            buffer.bytes_consumed() + buffer.buffered());
}

TEST(PlaybackBufferTest, FormatIsLockedOncePlaybackStarts) {
  PlaybackBuffer buffer(1024);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));
  ASSERT_TRUE(buffer.update_format(int16_format(2)));

  int16_t output[2];
  buffer.fill_output(output, 1);
  EXPECT_TRUE(buffer.started());
  EXPECT_FALSE(buffer.update_format(int16_format(1)));
  EXPECT_EQ(2, buffer.format().channels);
  // a second stream in the same format is fine
  EXPECT_TRUE(buffer.update_format(int16_format(2)));
}

TEST(PlaybackBufferTest, StartNeedsFormat) {
  PlaybackBuffer buffer(1024);
  EXPECT_FALSE(buffer.start());
  EXPECT_FALSE(buffer.started());
  ASSERT_TRUE(buffer.update_format(int16_format(1)));
  EXPECT_TRUE(buffer.start());
  EXPECT_TRUE(buffer.started());
}

TEST(PlaybackBufferTest, RejectsUnsupportedFormat) {
  PlaybackBuffer buffer(1024);
  AudioFormat format = int16_format(1);
  format.bits_per_sample = 24;
  EXPECT_FALSE(buffer.update_format(format));
}

TEST(PlaybackBufferTest, FullBufferBlocksProducerUntilConsumed) {
  PlaybackBuffer buffer(8);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));

  std::vector<int16_t> samples = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
  std::vector<uint8_t> bytes = int16_bytes(samples);
  std::atomic<bool> pushed(false);
  std::thread producer([&] {
    EXPECT_TRUE(buffer.push(bytes.data(), bytes.size()));
    pushed = true;
  });

  std::vector<int16_t> played;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (played.size() < samples.size() &&
         std::chrono::steady_clock::now() < deadline) {
    int16_t output = 0;
    if (buffer.buffered() >= 2) {
      buffer.fill_output(&output, 1);
      played.push_back(output);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  producer.join();
  EXPECT_TRUE(pushed);
  EXPECT_EQ(samples, played);
}

TEST(PlaybackBufferTest, CloseReleasesBlockedProducer) {
  PlaybackBuffer buffer(4);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));
  std::vector<uint8_t> bytes(16, 0);

  std::thread producer([&] { EXPECT_FALSE(buffer.push(bytes.data(), 16)); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  buffer.close();
  producer.join();
  EXPECT_TRUE(buffer.closed());
  EXPECT_FALSE(buffer.update_format(int16_format(1)));
}

TEST(PlaybackBufferTest, PushGivesUpWhenConsumerStalls) {
  PlaybackBuffer buffer(8, 50);
  ASSERT_TRUE(buffer.update_format(int16_format(1)));
  ASSERT_TRUE(buffer.start());
  std::vector<uint8_t> bytes(16, 1);

  auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(buffer.push(bytes.data(), bytes.size()));
  auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_LT(elapsed, std::chrono::seconds(2));
  EXPECT_TRUE(buffer.stalled());
  EXPECT_FALSE(buffer.closed());
  EXPECT_EQ(8u, buffer.bytes_pushed());
}
