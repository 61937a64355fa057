#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "audio_format.hpp"
#include "config.hpp"
#include "ring_buffer.hpp"

// Bridges the network receive thread (producer) and the audio device
// callback (consumer). Both sides lock only around a single queue mutation.
//
// The consumer never waits: when less than one frame is queued it outputs
// silence. The first time the queue runs out of whole frames after a push,
// the consumer fires a one-shot drain signal; the next push re-arms it.
//
// Bytes are played in push order and never dropped, so
//   bytes_consumed() + buffered() == bytes_pushed()
// holds at all times.
class PlaybackBuffer {
 public:
  explicit PlaybackBuffer(size_t capacity = PLAYBACK_BUFFER_BYTES,
                          int stall_timeout_ms = PUSH_STALL_MS);

  PlaybackBuffer(const PlaybackBuffer &) = delete;
  PlaybackBuffer &operator=(const PlaybackBuffer &) = delete;

  // Rejected (false) for unsupported formats, and once playback has started
  // for anything but the current format.
  bool update_format(const AudioFormat &format);
  AudioFormat format() const;

  // Called right before the device stream starts. Locks the format; false
  // when no format has been set, since the callback could not size its output.
  bool start();
  bool started() const { return started_; }

  // Producer side. Waits while the ring is full; returns false if the
  // buffer was closed or the consumer freed no space for stall_timeout_ms.
  bool push(const uint8_t *data, size_t size);
  bool stalled() const;

  // Consumer side, called from the audio callback. output holds `frames`
  // interleaved samples of the negotiated format.
  void fill_output(void *output, unsigned long frames);

  // Blocks the caller until everything pushed so far has been played.
  bool wait_for_drain(std::chrono::milliseconds timeout);

  // Releases a producer blocked in push and makes the buffer inert.
  void close();
  bool closed() const;

  size_t buffered() const;
  uint64_t bytes_pushed() const;
  uint64_t bytes_consumed() const;
  uint64_t drain_count() const;
  uint64_t underrun_frames() const { return underrun_frames_; }

 private:
  using FrameDecoder = void (*)(const uint8_t *frame, void *output,
                                unsigned long index, unsigned channels);
  using SilenceWriter = void (*)(void *output, unsigned long index,
                                 unsigned channels);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  RingBuffer ring_;
  AudioFormat format_;
  size_t frame_bytes_ = 0;
  FrameDecoder decode_frame_ = nullptr;
  SilenceWriter write_silence_ = nullptr;
  bool drain_armed_ = false;
  bool closed_ = false;
  bool stalled_ = false;
  std::chrono::milliseconds stall_timeout_;
  uint64_t bytes_pushed_ = 0;
  uint64_t bytes_consumed_ = 0;
  uint64_t drain_count_ = 0;
  std::atomic<bool> started_{false};
  std::atomic<uint64_t> underrun_frames_{0};
};
