#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "audio_device.hpp"
#include "audio_io.hpp"
#include "ring_buffer.hpp"

// Live capture from the default input device for a fixed duration. read()
// blocks until captured frames are available and returns 0 once the
// duration has been delivered.
class MicrophoneReader : public AudioReader {
 public:
  explicit MicrophoneReader(int duration_seconds);
  ~MicrophoneReader() override;

  StreamError open();

  const AudioFormat &format() const override { return format_; }
  StreamError read(uint8_t *data, size_t size, size_t &bytes_read) override;

  uint64_t dropped_bytes() const { return dropped_bytes_; }

 private:
  void on_input(const void *input, unsigned long frames);

  int duration_seconds_;
  AudioFormat format_;
  std::unique_ptr<PortAudioSession> audio_;
  std::unique_ptr<AudioStream> stream_;
  std::mutex mutex_;
  std::condition_variable cv_;
  RingBuffer ring_;
  uint64_t frames_wanted_ = 0;
  uint64_t frames_captured_ = 0;
  std::atomic<uint64_t> dropped_bytes_{0};
};

// Records the default input device to a WAV file.
StreamError record_audio(int duration_seconds, const std::string &path);
