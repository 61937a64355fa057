#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "audio_device.hpp"
#include "audio_io.hpp"
#include "config.hpp"
#include "playback_buffer.hpp"

// Plays the received stream on an output device as it arrives, by default
// the PortAudio default output device. The device is opened on the first
// write; finalize waits until everything written has been played, then stops
// the device. After finalize the sink is inert and further writes fail.
class RealtimePlayback : public AudioWriter {
 public:
  RealtimePlayback();
  explicit RealtimePlayback(std::unique_ptr<OutputDevice> device,
                            size_t capacity = PLAYBACK_BUFFER_BYTES,
                            int stall_timeout_ms = PUSH_STALL_MS);
  ~RealtimePlayback() override;

  StreamError update_format(const AudioFormat &format) override;
  StreamError write(const uint8_t *data, size_t size) override;
  StreamError finalize() override;

  bool device_open() const { return device_open_; }

 private:
  StreamError open_device();

  // Shared with the device callback
  std::shared_ptr<PlaybackBuffer> buffer_;
  std::unique_ptr<OutputDevice> device_;
  std::shared_ptr<std::atomic<unsigned long>> device_errors_;
  bool has_format_ = false;
  bool device_open_ = false;
  bool device_failed_ = false;
  bool finalized_ = false;
};

// Plays a WAV file on the default output device and returns once it has been
// played out.
StreamError play_wav_file(const std::string &path);
