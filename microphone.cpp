#include "microphone.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "config.hpp"
#include "logger.hpp"
#include "wav_file.hpp"

MicrophoneReader::MicrophoneReader(int duration_seconds)
    : duration_seconds_(duration_seconds), ring_(CAPTURE_BUFFER_BYTES) {}

MicrophoneReader::~MicrophoneReader() {
  if (stream_ && stream_->stop() != StreamError::None) {
    std::cerr << "Failed to stop capture stream." << std::endl;
  }
}

StreamError MicrophoneReader::open() {
  audio_.reset(new PortAudioSession());
  if (!audio_->ok()) {
    return StreamError::DeviceError;
  }

  DeviceConfig config;
  StreamError err = default_input_config(config);
  if (err != StreamError::None) {
    return err;
  }
  format_ = config.format;
  frames_wanted_ =
      static_cast<uint64_t>(duration_seconds_) * format_.sample_rate;

  stream_ = build_input_stream(
      config,
      [this](const void *input, unsigned long frames) {
        on_input(input, frames);
      },
      [](PaStreamCallbackFlags) {});
  if (!stream_) {
    return StreamError::DeviceError;
  }
  err = stream_->start();
  if (err != StreamError::None) {
    return err;
  }
  std::cout << "Recording started..." << std::endl;
  return StreamError::None;
}

void MicrophoneReader::on_input(const void *input, unsigned long frames) {
  const uint8_t *data = static_cast<const uint8_t *>(input);
  size_t frame_bytes = bytes_per_frame(format_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t wanted =
        std::min<uint64_t>(frames, frames_wanted_ - frames_captured_);
    uint64_t fit = std::min<uint64_t>(wanted, ring_.free_space() / frame_bytes);
    ring_.write(data, fit * frame_bytes);
    // overflowed frames still count against the duration
    dropped_bytes_ += (wanted - fit) * frame_bytes;
    frames_captured_ += wanted;
  }
  cv_.notify_one();
}

StreamError MicrophoneReader::read(uint8_t *data, size_t size,
                                   size_t &bytes_read) {
  bytes_read = 0;
  if (!stream_) {
    return StreamError::None;
  }
  size_t frame_bytes = bytes_per_frame(format_);
  size_t max_frames = size / frame_bytes;
  if (max_frames == 0) {
    return StreamError::DeviceError;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  while (ring_.size() < frame_bytes) {
    if (frames_captured_ >= frames_wanted_) {
      lock.unlock();
      std::cout << "Recording stopped." << std::endl;
      return stream_->stop();
    }
    // a dead device must not hang the reader forever
    if (cv_.wait_for(lock, std::chrono::milliseconds(READ_TIMEOUT_MS)) ==
            std::cv_status::timeout &&
        ring_.size() < frame_bytes && !stream_->is_active()) {
      return StreamError::DeviceError;
    }
  }
  size_t frames = std::min(max_frames, ring_.size() / frame_bytes);
  bytes_read = ring_.read(data, frames * frame_bytes);
  return StreamError::None;
}

StreamError record_audio(int duration_seconds, const std::string &path) {
  MicrophoneReader microphone(duration_seconds);
  StreamError err = microphone.open();
  if (err != StreamError::None) {
    return err;
  }

  WavFileWriter writer(path);
  err = writer.update_format(microphone.format());
  if (err != StreamError::None) {
    return err;
  }

  uint8_t buffer[READ_CHUNK_SIZE];
  while (true) {
    size_t n = 0;
    err = microphone.read(buffer, sizeof(buffer), n);
    if (err != StreamError::None || n == 0) {
      break;
    }
    err = writer.write(buffer, n);
    if (err != StreamError::None) {
      break;
    }
  }

  if (microphone.dropped_bytes() > 0) {
    logMessage("Capture overflow, dropped " +
               std::to_string(microphone.dropped_bytes()) + " bytes");
  }
  StreamError finalize_err = writer.finalize();
  if (err == StreamError::None && finalize_err == StreamError::None) {
    std::cout << "Audio saved to " << path << std::endl;
  }
  return err != StreamError::None ? err : finalize_err;
}
