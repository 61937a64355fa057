#include "realtime_playback.hpp"

#include <iostream>
#include <utility>

#include "config.hpp"
#include "logger.hpp"
#include "wav_file.hpp"

RealtimePlayback::RealtimePlayback()
    : RealtimePlayback(std::unique_ptr<OutputDevice>(new DefaultOutputDevice())) {
}

RealtimePlayback::RealtimePlayback(std::unique_ptr<OutputDevice> device,
                                   size_t capacity, int stall_timeout_ms)
    : buffer_(std::make_shared<PlaybackBuffer>(capacity, stall_timeout_ms)),
      device_(std::move(device)),
      device_errors_(std::make_shared<std::atomic<unsigned long>>(0)) {}

RealtimePlayback::~RealtimePlayback() {
  if (device_open_ && !finalized_) {
    buffer_->close();
    if (device_->stop() != StreamError::None) {
      std::cerr << "Failed to stop playback stream." << std::endl;
    }
  }
}

StreamError RealtimePlayback::update_format(const AudioFormat &format) {
  if (finalized_) {
    return StreamError::DeviceError;
  }
  if (!buffer_->update_format(format)) {
    std::cerr << "Cannot switch playback to " << format_to_string(format)
              << std::endl;
    return StreamError::FormatError;
  }
  has_format_ = true;
  return StreamError::None;
}

StreamError RealtimePlayback::open_device() {
  std::shared_ptr<PlaybackBuffer> buffer = buffer_;
  std::shared_ptr<std::atomic<unsigned long>> errors = device_errors_;
  StreamError err = device_->open(
      buffer_->format(),
      [buffer](void *output, unsigned long frames) {
        buffer->fill_output(output, frames);
      },
      [errors](PaStreamCallbackFlags) { ++*errors; });
  if (err != StreamError::None) {
    return err;
  }

  if (!buffer_->start()) {
    return StreamError::FormatError;
  }
  device_open_ = true;
  err = device_->start();
  if (err != StreamError::None) {
    return err;
  }
  logMessage("Playback started.");
  return StreamError::None;
}

StreamError RealtimePlayback::write(const uint8_t *data, size_t size) {
  if (finalized_ || device_failed_) {
    std::cerr << "Write to a finished playback sink." << std::endl;
    return StreamError::DeviceError;
  }
  if (!has_format_) {
    return StreamError::FormatError;
  }
  if (!device_open_) {
    StreamError err = open_device();
    if (err != StreamError::None) {
      device_failed_ = true;
      return err;
    }
  }
  if (!buffer_->push(data, size)) {
    if (buffer_->stalled()) {
      std::cerr << "Playback device stopped taking audio." << std::endl;
      logMessage("Playback stalled after " +
                 std::to_string(buffer_->bytes_consumed()) + " bytes, " +
                 std::to_string(device_errors_->load()) + " device warnings");
    }
    device_failed_ = true;
    buffer_->close();
    return StreamError::DeviceError;
  }
  return StreamError::None;
}

StreamError RealtimePlayback::finalize() {
  if (finalized_) {
    return StreamError::None;
  }
  finalized_ = true;
  if (!device_open_) {
    buffer_->close();
    return device_failed_ ? StreamError::DeviceError : StreamError::None;
  }

  StreamError result = StreamError::None;
  if (device_failed_) {
    result = StreamError::DeviceError;
  } else {
    AudioFormat format = buffer_->format();
    uint64_t bytes_per_second =
        static_cast<uint64_t>(bytes_per_frame(format)) * format.sample_rate;
    std::chrono::milliseconds timeout(
        buffer_->buffered() * 1000 / bytes_per_second + DRAIN_GRACE_MS);
    if (!buffer_->wait_for_drain(timeout)) {
      std::cerr << "Playback did not drain, stopping the device." << std::endl;
      result = StreamError::DeviceError;
    }
  }
  buffer_->close();
  StreamError err = device_->stop();
  if (result == StreamError::None) {
    result = err;
  }

  logMessage("Playback finished: " + std::to_string(buffer_->bytes_consumed()) +
             " bytes played, " + std::to_string(buffer_->underrun_frames()) +
             " underrun frames, " + std::to_string(device_errors_->load()) +
             " device warnings");
  return result;
}

StreamError play_wav_file(const std::string &path) {
  WavFileReader reader;
  StreamError err = reader.open(path);
  if (err != StreamError::None) {
    return err;
  }

  RealtimePlayback playback;
  err = playback.update_format(reader.format());
  if (err != StreamError::None) {
    return err;
  }

  uint8_t buffer[READ_CHUNK_SIZE];
  while (true) {
    size_t n = 0;
    err = reader.read(buffer, sizeof(buffer), n);
    if (err != StreamError::None || n == 0) {
      break;
    }
    err = playback.write(buffer, n);
    if (err != StreamError::None) {
      break;
    }
  }

  StreamError finalize_err = playback.finalize();
  return err != StreamError::None ? err : finalize_err;
}
