#include "playback_buffer.hpp"

#include "byte_order.hpp"

// Largest frame: 255 channels of 32-bit samples
#define MAX_FRAME_BYTES (255 * 4)

template <typename T>
static void decode_frame(const uint8_t *frame, void *output,
                         unsigned long index, unsigned channels) {
  T *out = static_cast<T *>(output) + index * channels;
  for (unsigned c = 0; c < channels; ++c) {
    out[c] = get_sample_le<T>(frame + c * sizeof(T));
  }
}

template <typename T>
static void write_silence(void *output, unsigned long index,
                          unsigned channels) {
  T *out = static_cast<T *>(output) + index * channels;
  for (unsigned c = 0; c < channels; ++c) {
    out[c] = T{};
  }
}

PlaybackBuffer::PlaybackBuffer(size_t capacity, int stall_timeout_ms)
    : ring_(capacity), stall_timeout_(stall_timeout_ms) {}

bool PlaybackBuffer::update_format(const AudioFormat &format) {
  SampleCodec codec;
  if (!sample_codec_for(format, codec)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  if (started_) {
    return format == format_;
  }
  if (bytes_per_frame(format) > ring_.capacity()) {
    return false;
  }

  format_ = format;
  frame_bytes_ = bytes_per_frame(format);
  switch (codec) {
    case SampleCodec::Int16:
      decode_frame_ = &decode_frame<int16_t>;
      write_silence_ = &write_silence<int16_t>;
      break;
    case SampleCodec::Int32:
      decode_frame_ = &decode_frame<int32_t>;
      write_silence_ = &write_silence<int32_t>;
      break;
    case SampleCodec::Float32:
      decode_frame_ = &decode_frame<float>;
      write_silence_ = &write_silence<float>;
      break;
  }
  return true;
}

AudioFormat PlaybackBuffer::format() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return format_;
}

bool PlaybackBuffer::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (decode_frame_ == nullptr || closed_) {
    return false;
  }
  started_ = true;
  return true;
}

bool PlaybackBuffer::push(const uint8_t *data, size_t size) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (size > 0) {
    if (!cv_.wait_for(lock, stall_timeout_, [this] {
          return closed_ || ring_.free_space() > 0;
        })) {
      stalled_ = true;
      return false;
    }
    if (closed_) {
      return false;
    }
    size_t written = ring_.write(data, size);
    data += written;
    size -= written;
    bytes_pushed_ += written;
    drain_armed_ = true;
  }
  return true;
}

void PlaybackBuffer::fill_output(void *output, unsigned long frames) {
  // start() refuses to run without a format
  if (decode_frame_ == nullptr) {
    return;
  }
  started_ = true;

  uint8_t frame[MAX_FRAME_BYTES];
  unsigned channels = format_.channels;
  bool notify = false;
  for (unsigned long i = 0; i < frames; ++i) {
    bool have_frame = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (ring_.size() >= frame_bytes_) {
        ring_.read(frame, frame_bytes_);
        bytes_consumed_ += frame_bytes_;
        have_frame = true;
        notify = true;
      }
      if (drain_armed_ && ring_.size() < frame_bytes_) {
        drain_armed_ = false;
        ++drain_count_;
        notify = true;
      }
    }
    if (have_frame) {
      decode_frame_(frame, output, i, channels);
    } else {
      write_silence_(output, i, channels);
      ++underrun_frames_;
    }
  }
  if (notify) {
    cv_.notify_all();
  }
}

bool PlaybackBuffer::wait_for_drain(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout,
                      [this] { return !drain_armed_ || closed_; });
}

void PlaybackBuffer::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool PlaybackBuffer::stalled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stalled_;
}

bool PlaybackBuffer::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t PlaybackBuffer::buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ring_.size();
}

uint64_t PlaybackBuffer::bytes_pushed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_pushed_;
}

uint64_t PlaybackBuffer::bytes_consumed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_consumed_;
}

uint64_t PlaybackBuffer::drain_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drain_count_;
}
