#include "ring_buffer.hpp"

#include <algorithm>
#include <cstring>

RingBuffer::RingBuffer(size_t capacity) : buffer_(capacity) {}

size_t RingBuffer::write(const uint8_t *data, size_t size) {
  size_t to_write = std::min(size, free_space());
  if (to_write == 0) {
    return 0;
  }
  size_t write_pos = (read_pos_ + size_) % buffer_.size();
  size_t before_wrap = buffer_.size() - write_pos;
  if (to_write > before_wrap) {
    std::memcpy(buffer_.data() + write_pos, data, before_wrap);
    std::memcpy(buffer_.data(), data + before_wrap, to_write - before_wrap);
  } else {
    std::memcpy(buffer_.data() + write_pos, data, to_write);
  }
  size_ += to_write;
  return to_write;
}

size_t RingBuffer::read(uint8_t *out, size_t size) {
  size_t to_read = std::min(size, size_);
  if (to_read == 0) {
    return 0;
  }
  size_t before_wrap = buffer_.size() - read_pos_;
  if (to_read > before_wrap) {
    std::memcpy(out, buffer_.data() + read_pos_, before_wrap);
    std::memcpy(out + before_wrap, buffer_.data(), to_read - before_wrap);
  } else {
    std::memcpy(out, buffer_.data() + read_pos_, to_read);
  }
  read_pos_ = (read_pos_ + to_read) % buffer_.size();
  size_ -= to_read;
  return to_read;
}

void RingBuffer::clear() {
  read_pos_ = 0;
  size_ = 0;
}
