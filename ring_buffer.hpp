#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Fixed-capacity byte FIFO. Not synchronised; the owner guards it.
class RingBuffer {
 public:
  explicit RingBuffer(size_t capacity);

  size_t capacity() const { return buffer_.size(); }
  size_t size() const { return size_; }
  size_t free_space() const { return buffer_.size() - size_; }
  bool empty() const { return size_ == 0; }

  // Both return the number of bytes actually moved.
  size_t write(const uint8_t *data, size_t size);
  size_t read(uint8_t *out, size_t size);

  void clear();

 private:
  std::vector<uint8_t> buffer_;
  size_t read_pos_ = 0;
  size_t size_ = 0;
};
