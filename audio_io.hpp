#pragma once

#include <cstddef>
#include <cstdint>

#include "audio_format.hpp"
#include "errors.hpp"

// Source of raw little-endian PCM in a fixed format.
class AudioReader {
 public:
  virtual ~AudioReader() = default;

  virtual const AudioFormat &format() const = 0;

  // Fills data with whole frames. bytes_read == 0 means end of stream.
  virtual StreamError read(uint8_t *data, size_t size, size_t &bytes_read) = 0;
};

// Sink for the received stream. The client fans every payload out to all
// registered writers.
class AudioWriter {
 public:
  virtual ~AudioWriter() = default;

  virtual StreamError update_format(const AudioFormat &format) = 0;
  virtual StreamError write(const uint8_t *data, size_t size) = 0;
  virtual StreamError finalize() = 0;
};
