#include "wav_file.hpp"

#include <iostream>
#include <utility>

#include "byte_order.hpp"
#include "logger.hpp"

static sf_count_t read_samples(SNDFILE *file, int16_t *out, sf_count_t count) {
  return sf_read_short(file, out, count);
}

static sf_count_t read_samples(SNDFILE *file, int32_t *out, sf_count_t count) {
  return sf_read_int(file, out, count);
}

static sf_count_t read_samples(SNDFILE *file, float *out, sf_count_t count) {
  return sf_read_float(file, out, count);
}

static sf_count_t write_samples(SNDFILE *file, const int16_t *in,
                                sf_count_t count) {
  return sf_write_short(file, in, count);
}

static sf_count_t write_samples(SNDFILE *file, const int32_t *in,
                                sf_count_t count) {
  return sf_write_int(file, in, count);
}

static sf_count_t write_samples(SNDFILE *file, const float *in,
                                sf_count_t count) {
  return sf_write_float(file, in, count);
}

// Reads up to `count` samples (a multiple of the channel count) and stores
// them little-endian in out. Returns the number of bytes written or -1.
template <typename T>
static long read_chunk(SNDFILE *file, std::vector<T> &scratch, uint8_t *out,
                       size_t count) {
  scratch.resize(count);
  sf_count_t got = read_samples(file, scratch.data(),
                                static_cast<sf_count_t>(count));
  if (got < 0) {
    return -1;
  }
  for (sf_count_t i = 0; i < got; ++i) {
    put_sample_le<T>(out + i * sizeof(T), scratch[i]);
  }
  return static_cast<long>(got * sizeof(T));
}

template <typename T>
static bool write_chunk(SNDFILE *file, std::vector<T> &pending,
                        const uint8_t *data, size_t count, int channels) {
  for (size_t i = 0; i < count; ++i) {
    pending.push_back(get_sample_le<T>(data + i * sizeof(T)));
  }
  size_t writable = pending.size() - pending.size() % channels;
  if (writable == 0) {
    return true;
  }
  sf_count_t written =
      write_samples(file, pending.data(), static_cast<sf_count_t>(writable));
  pending.erase(pending.begin(), pending.begin() + writable);
  return written == static_cast<sf_count_t>(writable);
}

WavFileReader::~WavFileReader() { close(); }

StreamError WavFileReader::open(const std::string &path) {
  if (file_ != nullptr) {
    std::cerr << "File already opened." << std::endl;
    return StreamError::FileError;
  }

  info_ = SF_INFO{};
  file_ = sf_open(path.c_str(), SFM_READ, &info_);
  if (!file_) {
    std::cerr << "Error opening file " << path << ": " << sf_strerror(NULL)
              << std::endl;
    return StreamError::FileError;
  }

  if (!format_from_sf_info(info_, format_) ||
      !sample_codec_for(format_, codec_)) {
    std::cerr << "Unsupported WAV format in " << path << std::endl;
    close();
    return StreamError::FormatError;
  }
  logMessage("Opened " + path + " (" + format_to_string(format_) + ")");
  return StreamError::None;
}

void WavFileReader::close() {
  if (file_ != nullptr) {
    sf_close(file_);
    file_ = nullptr;
  }
}

StreamError WavFileReader::read(uint8_t *data, size_t size,
                                size_t &bytes_read) {
  bytes_read = 0;
  if (file_ == nullptr) {
    return StreamError::None;
  }

  // libsndfile reads whole frames only
  size_t frame_bytes = bytes_per_frame(format_);
  size_t frames = size / frame_bytes;
  if (frames == 0) {
    std::cerr << "Read buffer smaller than one frame." << std::endl;
    return StreamError::FileError;
  }
  size_t count = frames * format_.channels;

  long got = -1;
  switch (codec_) {
    case SampleCodec::Int16:
      got = read_chunk(file_, samples16_, data, count);
      break;
    case SampleCodec::Int32:
      got = read_chunk(file_, samples32_, data, count);
      break;
    case SampleCodec::Float32:
      got = read_chunk(file_, samplesf_, data, count);
      break;
  }
  if (got < 0) {
    std::cerr << "Error reading WAV file: " << sf_strerror(file_) << std::endl;
    return StreamError::FileError;
  }
  bytes_read = static_cast<size_t>(got);
  return StreamError::None;
}

WavFileWriter::WavFileWriter(std::string path) : path_(std::move(path)) {}

WavFileWriter::~WavFileWriter() {
  if (!finalized_ && has_format_) {
    StreamError err = finalize();
    if (err != StreamError::None) {
      std::cerr << "Failed to finalize " << path_ << ": "
                << stream_error_to_string(err) << std::endl;
    }
  }
}

StreamError WavFileWriter::update_format(const AudioFormat &format) {
  SampleCodec codec;
  if (!sample_codec_for(format, codec)) {
    return StreamError::FormatError;
  }
  if (file_ != nullptr && format != format_) {
    // the header is already on disk
    return StreamError::FormatError;
  }
  format_ = format;
  codec_ = codec;
  has_format_ = true;
  return StreamError::None;
}

StreamError WavFileWriter::open_file() {
  SF_INFO info;
  if (!format_to_sf_info(format_, info)) {
    return StreamError::FormatError;
  }
  file_ = sf_open(path_.c_str(), SFM_WRITE, &info);
  if (!file_) {
    std::cerr << "Error opening file " << path_ << ": " << sf_strerror(NULL)
              << std::endl;
    return StreamError::FileError;
  }
  logMessage("Writing " + path_ + " (" + format_to_string(format_) + ")");
  return StreamError::None;
}

StreamError WavFileWriter::write(const uint8_t *data, size_t size) {
  if (finalized_) {
    return StreamError::FileError;
  }
  if (!has_format_) {
    std::cerr << "Write to " << path_ << " before the audio format is known."
              << std::endl;
    return StreamError::FormatError;
  }
  if (file_ == nullptr) {
    StreamError err = open_file();
    if (err != StreamError::None) {
      return err;
    }
  }

  size_t count = size / bytes_per_sample(format_);
  bool ok = false;
  switch (codec_) {
    case SampleCodec::Int16:
      ok = write_chunk(file_, pending16_, data, count, format_.channels);
      break;
    case SampleCodec::Int32:
      ok = write_chunk(file_, pending32_, data, count, format_.channels);
      break;
    case SampleCodec::Float32:
      ok = write_chunk(file_, pendingf_, data, count, format_.channels);
      break;
  }
  if (!ok) {
    std::cerr << "Error writing WAV file: " << sf_strerror(file_) << std::endl;
    return StreamError::FileError;
  }
  return StreamError::None;
}

StreamError WavFileWriter::finalize() {
  if (finalized_) {
    return StreamError::None;
  }
  if (!has_format_) {
    return StreamError::FormatError;
  }
  finalized_ = true;

  if (file_ == nullptr) {
    StreamError err = open_file();
    if (err != StreamError::None) {
      return err;
    }
  }

  size_t dropped = pending16_.size() + pending32_.size() + pendingf_.size();
  if (dropped > 0) {
    logMessage("Dropping " + std::to_string(dropped) +
               " samples of an incomplete frame in " + path_);
  }

  sf_write_sync(file_);
  int rc = sf_close(file_);
  file_ = nullptr;
  if (rc != 0) {
    std::cerr << "Error closing " << path_ << ": " << sf_error_number(rc)
              << std::endl;
    return StreamError::FileError;
  }
  logMessage("Finalized " + path_);
  return StreamError::None;
}
