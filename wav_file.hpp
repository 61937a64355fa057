#pragma once

#include <sndfile.h>

#include <string>
#include <vector>

#include "audio_io.hpp"

class WavFileReader : public AudioReader {
 public:
  WavFileReader() = default;
  ~WavFileReader() override;

  WavFileReader(const WavFileReader &) = delete;
  WavFileReader &operator=(const WavFileReader &) = delete;

  // FileError if the file cannot be opened, FormatError if it is not
  // 16/32-bit integer or 32-bit float PCM.
  StreamError open(const std::string &path);
  void close();

  const AudioFormat &format() const override { return format_; }
  StreamError read(uint8_t *data, size_t size, size_t &bytes_read) override;

  sf_count_t frames() const { return info_.frames; }

 private:
  SNDFILE *file_ = nullptr;
  SF_INFO info_{};
  AudioFormat format_;
  SampleCodec codec_ = SampleCodec::Int16;
  std::vector<int16_t> samples16_;
  std::vector<int32_t> samples32_;
  std::vector<float> samplesf_;
};

// The file is created on the first write (or at finalize) because its header
// depends on the format announced by the server.
class WavFileWriter : public AudioWriter {
 public:
  explicit WavFileWriter(std::string path);
  ~WavFileWriter() override;

  WavFileWriter(const WavFileWriter &) = delete;
  WavFileWriter &operator=(const WavFileWriter &) = delete;

  StreamError update_format(const AudioFormat &format) override;
  StreamError write(const uint8_t *data, size_t size) override;
  StreamError finalize() override;

  const std::string &path() const { return path_; }

 private:
  StreamError open_file();

  std::string path_;
  bool has_format_ = false;
  bool finalized_ = false;
  AudioFormat format_;
  SampleCodec codec_ = SampleCodec::Int16;
  SNDFILE *file_ = nullptr;
  // Whole samples of an incomplete frame, written with the next chunk
  std::vector<int16_t> pending16_;
  std::vector<int32_t> pending32_;
  std::vector<float> pendingf_;
};
