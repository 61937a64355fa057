#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <vector>

#include "test_helpers.hpp"
#include "wav_file.hpp"

class WavFileTest : public ::testing::TestWithParam<AudioFormat> {
 protected:
  void TearDown() override { std::remove(path_.c_str()); }

  std::string path_ = temp_path("wav_file_test.wav");
};

static AudioFormat make_format(uint32_t rate, uint8_t channels, uint8_t bits,
                               SampleKind kind) {
  AudioFormat format;
  format.sample_rate = rate;
  format.channels = channels;
  format.bits_per_sample = bits;
  format.sample_kind = kind;
  return format;
}

TEST_P(WavFileTest, WriteThenReadBack) {
  const AudioFormat format = GetParam();
  std::vector<uint8_t> pcm = make_pcm(format, 3000);

  {
    WavFileWriter writer(path_);
    ASSERT_EQ(StreamError::None, writer.update_format(format));
    // irregular chunks, some ending inside a sample or a frame
    size_t offset = 0;
    size_t chunk = 1;
    while (offset < pcm.size()) {
      size_t n = std::min(chunk, pcm.size() - offset);
      size_t whole = n - n % bytes_per_sample(format);
      if (whole == 0) {
        whole = std::min(bytes_per_sample(format), pcm.size() - offset);
      }
      ASSERT_EQ(StreamError::None, writer.write(pcm.data() + offset, whole));
      offset += whole;
      chunk = chunk * 3 + 1;
      if (chunk > 5000) {
        chunk = 7;
      }
    }
    ASSERT_EQ(StreamError::None, writer.finalize());
  }

  AudioFormat read_format;
  std::vector<uint8_t> read_pcm;
  ASSERT_TRUE(read_all_pcm(path_, read_format, read_pcm));
  EXPECT_EQ(format, read_format);
  EXPECT_EQ(pcm, read_pcm);
}

INSTANTIATE_TEST_SUITE_P(
    SupportedFormats, WavFileTest,
    ::testing::Values(make_format(8000, 1, 16, SampleKind::Int),
                      make_format(44100, 2, 16, SampleKind::Int),
                      make_format(22050, 2, 32, SampleKind::Int),
                      make_format(48000, 3, 32, SampleKind::Float)));

TEST(WavFileWriterTest, WriteBeforeFormatIsRejected) {
  std::string path = temp_path("no_format.wav");
  WavFileWriter writer(path);
  const uint8_t bytes[4] = {1, 2, 3, 4};
  EXPECT_EQ(StreamError::FormatError, writer.write(bytes, sizeof(bytes)));
  // the file cannot exist without a format
  EXPECT_EQ(nullptr, std::fopen(path.c_str(), "rb"));
}

TEST(WavFileWriterTest, FinalizeWithoutDataCreatesEmptyFile) {
  std::string path = temp_path("empty.wav");
  AudioFormat format = make_format(16000, 1, 16, SampleKind::Int);
  WavFileWriter writer(path);
  ASSERT_EQ(StreamError::None, writer.update_format(format));
  ASSERT_EQ(StreamError::None, writer.finalize());
  EXPECT_EQ(StreamError::None, writer.finalize());

  WavFileReader reader;
  ASSERT_EQ(StreamError::None, reader.open(path));
  EXPECT_EQ(format, reader.format());
  EXPECT_EQ(0, reader.frames());
  reader.close();
  std::remove(path.c_str());
}

TEST(WavFileWriterTest, TrailingPartialSampleIsDiscarded) {
  std::string path = temp_path("partial.wav");
  AudioFormat format = make_format(8000, 1, 16, SampleKind::Int);
  {
    WavFileWriter writer(path);
    ASSERT_EQ(StreamError::None, writer.update_format(format));
    const uint8_t bytes[5] = {0x01, 0x00, 0x02, 0x00, 0x7F};
    ASSERT_EQ(StreamError::None, writer.write(bytes, sizeof(bytes)));
    ASSERT_EQ(StreamError::None, writer.finalize());
  }
  AudioFormat read_format;
  std::vector<uint8_t> pcm;
  ASSERT_TRUE(read_all_pcm(path, read_format, pcm));
  EXPECT_EQ(std::vector<uint8_t>({0x01, 0x00, 0x02, 0x00}), pcm);
  std::remove(path.c_str());
}

TEST(WavFileWriterTest, WriteAfterFinalizeFails) {
  std::string path = temp_path("finalized.wav");
  WavFileWriter writer(path);
  ASSERT_EQ(StreamError::None,
            writer.update_format(make_format(8000, 1, 16, SampleKind::Int)));
  ASSERT_EQ(StreamError::None, writer.finalize());
  const uint8_t bytes[2] = {0, 0};
  EXPECT_NE(StreamError::None, writer.write(bytes, sizeof(bytes)));
  std::remove(path.c_str());
}

TEST(WavFileWriterTest, RejectsUnsupportedFormat) {
  WavFileWriter writer(temp_path("unsupported.wav"));
  EXPECT_EQ(StreamError::FormatError,
            writer.update_format(make_format(8000, 1, 24, SampleKind::Int)));
  EXPECT_EQ(StreamError::FormatError,
            writer.update_format(make_format(8000, 1, 16, SampleKind::Float)));
}

TEST(WavFileReaderTest, RejectsUnsupportedFile) {
  std::string path = temp_path("pcm24.wav");
  SF_INFO info{};
  info.samplerate = 8000;
  info.channels = 1;
  info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_24;
  SNDFILE *file = sf_open(path.c_str(), SFM_WRITE, &info);
  ASSERT_NE(nullptr, file);
  int samples[4] = {0, 1, 2, 3};
  ASSERT_EQ(4, sf_write_int(file, samples, 4));
  sf_close(file);

  WavFileReader reader;
  EXPECT_EQ(StreamError::FormatError, reader.open(path));
  std::remove(path.c_str());
}

TEST(WavFileReaderTest, MissingFile) {
  WavFileReader reader;
  EXPECT_EQ(StreamError::FileError, reader.open(temp_path("missing.wav")));
}

TEST(WavFileReaderTest, ReadsReferenceFileInWholeFrames) {
  std::string path = temp_path("reference.wav");
  AudioFormat format = make_format(8000, 2, 16, SampleKind::Int);
  std::vector<uint8_t> pcm = make_pcm(format, 100);
  ASSERT_TRUE(write_reference_wav(path, format, pcm));

  WavFileReader reader;
  ASSERT_EQ(StreamError::None, reader.open(path));
  EXPECT_EQ(format, reader.format());
  std::vector<uint8_t> read_pcm;
  uint8_t buffer[10];  // 2.5 frames
  while (true) {
    size_t n = 0;
    ASSERT_EQ(StreamError::None, reader.read(buffer, sizeof(buffer), n));
    if (n == 0) {
      break;
    }
    EXPECT_EQ(0u, n % bytes_per_frame(format));
    read_pcm.insert(read_pcm.end(), buffer, buffer + n);
  }
  EXPECT_EQ(pcm, read_pcm);
  std::remove(path.c_str());
}
