#pragma once

#include <sndfile.h>

#include <cstddef>
#include <cstdint>
#include <string>

enum class SampleKind : uint8_t {
  Int = 0,
  Float = 1,
};

// Negotiated stream format, shared by the wire codec, WAV files and the
// output device. Supported: Int/16, Int/32, Float/32.
struct AudioFormat {
  uint32_t sample_rate = 0;
  uint8_t channels = 0;
  uint8_t bits_per_sample = 0;
  SampleKind sample_kind = SampleKind::Int;
};

bool operator==(const AudioFormat &a, const AudioFormat &b);
bool operator!=(const AudioFormat &a, const AudioFormat &b);

bool is_supported_format(const AudioFormat &format);
size_t bytes_per_sample(const AudioFormat &format);
size_t bytes_per_frame(const AudioFormat &format);
std::string format_to_string(const AudioFormat &format);

// WAV header <-> AudioFormat. Both fail on anything outside the supported
// matrix, so an unsupported file never reaches the data path.
bool format_to_sf_info(const AudioFormat &format, SF_INFO &info);
bool format_from_sf_info(const SF_INFO &info, AudioFormat &format);

// Concrete sample representation, resolved once per stream so hot loops do
// not re-examine the format per sample.
enum class SampleCodec {
  Int16,
  Int32,
  Float32,
};

bool sample_codec_for(const AudioFormat &format, SampleCodec &codec);
