#include "audio_format.hpp"

#include <sstream>

bool operator==(const AudioFormat &a, const AudioFormat &b) {
  return a.sample_rate == b.sample_rate && a.channels == b.channels &&
         a.bits_per_sample == b.bits_per_sample &&
         a.sample_kind == b.sample_kind;
}

bool operator!=(const AudioFormat &a, const AudioFormat &b) { return !(a == b); }

bool is_supported_format(const AudioFormat &format) {
  if (format.sample_rate == 0 || format.channels == 0) {
    return false;
  }
  switch (format.sample_kind) {
    case SampleKind::Int:
      return format.bits_per_sample == 16 || format.bits_per_sample == 32;
    case SampleKind::Float:
      return format.bits_per_sample == 32;
  }
  return false;
}

size_t bytes_per_sample(const AudioFormat &format) {
  return format.bits_per_sample / 8;
}

size_t bytes_per_frame(const AudioFormat &format) {
  return bytes_per_sample(format) * format.channels;
}

std::string format_to_string(const AudioFormat &format) {
  std::ostringstream out;
  out << format.sample_rate << " Hz, " << static_cast<int>(format.channels)
      << " ch, " << static_cast<int>(format.bits_per_sample) << "-bit "
      << (format.sample_kind == SampleKind::Float ? "float" : "int");
  return out.str();
}

bool format_to_sf_info(const AudioFormat &format, SF_INFO &info) {
  if (!is_supported_format(format)) {
    return false;
  }
  info = SF_INFO{};
  info.samplerate = static_cast<int>(format.sample_rate);
  info.channels = format.channels;
  if (format.sample_kind == SampleKind::Float) {
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
  } else if (format.bits_per_sample == 16) {
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;
  } else {
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_32;
  }
  return true;
}

bool format_from_sf_info(const SF_INFO &info, AudioFormat &format) {
  int container = info.format & SF_FORMAT_TYPEMASK;
  if (container != SF_FORMAT_WAV && container != SF_FORMAT_WAVEX) {
    return false;
  }
  if (info.channels <= 0 || info.channels > 255 || info.samplerate <= 0) {
    return false;
  }

  AudioFormat result;
  result.sample_rate = static_cast<uint32_t>(info.samplerate);
  result.channels = static_cast<uint8_t>(info.channels);
  switch (info.format & SF_FORMAT_SUBMASK) {
    case SF_FORMAT_PCM_16:
      result.bits_per_sample = 16;
      result.sample_kind = SampleKind::Int;
      break;
    case SF_FORMAT_PCM_32:
      result.bits_per_sample = 32;
      result.sample_kind = SampleKind::Int;
      break;
    case SF_FORMAT_FLOAT:
      result.bits_per_sample = 32;
      result.sample_kind = SampleKind::Float;
      break;
    default:
      return false;
  }
  format = result;
  return true;
}

bool sample_codec_for(const AudioFormat &format, SampleCodec &codec) {
  if (!is_supported_format(format)) {
    return false;
  }
  if (format.sample_kind == SampleKind::Float) {
    codec = SampleCodec::Float32;
  } else if (format.bits_per_sample == 16) {
    codec = SampleCodec::Int16;
  } else {
    codec = SampleCodec::Int32;
  }
  return true;
}
