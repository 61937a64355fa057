#pragma once

#include <cstdint>
#include <cstring>

// Wire and WAV payloads are little-endian regardless of the host.

inline void put_u16_le(uint8_t *out, uint16_t value) {
  out[0] = static_cast<uint8_t>(value);
  out[1] = static_cast<uint8_t>(value >> 8);
}

inline void put_u32_le(uint8_t *out, uint32_t value) {
  out[0] = static_cast<uint8_t>(value);
  out[1] = static_cast<uint8_t>(value >> 8);
  out[2] = static_cast<uint8_t>(value >> 16);
  out[3] = static_cast<uint8_t>(value >> 24);
}

inline uint16_t get_u16_le(const uint8_t *in) {
  return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

inline uint32_t get_u32_le(const uint8_t *in) {
  return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
         (static_cast<uint32_t>(in[2]) << 16) |
         (static_cast<uint32_t>(in[3]) << 24);
}

// Typed sample <-> little-endian bytes for int16_t, int32_t and float.
template <typename T>
inline void put_sample_le(uint8_t *out, T sample);

template <>
inline void put_sample_le<int16_t>(uint8_t *out, int16_t sample) {
  put_u16_le(out, static_cast<uint16_t>(sample));
}

template <>
inline void put_sample_le<int32_t>(uint8_t *out, int32_t sample) {
  put_u32_le(out, static_cast<uint32_t>(sample));
}

template <>
inline void put_sample_le<float>(uint8_t *out, float sample) {
  uint32_t bits;
  std::memcpy(&bits, &sample, sizeof(bits));
  put_u32_le(out, bits);
}

template <typename T>
inline T get_sample_le(const uint8_t *in);

template <>
inline int16_t get_sample_le<int16_t>(const uint8_t *in) {
  return static_cast<int16_t>(get_u16_le(in));
}

template <>
inline int32_t get_sample_le<int32_t>(const uint8_t *in) {
  return static_cast<int32_t>(get_u32_le(in));
}

template <>
inline float get_sample_le<float>(const uint8_t *in) {
  uint32_t bits = get_u32_le(in);
  float sample;
  std::memcpy(&sample, &bits, sizeof(sample));
  return sample;
}
