#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "audio_format.hpp"

// Every message on the wire is a 13-byte little-endian header
//   magic:u16 | version:u8 | msg_type:u8 | payload_size:u16 |
//   sample_rate:u32 | channels:u8 | bits_per_sample:u8 | sample_kind:u8
// followed by payload_size bytes. Only Data carries a payload.
#define PROTOCOL_MAGIC 0x5253
#define PROTOCOL_VERSION 1
#define HEADER_SIZE 13
#define MAX_PAYLOAD_SIZE 65535

enum class MessageType : uint8_t {
  Hello = 0,
  Ok = 1,
  Bye = 2,
  StartPlaying = 3,
  StopPlaying = 4,
  AudioHeader = 5,
  Data = 6,
};

enum class DecodeStatus {
  Ok,
  Truncated,  // need more bytes, retry after the next read
  Malformed,  // framing is lost, close the connection
};

struct Message {
  MessageType type = MessageType::Hello;
  uint8_t version = PROTOCOL_VERSION;
  AudioFormat format;            // AudioHeader and Data
  std::vector<uint8_t> payload;  // Data
};

bool operator==(const Message &a, const Message &b);

Message make_message(MessageType type);
Message make_audio_header(const AudioFormat &format);
Message make_data_message(const AudioFormat &format, const uint8_t *data,
                          size_t size);

const char *message_type_to_string(MessageType type);

// Appends the encoded message to out. Returns false only for messages that
// cannot be represented: payload over MAX_PAYLOAD_SIZE, a payload on a
// control message, or an AudioHeader with an unsupported format.
bool encode_message(const Message &message, std::vector<uint8_t> &out);

// Decodes one message from the front of data. Has no side effects on
// failure, so it can be retried as more bytes arrive.
DecodeStatus decode_message(const uint8_t *data, size_t size, Message &message,
                            size_t &consumed);

// Accumulates bytes from a stream socket and splits them into messages.
class MessageReader {
 public:
  void feed(const uint8_t *data, size_t size);
  DecodeStatus next(Message &message);
  size_t buffered() const { return buffer_.size() - read_pos_; }

 private:
  std::vector<uint8_t> buffer_;
  size_t read_pos_ = 0;
};
