#include "protocol.hpp"

#include "byte_order.hpp"

bool operator==(const Message &a, const Message &b) {
  return a.type == b.type && a.version == b.version && a.format == b.format &&
         a.payload == b.payload;
}

Message make_message(MessageType type) {
  Message message;
  message.type = type;
  return message;
}

Message make_audio_header(const AudioFormat &format) {
  Message message = make_message(MessageType::AudioHeader);
  message.format = format;
  return message;
}

Message make_data_message(const AudioFormat &format, const uint8_t *data,
                          size_t size) {
  Message message = make_message(MessageType::Data);
  message.format = format;
  message.payload.assign(data, data + size);
  return message;
}

const char *message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::Hello:
      return "HELLO";
    case MessageType::Ok:
      return "OK";
    case MessageType::Bye:
      return "BYE";
    case MessageType::StartPlaying:
      return "START_PLAYING";
    case MessageType::StopPlaying:
      return "STOP_PLAYING";
    case MessageType::AudioHeader:
      return "AUDIO_HEADER";
    case MessageType::Data:
      return "DATA";
  }
  return "UNKNOWN";
}

static bool is_known_type(uint8_t type) {
  return type <= static_cast<uint8_t>(MessageType::Data);
}

bool encode_message(const Message &message, std::vector<uint8_t> &out) {
  if (message.payload.size() > MAX_PAYLOAD_SIZE) {
    return false;
  }
  if (message.type != MessageType::Data && !message.payload.empty()) {
    return false;
  }
  if (message.type == MessageType::AudioHeader &&
      !is_supported_format(message.format)) {
    return false;
  }

  uint8_t header[HEADER_SIZE];
  put_u16_le(header, PROTOCOL_MAGIC);
  header[2] = message.version;
  header[3] = static_cast<uint8_t>(message.type);
  put_u16_le(header + 4, static_cast<uint16_t>(message.payload.size()));
  put_u32_le(header + 6, message.format.sample_rate);
  header[10] = message.format.channels;
  header[11] = message.format.bits_per_sample;
  header[12] = static_cast<uint8_t>(message.format.sample_kind);

  out.insert(out.end(), header, header + HEADER_SIZE);
  out.insert(out.end(), message.payload.begin(), message.payload.end());
  return true;
}

DecodeStatus decode_message(const uint8_t *data, size_t size, Message &message,
                            size_t &consumed) {
  // The magic is checked as soon as it is available so garbage is reported
  // without waiting for a full header.
  if (size >= 2 && get_u16_le(data) != PROTOCOL_MAGIC) {
    return DecodeStatus::Malformed;
  }
  if (size >= 4 && !is_known_type(data[3])) {
    return DecodeStatus::Malformed;
  }
  if (size < HEADER_SIZE) {
    return DecodeStatus::Truncated;
  }

  MessageType type = static_cast<MessageType>(data[3]);
  uint16_t payload_size = get_u16_le(data + 4);
  if (data[12] > static_cast<uint8_t>(SampleKind::Float)) {
    return DecodeStatus::Malformed;
  }
  if (type != MessageType::Data && payload_size != 0) {
    return DecodeStatus::Malformed;
  }

  AudioFormat format;
  format.sample_rate = get_u32_le(data + 6);
  format.channels = data[10];
  format.bits_per_sample = data[11];
  format.sample_kind = static_cast<SampleKind>(data[12]);
  if (type == MessageType::AudioHeader && !is_supported_format(format)) {
    return DecodeStatus::Malformed;
  }

  if (size < HEADER_SIZE + static_cast<size_t>(payload_size)) {
    return DecodeStatus::Truncated;
  }

  message.type = type;
  message.version = data[2];
  message.format = format;
  message.payload.assign(data + HEADER_SIZE, data + HEADER_SIZE + payload_size);
  consumed = HEADER_SIZE + payload_size;
  return DecodeStatus::Ok;
}

void MessageReader::feed(const uint8_t *data, size_t size) {
  // Drop consumed bytes before growing so the buffer stays bounded by one
  // message plus one read.
  if (read_pos_ > 0) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + read_pos_);
    read_pos_ = 0;
  }
  buffer_.insert(buffer_.end(), data, data + size);
}

DecodeStatus MessageReader::next(Message &message) {
  size_t consumed = 0;
  DecodeStatus status = decode_message(buffer_.data() + read_pos_, buffered(),
                                       message, consumed);
  if (status == DecodeStatus::Ok) {
    read_pos_ += consumed;
  }
  return status;
}
