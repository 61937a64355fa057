#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "audio_io.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "session.hpp"

// Client side of one session. Received audio is fanned out to every
// registered sink. Sinks live for the whole session: several streams may be
// played into them and they are finalized once, by disconnect() or the
// destructor.
class Client {
 public:
  Client() : session_(SessionRole::Client) {}
  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  // Connects and performs HELLO / HELLO / OK.
  StreamError connect(const std::string &address, uint16_t port);

  Client &add_sink(std::unique_ptr<AudioWriter> sink);

  // START_PLAYING, then AUDIO_HEADER and DATA until STOP_PLAYING. May be
  // called again once it returns None. Any failure closes the session.
  StreamError start_playing();

  // Finalizes the sinks, which waits for playback to drain, then BYE / BYE.
  // On a session that is already closed only the sinks are finalized.
  StreamError disconnect();

  SessionState state() const { return session_.state(); }
  uint8_t server_version() const { return server_version_; }
  const AudioFormat &format() const { return format_; }
  uint64_t data_messages() const { return data_messages_; }
  uint64_t bytes_received() const { return bytes_received_; }

 private:
  StreamError send(const Message &message);
  StreamError receive(Message &message);
  StreamError receive_stream();
  StreamError finalize_sinks();
  void abort_session();

  std::unique_ptr<Connection> connection_;
  SessionStateMachine session_;
  std::vector<std::unique_ptr<AudioWriter>> sinks_;
  bool sinks_finalized_ = false;
  uint8_t server_version_ = 0;
  AudioFormat format_;
  uint64_t data_messages_ = 0;
  uint64_t bytes_received_ = 0;
};
