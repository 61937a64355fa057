#pragma once

#include <cstdint>

#include "errors.hpp"
#include "protocol.hpp"

enum class SessionRole : uint8_t {
  Client,
  Server,
};

enum class SessionState : uint8_t {
  Connected,
  AwaitingHello,   // client sent HELLO, waits for the server HELLO
  ReplyingHello,   // server got HELLO, must answer HELLO
  ReplyingOk,      // client got the server HELLO, must answer OK
  AwaitingOk,      // server answered HELLO, waits for OK
  Idle,
  AwaitingHeader,  // client sent START_PLAYING
  SendingHeader,   // server got START_PLAYING
  Streaming,
  AwaitingBye,     // client sent BYE
  ReplyingBye,     // server got BYE, must answer BYE
  Closed,
};

const char *session_state_to_string(SessionState state);

// Ordered message exchange of one connection:
//   HELLO -> HELLO -> OK, then any number of
//   START_PLAYING -> AUDIO_HEADER -> DATA* -> STOP_PLAYING,
//   then BYE -> BYE.
// Any message outside the allowed set is a ProtocolViolation and leaves the
// machine Closed; there is no way to resynchronise.
class SessionStateMachine {
 public:
  explicit SessionStateMachine(SessionRole role) : role_(role) {}

  StreamError on_send(MessageType type);
  StreamError on_receive(MessageType type);
  void on_peer_closed() { state_ = SessionState::Closed; }

  SessionRole role() const { return role_; }
  SessionState state() const { return state_; }
  bool is_closed() const { return state_ == SessionState::Closed; }

 private:
  StreamError apply(bool outgoing, MessageType type);

  SessionRole role_;
  SessionState state_ = SessionState::Connected;
};
