#include "session.hpp"

namespace {

struct Transition {
  SessionRole role;
  SessionState from;
  bool outgoing;
  MessageType type;
  SessionState to;
};

const Transition transitions[] = {
    // client
    {SessionRole::Client, SessionState::Connected, true, MessageType::Hello,
     SessionState::AwaitingHello},
    {SessionRole::Client, SessionState::AwaitingHello, false,
     MessageType::Hello, SessionState::ReplyingOk},
    {SessionRole::Client, SessionState::ReplyingOk, true, MessageType::Ok,
     SessionState::Idle},
    {SessionRole::Client, SessionState::Idle, true, MessageType::StartPlaying,
     SessionState::AwaitingHeader},
    {SessionRole::Client, SessionState::AwaitingHeader, false,
     MessageType::AudioHeader, SessionState::Streaming},
    {SessionRole::Client, SessionState::Streaming, false, MessageType::Data,
     SessionState::Streaming},
    {SessionRole::Client, SessionState::Streaming, false,
     MessageType::StopPlaying, SessionState::Idle},
    {SessionRole::Client, SessionState::Idle, true, MessageType::Bye,
     SessionState::AwaitingBye},
    {SessionRole::Client, SessionState::AwaitingBye, false, MessageType::Bye,
     SessionState::Closed},

    // server
    {SessionRole::Server, SessionState::Connected, false, MessageType::Hello,
     SessionState::ReplyingHello},
    {SessionRole::Server, SessionState::ReplyingHello, true,
     MessageType::Hello, SessionState::AwaitingOk},
    {SessionRole::Server, SessionState::AwaitingOk, false, MessageType::Ok,
     SessionState::Idle},
    {SessionRole::Server, SessionState::Idle, false, MessageType::StartPlaying,
     SessionState::SendingHeader},
    {SessionRole::Server, SessionState::SendingHeader, true,
     MessageType::AudioHeader, SessionState::Streaming},
    {SessionRole::Server, SessionState::Streaming, true, MessageType::Data,
     SessionState::Streaming},
    {SessionRole::Server, SessionState::Streaming, true,
     MessageType::StopPlaying, SessionState::Idle},
    {SessionRole::Server, SessionState::Idle, false, MessageType::Bye,
     SessionState::ReplyingBye},
    {SessionRole::Server, SessionState::ReplyingBye, true, MessageType::Bye,
     SessionState::Closed},
};

}  // namespace

const char *session_state_to_string(SessionState state) {
  switch (state) {
    case SessionState::Connected:
      return "connected";
    case SessionState::AwaitingHello:
      return "awaiting hello";
    case SessionState::ReplyingHello:
      return "replying hello";
    case SessionState::ReplyingOk:
      return "replying ok";
    case SessionState::AwaitingOk:
      return "awaiting ok";
    case SessionState::Idle:
      return "idle";
    case SessionState::AwaitingHeader:
      return "awaiting audio header";
    case SessionState::SendingHeader:
      return "sending audio header";
    case SessionState::Streaming:
      return "streaming";
    case SessionState::AwaitingBye:
      return "awaiting bye";
    case SessionState::ReplyingBye:
      return "replying bye";
    case SessionState::Closed:
      return "closed";
  }
  return "unknown";
}

StreamError SessionStateMachine::on_send(MessageType type) {
  return apply(true, type);
}

StreamError SessionStateMachine::on_receive(MessageType type) {
  return apply(false, type);
}

StreamError SessionStateMachine::apply(bool outgoing, MessageType type) {
  for (const Transition &t : transitions) {
    if (t.role == role_ && t.from == state_ && t.outgoing == outgoing &&
        t.type == type) {
      state_ = t.to;
      return StreamError::None;
    }
  }
  state_ = SessionState::Closed;
  return StreamError::ProtocolViolation;
}
