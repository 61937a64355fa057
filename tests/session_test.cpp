#include <gtest/gtest.h>

#include "session.hpp"

static void complete_handshake(SessionStateMachine &client) {
  ASSERT_EQ(StreamError::None, client.on_send(MessageType::Hello));
  ASSERT_EQ(StreamError::None, client.on_receive(MessageType::Hello));
  ASSERT_EQ(StreamError::None, client.on_send(MessageType::Ok));
}

TEST(SessionTest, ClientFullSession) {
  SessionStateMachine client(SessionRole::Client);
  EXPECT_EQ(SessionState::Connected, client.state());
  EXPECT_EQ(StreamError::None, client.on_send(MessageType::Hello));
  EXPECT_EQ(StreamError::None, client.on_receive(MessageType::Hello));
  EXPECT_EQ(StreamError::None, client.on_send(MessageType::Ok));
  EXPECT_EQ(SessionState::Idle, client.state());

  EXPECT_EQ(StreamError::None, client.on_send(MessageType::StartPlaying));
  EXPECT_EQ(SessionState::AwaitingHeader, client.state());
  EXPECT_EQ(StreamError::None, client.on_receive(MessageType::AudioHeader));
  EXPECT_EQ(SessionState::Streaming, client.state());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(StreamError::None, client.on_receive(MessageType::Data));
  }
  EXPECT_EQ(StreamError::None, client.on_receive(MessageType::StopPlaying));
  EXPECT_EQ(SessionState::Idle, client.state());

  EXPECT_EQ(StreamError::None, client.on_send(MessageType::Bye));
  EXPECT_EQ(SessionState::AwaitingBye, client.state());
  EXPECT_EQ(StreamError::None, client.on_receive(MessageType::Bye));
  EXPECT_TRUE(client.is_closed());
}

TEST(SessionTest, ServerFullSessionWithTwoStreams) {
  SessionStateMachine server(SessionRole::Server);
  EXPECT_EQ(StreamError::None, server.on_receive(MessageType::Hello));
  EXPECT_EQ(StreamError::None, server.on_send(MessageType::Hello));
  EXPECT_EQ(StreamError::None, server.on_receive(MessageType::Ok));

  for (int stream = 0; stream < 2; ++stream) {
    EXPECT_EQ(StreamError::None, server.on_receive(MessageType::StartPlaying));
    EXPECT_EQ(StreamError::None, server.on_send(MessageType::AudioHeader));
    EXPECT_EQ(StreamError::None, server.on_send(MessageType::Data));
    EXPECT_EQ(StreamError::None, server.on_send(MessageType::StopPlaying));
    EXPECT_EQ(SessionState::Idle, server.state());
  }

  EXPECT_EQ(StreamError::None, server.on_receive(MessageType::Bye));
  EXPECT_EQ(SessionState::ReplyingBye, server.state());
  EXPECT_EQ(StreamError::None, server.on_send(MessageType::Bye));
  EXPECT_TRUE(server.is_closed());
}

TEST(SessionTest, DataBeforeHeaderIsViolation) {
  SessionStateMachine client(SessionRole::Client);
  complete_handshake(client);
  ASSERT_EQ(StreamError::None, client.on_send(MessageType::StartPlaying));

  EXPECT_EQ(StreamError::ProtocolViolation,
            client.on_receive(MessageType::Data));
  EXPECT_TRUE(client.is_closed());
  // no resynchronisation once closed
  EXPECT_EQ(StreamError::ProtocolViolation,
            client.on_receive(MessageType::AudioHeader));
}

TEST(SessionTest, ServerRejectsStartBeforeHandshake) {
  SessionStateMachine server(SessionRole::Server);
  EXPECT_EQ(StreamError::ProtocolViolation,
            server.on_receive(MessageType::StartPlaying));
  EXPECT_TRUE(server.is_closed());
}

TEST(SessionTest, ServerRejectsOkWithoutHello) {
  SessionStateMachine server(SessionRole::Server);
  ASSERT_EQ(StreamError::None, server.on_receive(MessageType::Hello));
  EXPECT_EQ(StreamError::ProtocolViolation,
            server.on_receive(MessageType::Ok));
}

TEST(SessionTest, ClientCannotSendWhileStreaming) {
  SessionStateMachine client(SessionRole::Client);
  complete_handshake(client);
  ASSERT_EQ(StreamError::None, client.on_send(MessageType::StartPlaying));
  ASSERT_EQ(StreamError::None, client.on_receive(MessageType::AudioHeader));
  EXPECT_EQ(StreamError::ProtocolViolation, client.on_send(MessageType::Bye));
}

TEST(SessionTest, PeerCloseIsNotAViolation) {
  SessionStateMachine server(SessionRole::Server);
  ASSERT_EQ(StreamError::None, server.on_receive(MessageType::Hello));
  server.on_peer_closed();
  EXPECT_EQ(SessionState::Closed, server.state());
}
