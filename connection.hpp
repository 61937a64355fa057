#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "protocol.hpp"

// Owns one connected TCP socket. Not shared between threads.
class Connection {
 public:
  explicit Connection(int socket_fd);
  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  static std::unique_ptr<Connection> connect_to(const std::string &address,
                                                uint16_t port);

  StreamError send_message(const Message &message);

  // Blocks until a whole message is available. A 0-byte read gives
  // PeerClosed; max_attempts receive timeouts in a row give Timeout. Bytes of
  // a partial message stay buffered across a Timeout.
  StreamError receive_message(Message &message,
                              int max_attempts = MAX_READ_ATTEMPTS);

  bool set_receive_timeout(int timeout_ms);
  void close();
  int socket() const { return socket_; }

 private:
  bool send_all(const uint8_t *data, size_t size);

  int socket_;
  MessageReader reader_;
  std::vector<uint8_t> send_buffer_;
};
