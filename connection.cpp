#include "connection.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

#include "config.hpp"
#include "logger.hpp"

Connection::Connection(int socket_fd) : socket_(socket_fd) {
  if (!set_receive_timeout(READ_TIMEOUT_MS)) {
    logMessage("Failed to set receive timeout");
  }
}

Connection::~Connection() { close(); }

std::unique_ptr<Connection> Connection::connect_to(const std::string &address,
                                                   uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(address.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    std::cerr << "Failed to resolve " << address << ": " << gai_strerror(rc)
              << std::endl;
    return nullptr;
  }

  int client_socket = -1;
  for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
    client_socket = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (client_socket == -1) {
      continue;
    }
    if (::connect(client_socket, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    ::close(client_socket);
    client_socket = -1;
  }
  freeaddrinfo(result);

  if (client_socket == -1) {
    std::cerr << "Failed to connect to server " << address << ":" << port
              << std::endl;
    return nullptr;
  }

  int nodelay = 1;
  if (setsockopt(client_socket, IPPROTO_TCP, TCP_NODELAY, &nodelay,
                 sizeof(nodelay)) < 0) {
    logMessage("TCP_NODELAY not set");
  }
  return std::unique_ptr<Connection>(new Connection(client_socket));
}

bool Connection::set_receive_timeout(int timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  return setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

void Connection::close() {
  if (socket_ != -1) {
    ::close(socket_);
    socket_ = -1;
  }
}

bool Connection::send_all(const uint8_t *data, size_t size) {
  while (size > 0) {
    ssize_t sent = ::send(socket_, data, size, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += sent;
    size -= static_cast<size_t>(sent);
  }
  return true;
}

StreamError Connection::send_message(const Message &message) {
  send_buffer_.clear();
  if (!encode_message(message, send_buffer_)) {
    logMessage(std::string("Refusing to encode ") +
               message_type_to_string(message.type));
    return StreamError::Malformed;
  }
  if (!send_all(send_buffer_.data(), send_buffer_.size())) {
    logMessage(std::string("send failed: ") + std::strerror(errno));
    return StreamError::IoError;
  }
  return StreamError::None;
}

StreamError Connection::receive_message(Message &message,
                                       int max_attempts) {
  uint8_t recv_buf[RECV_BUFFER_SIZE];
  int attempts = 0;
  while (true) {
    DecodeStatus status = reader_.next(message);
    if (status == DecodeStatus::Ok) {
      return StreamError::None;
    }
    if (status == DecodeStatus::Malformed) {
      return StreamError::Malformed;
    }

    ssize_t received = ::recv(socket_, recv_buf, sizeof(recv_buf), 0);
    if (received == 0) {
      return StreamError::PeerClosed;
    }
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (++attempts >= max_attempts) {
          return StreamError::Timeout;
        }
        continue;
      }
      logMessage(std::string("recv failed: ") + std::strerror(errno));
      return StreamError::IoError;
    }
    attempts = 0;
    reader_.feed(recv_buf, static_cast<size_t>(received));
  }
}
