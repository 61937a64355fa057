#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "connection.hpp"
#include "errors.hpp"

enum class SourceKind {
  WavFile,
  Microphone,
};

// Read-only once the server is started; every session gets its own copy.
struct ServerConfig {
  std::string address = DEFAULT_ADDRESS;
  uint16_t port = DEFAULT_PORT;
  SourceKind source = SourceKind::WavFile;
  std::string file_path;
  int capture_seconds = DEFAULT_RECORD_SECONDS;
  // Receive timeouts allowed while a reply is due. An idle client waiting
  // between commands is not bounded by this.
  int read_attempts = MAX_READ_ATTEMPTS;
};

// Drives the server side of one connection until BYE, peer close or error.
// While idle the session waits for the next command for as long as *running
// stays true (forever when running is null).
StreamError serve_client(Connection &connection, const ServerConfig &config,
                         const std::atomic<bool> *running = nullptr);

class Server {
 public:
  explicit Server(ServerConfig config);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  bool start();
  // Accepts connections until stop(), one thread per client. Returns after
  // all client threads have finished.
  void run();
  // Safe to call from a signal handler.
  void stop();

  uint16_t port() const { return bound_port_; }

 private:
  struct Session {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_sessions(bool wait_all);

  ServerConfig config_;
  std::atomic<bool> running_{false};
  int server_socket_ = -1;
  uint16_t bound_port_ = 0;
  std::vector<Session> sessions_;
};
