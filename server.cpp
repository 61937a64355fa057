#include "server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include "audio_io.hpp"
#include "logger.hpp"
#include "microphone.hpp"
#include "session.hpp"
#include "wav_file.hpp"

static StreamError receive_step(Connection &connection,
                                SessionStateMachine &session,
                                Message &message, int max_attempts) {
  StreamError err = connection.receive_message(message, max_attempts);
  if (err == StreamError::PeerClosed) {
    session.on_peer_closed();
  }
  if (err != StreamError::None) {
    return err;
  }
  err = session.on_receive(message.type);
  if (err != StreamError::None) {
    logMessage(std::string("Unexpected ") +
               message_type_to_string(message.type) + " from client");
  }
  return err;
}

// The client may sit idle for as long as it likes between commands, for
// example while its playback drains before BYE.
static StreamError wait_for_command(Connection &connection,
                                    SessionStateMachine &session,
                                    Message &message,
                                    const std::atomic<bool> *running,
                                    bool &stopped) {
  stopped = false;
  while (true) {
    StreamError err = receive_step(connection, session, message, 1);
    if (err != StreamError::Timeout) {
      return err;
    }
    if (running != nullptr && !*running) {
      logMessage("Server stopping, closing idle session");
      stopped = true;
      return StreamError::None;
    }
  }
}

static StreamError send_step(Connection &connection,
                             SessionStateMachine &session,
                             const Message &message) {
  StreamError err = session.on_send(message.type);
  if (err != StreamError::None) {
    return err;
  }
  return connection.send_message(message);
}

static StreamError open_source(const ServerConfig &config,
                               std::unique_ptr<AudioReader> &source) {
  if (config.source == SourceKind::Microphone) {
    std::unique_ptr<MicrophoneReader> microphone(
        new MicrophoneReader(config.capture_seconds));
    StreamError err = microphone->open();
    if (err != StreamError::None) {
      return err;
    }
    source = std::move(microphone);
    return StreamError::None;
  }

  std::unique_ptr<WavFileReader> file(new WavFileReader());
  StreamError err = file->open(config.file_path);
  if (err != StreamError::None) {
    return err;
  }
  source = std::move(file);
  return StreamError::None;
}

static StreamError stream_audio(Connection &connection,
                                SessionStateMachine &session,
                                const ServerConfig &config) {
  std::unique_ptr<AudioReader> source;
  StreamError err = open_source(config, source);
  if (err != StreamError::None) {
    return err;
  }

  const AudioFormat format = source->format();
  err = send_step(connection, session, make_audio_header(format));
  if (err != StreamError::None) {
    return err;
  }

  uint8_t buffer[READ_CHUNK_SIZE];
  size_t messages = 0;
  while (true) {
    size_t n = 0;
    err = source->read(buffer, sizeof(buffer), n);
    if (err != StreamError::None) {
      return err;
    }
    if (n == 0) {
      break;
    }
    err = send_step(connection, session, make_data_message(format, buffer, n));
    if (err != StreamError::None) {
      return err;
    }
    ++messages;
  }
  logMessage("Sent " + std::to_string(messages) + " data messages");

  return send_step(connection, session,
                   make_message(MessageType::StopPlaying));
}

StreamError serve_client(Connection &connection, const ServerConfig &config,
                         const std::atomic<bool> *running) {
  SessionStateMachine session(SessionRole::Server);
  Message message;

  StreamError err =
      receive_step(connection, session, message, config.read_attempts);
  if (err != StreamError::None) {
    return err;
  }
  if (message.version != PROTOCOL_VERSION) {
    logMessage("Client speaks protocol version " +
               std::to_string(message.version));
    return StreamError::VersionMismatch;
  }
  err = send_step(connection, session, make_message(MessageType::Hello));
  if (err != StreamError::None) {
    return err;
  }
  err = receive_step(connection, session, message, config.read_attempts);
  if (err != StreamError::None) {
    return err;
  }
  logMessage("Handshake complete");

  while (!session.is_closed()) {
    bool stopped = false;
    err = wait_for_command(connection, session, message, running, stopped);
    if (err != StreamError::None || stopped) {
      return err;
    }
    switch (message.type) {
      case MessageType::StartPlaying:
        logMessage("Received START_PLAYING from client");
        err = stream_audio(connection, session, config);
        if (err != StreamError::None) {
          return err;
        }
        logMessage("Finished sending audio to client");
        break;
      case MessageType::Bye:
        return send_step(connection, session, make_message(MessageType::Bye));
      default:
        // the state machine only lets the above through
        return StreamError::ProtocolViolation;
    }
  }
  return StreamError::None;
}

static void handle_client(int client_socket, ServerConfig config,
                          const std::atomic<bool> *running,
                          std::shared_ptr<std::atomic<bool>> done) {
  Connection connection(client_socket);
  StreamError err = serve_client(connection, config, running);
  if (err == StreamError::None || err == StreamError::PeerClosed) {
    logMessage("Client disconnected.");
  } else {
    std::cerr << "Client connection error: " << stream_error_to_string(err)
              << std::endl;
    logMessage(std::string("Dropping client: ") + stream_error_to_string(err));
  }
  connection.close();
  *done = true;
}

Server::Server(ServerConfig config) : config_(std::move(config)) {}

Server::~Server() {
  stop();
  reap_sessions(true);
  if (server_socket_ != -1) {
    close(server_socket_);
  }
}

bool Server::start() {
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ == -1) {
    std::cerr << "Failed to create socket." << std::endl;
    return false;
  }
  int reuse = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &reuse,
                 sizeof(reuse)) < 0) {
    logMessage("SO_REUSEADDR not set");
  }

  struct sockaddr_in server_address;
  std::memset(&server_address, 0, sizeof(server_address));
  server_address.sin_family = AF_INET;
  server_address.sin_port = htons(config_.port);
  if (inet_pton(AF_INET, config_.address.c_str(), &server_address.sin_addr) !=
      1) {
    std::cerr << "Invalid listen address " << config_.address << std::endl;
    return false;
  }

  if (bind(server_socket_, (struct sockaddr *)&server_address,
           sizeof(server_address)) < 0) {
    std::cerr << "Bind failed: " << std::strerror(errno) << std::endl;
    return false;
  }
  if (listen(server_socket_, LISTEN_BACKLOG) < 0) {
    std::cerr << "Listen failed." << std::endl;
    return false;
  }

  socklen_t length = sizeof(server_address);
  if (getsockname(server_socket_, (struct sockaddr *)&server_address,
                  &length) < 0) {
    std::cerr << "getsockname failed: " << std::strerror(errno) << std::endl;
    return false;
  }
  bound_port_ = ntohs(server_address.sin_port);
  running_ = true;

  std::cout << "Server listening on " << config_.address << ":" << bound_port_
            << std::endl;
  logMessage("Server listening on " + config_.address + ":" +
             std::to_string(bound_port_));
  return true;
}

void Server::run() {
  while (running_) {
    int client_socket = accept(server_socket_, NULL, NULL);
    if (client_socket < 0) {
      if (!running_) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      std::cerr << "Accept failed: " << std::strerror(errno) << std::endl;
      break;
    }

    logMessage("New connection");
    reap_sessions(false);
    Session session;
    session.done = std::make_shared<std::atomic<bool>>(false);
    session.thread =
        std::thread(handle_client, client_socket, config_, &running_,
                    session.done);
    sessions_.push_back(std::move(session));
  }

  reap_sessions(true);
  std::cout << "Server shut down successfully." << std::endl;
}

void Server::stop() {
  running_ = false;
  if (server_socket_ != -1) {
    shutdown(server_socket_, SHUT_RDWR);
  }
}

void Server::reap_sessions(bool wait_all) {
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (wait_all || *it->done) {
      it->thread.join();
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}
