#include "client.hpp"

#include <iostream>
#include <utility>

#include "logger.hpp"

StreamError Client::send(const Message &message) {
  if (!connection_) {
    return StreamError::IoError;
  }
  StreamError err = session_.on_send(message.type);
  if (err != StreamError::None) {
    return err;
  }
  return connection_->send_message(message);
}

StreamError Client::receive(Message &message) {
  if (!connection_) {
    return StreamError::IoError;
  }
  StreamError err = connection_->receive_message(message);
  if (err == StreamError::PeerClosed) {
    session_.on_peer_closed();
    logMessage(std::string("Server closed the connection while ") +
               session_state_to_string(session_.state()));
  }
  if (err != StreamError::None) {
    return err;
  }
  err = session_.on_receive(message.type);
  if (err != StreamError::None) {
    logMessage(std::string("Unexpected ") +
               message_type_to_string(message.type) + " from server");
  }
  return err;
}

StreamError Client::connect(const std::string &address, uint16_t port) {
  connection_ = Connection::connect_to(address, port);
  if (!connection_) {
    return StreamError::IoError;
  }
  logMessage("Connected to " + address + ":" + std::to_string(port));

  StreamError err = send(make_message(MessageType::Hello));
  if (err != StreamError::None) {
    return err;
  }
  Message message;
  err = receive(message);
  if (err != StreamError::None) {
    return err;
  }
  server_version_ = message.version;
  if (server_version_ != PROTOCOL_VERSION) {
    logMessage("Server speaks protocol version " +
               std::to_string(server_version_));
    connection_->close();
    session_.on_peer_closed();
    return StreamError::VersionMismatch;
  }
  err = send(make_message(MessageType::Ok));
  if (err != StreamError::None) {
    return err;
  }
  logMessage("Handshake complete, protocol version " +
             std::to_string(server_version_));
  return StreamError::None;
}

Client &Client::add_sink(std::unique_ptr<AudioWriter> sink) {
  sinks_.push_back(std::move(sink));
  return *this;
}

StreamError Client::receive_stream() {
  Message message;
  StreamError err = receive(message);
  if (err != StreamError::None) {
    return err;
  }
  format_ = message.format;
  logMessage("Received audio header: " + format_to_string(format_));
  for (auto &sink : sinks_) {
    err = sink->update_format(format_);
    if (err != StreamError::None) {
      return err;
    }
  }

  while (true) {
    err = receive(message);
    if (err != StreamError::None) {
      return err;
    }
    if (message.type == MessageType::StopPlaying) {
      logMessage("Stop message received");
      return StreamError::None;
    }
    if (message.format != format_) {
      logMessage("Data message in " + format_to_string(message.format) +
                 " during a " + format_to_string(format_) + " stream");
      return StreamError::FormatError;
    }
    ++data_messages_;
    bytes_received_ += message.payload.size();
    for (auto &sink : sinks_) {
      err = sink->write(message.payload.data(), message.payload.size());
      if (err != StreamError::None) {
        return err;
      }
    }
  }
}

StreamError Client::finalize_sinks() {
  if (sinks_finalized_) {
    return StreamError::None;
  }
  sinks_finalized_ = true;
  StreamError result = StreamError::None;
  for (auto &sink : sinks_) {
    StreamError err = sink->finalize();
    if (err != StreamError::None && result == StreamError::None) {
      result = err;
    }
  }
  return result;
}

void Client::abort_session() {
  if (connection_) {
    connection_->close();
  }
  session_.on_peer_closed();
}

Client::~Client() {
  StreamError err = finalize_sinks();
  if (err != StreamError::None) {
    std::cerr << "Failed to finalize output: " << stream_error_to_string(err)
              << std::endl;
  }
}

StreamError Client::start_playing() {
  if (sinks_finalized_) {
    return StreamError::ProtocolViolation;
  }
  StreamError err = send(make_message(MessageType::StartPlaying));
  if (err == StreamError::None) {
    err = receive_stream();
  }
  if (err != StreamError::None) {
    logMessage(std::string("Stream failed: ") + stream_error_to_string(err));
    abort_session();
  }
  return err;
}

StreamError Client::disconnect() {
  StreamError finalize_err = finalize_sinks();
  if (session_.is_closed()) {
    if (connection_) {
      connection_->close();
    }
    return finalize_err;
  }

  StreamError err = send(make_message(MessageType::Bye));
  if (err == StreamError::None) {
    Message message;
    err = receive(message);
  }
  if (connection_) {
    connection_->close();
  }
  if (err != StreamError::None) {
    return err;
  }
  logMessage("Disconnected.");
  return finalize_err;
}
