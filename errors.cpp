#include "errors.hpp"

const char *stream_error_to_string(StreamError error) {
  switch (error) {
    case StreamError::None:
      return "no error";
    case StreamError::PeerClosed:
      return "connection closed by peer";
    case StreamError::Timeout:
      return "peer is not responding";
    case StreamError::IoError:
      return "socket error";
    case StreamError::Malformed:
      return "malformed message";
    case StreamError::ProtocolViolation:
      return "unexpected message";
    case StreamError::VersionMismatch:
      return "protocol version mismatch";
    case StreamError::FormatError:
      return "unsupported audio format";
    case StreamError::DeviceError:
      return "audio device error";
    case StreamError::FileError:
      return "audio file error";
  }
  return "unknown error";
}
