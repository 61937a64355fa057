#pragma once

enum class StreamError {
  None = 0,
  PeerClosed,         // 0-byte read, the peer closed the socket cleanly
  Timeout,            // no message after MAX_READ_ATTEMPTS reads
  IoError,            // socket failure
  Malformed,          // framing lost, the connection cannot continue
  ProtocolViolation,  // message not allowed in the current session state
  VersionMismatch,
  FormatError,        // unsupported sample kind / bit depth
  DeviceError,        // PortAudio stream failure
  FileError,          // libsndfile failure
};

const char *stream_error_to_string(StreamError error);
