#pragma once

#define DEFAULT_ADDRESS "127.0.0.1"
#define DEFAULT_PORT 8080
#define DEFAULT_RECORD_SECONDS 3
#define LOG_FILE "rstream.log"

// Bytes read from an audio source per Data message
#define READ_CHUNK_SIZE 4096
#define RECV_BUFFER_SIZE 4096

#define FRAMES_PER_BUFFER 512
// Fixed capacity of the playback ring: 1 MiB (~5 s of 48 kHz stereo int16)
#define PLAYBACK_BUFFER_BYTES (1 << 20)
#define CAPTURE_BUFFER_BYTES (1 << 20)

#define READ_TIMEOUT_MS 1000
#define MAX_READ_ATTEMPTS 10
#define LISTEN_BACKLOG 16

// Extra time given to the audio device to play out the queued bytes
#define DRAIN_GRACE_MS 2000
// How long a producer waits on a full playback ring before giving up on the
// device
#define PUSH_STALL_MS 2000
