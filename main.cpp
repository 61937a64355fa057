#include <getopt.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "client.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "microphone.hpp"
#include "realtime_playback.hpp"
#include "server.hpp"
#include "wav_file.hpp"

struct Options {
  std::string mode;
  int duration = DEFAULT_RECORD_SECONDS;
  std::string path;
  std::string output;
  std::string address = DEFAULT_ADDRESS;
  int port = DEFAULT_PORT;
  bool play = false;
};

static Server *running_server = nullptr;

void signal_handler(int signal) {
  if (signal == SIGINT && running_server != nullptr) {
    running_server->stop();
  }
}

static void print_usage(const char *program) {
  std::cout
      << "Usage: " << program << " --mode MODE [options]\n"
      << "  -m, --mode      server | client | record | play\n"
      << "  -a, --address   server address (default " << DEFAULT_ADDRESS
      << ")\n"
      << "  -P, --port      server port (default " << DEFAULT_PORT << ")\n"
      << "  -p, --path      WAV file to stream (server) or play (play);\n"
      << "                  a server without a path streams the microphone\n"
      << "  -o, --output    WAV file to write (client, record)\n"
      << "  -d, --duration  capture length in seconds (record, server mic)\n"
      << "      --play      play the stream while receiving (client)\n";
}

static bool parse_options(int argc, char **argv, Options &options) {
  static const struct option long_options[] = {
      {"mode", required_argument, NULL, 'm'},
      {"address", required_argument, NULL, 'a'},
      {"port", required_argument, NULL, 'P'},
      {"path", required_argument, NULL, 'p'},
      {"output", required_argument, NULL, 'o'},
      {"duration", required_argument, NULL, 'd'},
      {"play", no_argument, NULL, 'y'},
      {"help", no_argument, NULL, 'h'},
      {NULL, 0, NULL, 0}};

  int opt;
  while ((opt = getopt_long(argc, argv, "m:a:P:p:o:d:h", long_options,
                            NULL)) != -1) {
    switch (opt) {
      case 'm':
        options.mode = optarg;
        break;
      case 'a':
        options.address = optarg;
        break;
      case 'P':
        options.port = std::atoi(optarg);
        break;
      case 'p':
        options.path = optarg;
        break;
      case 'o':
        options.output = optarg;
        break;
      case 'd':
        options.duration = std::atoi(optarg);
        break;
      case 'y':
        options.play = true;
        break;
      default:
        return false;
    }
  }
  if (options.port <= 0 || options.port > 65535) {
    std::cerr << "Invalid port." << std::endl;
    return false;
  }
  if (options.duration <= 0) {
    std::cerr << "Invalid duration." << std::endl;
    return false;
  }
  return !options.mode.empty();
}

static int run_server(const Options &options) {
  set_log_file("server.log");
  ServerConfig config;
  config.address = options.address;
  config.port = static_cast<uint16_t>(options.port);
  config.file_path = options.path;
  config.source =
      options.path.empty() ? SourceKind::Microphone : SourceKind::WavFile;
  config.capture_seconds = options.duration;

  Server server(config);
  if (!server.start()) {
    return 2;
  }
  running_server = &server;
  signal(SIGINT, signal_handler);
  std::cout << "Press Ctrl+C to stop the server." << std::endl;
  server.run();
  running_server = nullptr;
  return 0;
}

static int run_client(const Options &options) {
  set_log_file("client.log");
  if (options.output.empty() && !options.play) {
    std::cerr << "Nothing to do with the stream: give --output and/or --play."
              << std::endl;
    return 1;
  }

  Client client;
  if (!options.output.empty()) {
    client.add_sink(std::unique_ptr<AudioWriter>(
        new WavFileWriter(options.output)));
  }
  if (options.play) {
    client.add_sink(std::unique_ptr<AudioWriter>(new RealtimePlayback()));
  }

  StreamError err =
      client.connect(options.address, static_cast<uint16_t>(options.port));
  if (err != StreamError::None) {
    std::cerr << "Handshake failed: " << stream_error_to_string(err)
              << std::endl;
    return 2;
  }
  std::cout << "Connected to server. Waiting for audio..." << std::endl;

  err = client.start_playing();
  if (err != StreamError::None) {
    std::cerr << "Streaming failed: " << stream_error_to_string(err)
              << std::endl;
    return 3;
  }
  std::cout << "Received " << client.bytes_received() << " bytes ("
            << format_to_string(client.format()) << ")" << std::endl;

  err = client.disconnect();
  if (err != StreamError::None) {
    std::cerr << "Disconnect failed: " << stream_error_to_string(err)
              << std::endl;
    return 4;
  }
  std::cout << "Client shut down successfully." << std::endl;
  return 0;
}

static int run_record(const Options &options) {
  set_log_file("record.log");
  std::string path = options.output.empty() ? "recording.wav" : options.output;
  StreamError err = record_audio(options.duration, path);
  if (err != StreamError::None) {
    std::cerr << "Recording failed: " << stream_error_to_string(err)
              << std::endl;
    return 2;
  }
  return 0;
}

static int run_play(const Options &options) {
  if (options.path.empty()) {
    std::cerr << "play needs --path." << std::endl;
    return 1;
  }
  StreamError err = play_wav_file(options.path);
  if (err != StreamError::None) {
    std::cerr << "Playback failed: " << stream_error_to_string(err)
              << std::endl;
    return 2;
  }
  return 0;
}

int main(int argc, char **argv) {
  Options options;
  if (!parse_options(argc, argv, options)) {
    print_usage(argv[0]);
    return 1;
  }

  if (options.mode == "server") {
    return run_server(options);
  }
  if (options.mode == "client") {
    return run_client(options);
  }
  if (options.mode == "record") {
    return run_record(options);
  }
  if (options.mode == "play") {
    return run_play(options);
  }
  print_usage(argv[0]);
  return 1;
}
