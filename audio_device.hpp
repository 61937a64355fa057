#pragma once

#include <portaudio.h>

#include <functional>
#include <memory>

#include "audio_format.hpp"
#include "config.hpp"
#include "errors.hpp"

// Pa_Initialize / Pa_Terminate for the lifetime of the object. PortAudio
// counts nested initialisations, so several sessions may coexist.
class PortAudioSession {
 public:
  PortAudioSession();
  ~PortAudioSession();

  PortAudioSession(const PortAudioSession &) = delete;
  PortAudioSession &operator=(const PortAudioSession &) = delete;

  bool ok() const { return err_ == paNoError; }

 private:
  PaError err_;
};

struct DeviceConfig {
  PaDeviceIndex device = paNoDevice;
  AudioFormat format;
  PaTime suggested_latency = 0;
  unsigned long frames_per_buffer = FRAMES_PER_BUFFER;
};

bool format_to_pa_sample_format(const AudioFormat &format,
                                PaSampleFormat &sample_format);

// Default capture device at its native rate, 16-bit, up to two channels.
StreamError default_input_config(DeviceConfig &config);
// Default playback device opened in the negotiated format (no resampling).
StreamError default_output_config(const AudioFormat &format,
                                  DeviceConfig &config);

// Run on the PortAudio callback thread: no blocking, no allocation.
using InputCallback = std::function<void(const void *input, unsigned long frames)>;
using OutputCallback = std::function<void(void *output, unsigned long frames)>;
using StreamErrorCallback = std::function<void(PaStreamCallbackFlags flags)>;

class AudioStream {
 public:
  ~AudioStream();

  AudioStream(const AudioStream &) = delete;
  AudioStream &operator=(const AudioStream &) = delete;

  StreamError start();
  StreamError stop();
  bool is_active() const;

 private:
  friend std::unique_ptr<AudioStream> build_input_stream(
      const DeviceConfig &, InputCallback, StreamErrorCallback);
  friend std::unique_ptr<AudioStream> build_output_stream(
      const DeviceConfig &, OutputCallback, StreamErrorCallback);

  AudioStream() = default;

  static int pa_callback(const void *input, void *output,
                         unsigned long frames,
                         const PaStreamCallbackTimeInfo *time_info,
                         PaStreamCallbackFlags status_flags, void *user_data);

  PaStream *stream_ = nullptr;
  InputCallback on_input_;
  OutputCallback on_output_;
  StreamErrorCallback on_error_;
};

std::unique_ptr<AudioStream> build_input_stream(const DeviceConfig &config,
                                                InputCallback on_input,
                                                StreamErrorCallback on_error);
std::unique_ptr<AudioStream> build_output_stream(const DeviceConfig &config,
                                                 OutputCallback on_output,
                                                 StreamErrorCallback on_error);

// Output side of a playback sink. DefaultOutputDevice plays through the
// default PortAudio output device.
class OutputDevice {
 public:
  virtual ~OutputDevice() {}

  // Opens a stream in the given format without starting it.
  virtual StreamError open(const AudioFormat &format, OutputCallback on_output,
                           StreamErrorCallback on_error) = 0;
  virtual StreamError start() = 0;
  // No-op when nothing is open or running.
  virtual StreamError stop() = 0;
};

class DefaultOutputDevice : public OutputDevice {
 public:
  StreamError open(const AudioFormat &format, OutputCallback on_output,
                   StreamErrorCallback on_error) override;
  StreamError start() override;
  StreamError stop() override;

 private:
  // Outlives stream_: the stream must close before Pa_Terminate
  std::unique_ptr<PortAudioSession> audio_;
  std::unique_ptr<AudioStream> stream_;
};
