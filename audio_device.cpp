#include "audio_device.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "logger.hpp"

PortAudioSession::PortAudioSession() {
  err_ = Pa_Initialize();
  if (err_ != paNoError) {
    std::cerr << "PortAudio error: " << Pa_GetErrorText(err_) << std::endl;
  }
}

PortAudioSession::~PortAudioSession() {
  if (err_ == paNoError) {
    Pa_Terminate();
  }
}

bool format_to_pa_sample_format(const AudioFormat &format,
                                PaSampleFormat &sample_format) {
  SampleCodec codec;
  if (!sample_codec_for(format, codec)) {
    return false;
  }
  switch (codec) {
    case SampleCodec::Int16:
      sample_format = paInt16;
      break;
    case SampleCodec::Int32:
      sample_format = paInt32;
      break;
    case SampleCodec::Float32:
      sample_format = paFloat32;
      break;
  }
  return true;
}

StreamError default_input_config(DeviceConfig &config) {
  PaDeviceIndex device = Pa_GetDefaultInputDevice();
  if (device == paNoDevice) {
    std::cerr << "Error: No default input device." << std::endl;
    return StreamError::DeviceError;
  }
  const PaDeviceInfo *info = Pa_GetDeviceInfo(device);
  if (info == nullptr || info->maxInputChannels <= 0) {
    std::cerr << "Error: Default input device has no input channels."
              << std::endl;
    return StreamError::DeviceError;
  }

  config.device = device;
  config.format.sample_rate = static_cast<uint32_t>(info->defaultSampleRate);
  config.format.channels =
      static_cast<uint8_t>(std::min(info->maxInputChannels, 2));
  config.format.bits_per_sample = 16;
  config.format.sample_kind = SampleKind::Int;
  config.suggested_latency = info->defaultLowInputLatency;
  logMessage(std::string("Input device: ") + info->name + " (" +
             format_to_string(config.format) + ")");
  return StreamError::None;
}

StreamError default_output_config(const AudioFormat &format,
                                  DeviceConfig &config) {
  if (!is_supported_format(format)) {
    return StreamError::FormatError;
  }
  PaDeviceIndex device = Pa_GetDefaultOutputDevice();
  if (device == paNoDevice) {
    std::cerr << "Error: No default output device." << std::endl;
    return StreamError::DeviceError;
  }
  const PaDeviceInfo *info = Pa_GetDeviceInfo(device);
  if (info == nullptr) {
    return StreamError::DeviceError;
  }

  config.device = device;
  config.format = format;
  config.suggested_latency = info->defaultLowOutputLatency;
  logMessage(std::string("Output device: ") + info->name + " (" +
             format_to_string(format) + ")");
  return StreamError::None;
}

AudioStream::~AudioStream() {
  if (stream_ != nullptr) {
    if (Pa_IsStreamActive(stream_) == 1) {
      Pa_StopStream(stream_);
    }
    Pa_CloseStream(stream_);
  }
}

int AudioStream::pa_callback(const void *input, void *output,
                             unsigned long frames,
                             const PaStreamCallbackTimeInfo *time_info,
                             PaStreamCallbackFlags status_flags,
                             void *user_data) {
  (void)time_info;
  AudioStream *self = static_cast<AudioStream *>(user_data);
  if (status_flags != 0 && self->on_error_) {
    self->on_error_(status_flags);
  }
  if (self->on_output_ && output != nullptr) {
    self->on_output_(output, frames);
  }
  if (self->on_input_ && input != nullptr) {
    self->on_input_(input, frames);
  }
  return paContinue;
}

StreamError AudioStream::start() {
  PaError err = Pa_StartStream(stream_);
  if (err != paNoError) {
    std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    return StreamError::DeviceError;
  }
  return StreamError::None;
}

StreamError AudioStream::stop() {
  if (Pa_IsStreamStopped(stream_) == 1) {
    return StreamError::None;
  }
  PaError err = Pa_StopStream(stream_);
  if (err != paNoError) {
    std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    return StreamError::DeviceError;
  }
  return StreamError::None;
}

bool AudioStream::is_active() const { return Pa_IsStreamActive(stream_) == 1; }

static bool make_parameters(const DeviceConfig &config,
                            PaStreamParameters &parameters) {
  PaSampleFormat sample_format;
  if (!format_to_pa_sample_format(config.format, sample_format)) {
    return false;
  }
  parameters.device = config.device;
  parameters.channelCount = config.format.channels;
  parameters.sampleFormat = sample_format;
  parameters.suggestedLatency = config.suggested_latency;
  parameters.hostApiSpecificStreamInfo = NULL;
  return true;
}

static bool open_stream(PaStream **stream, const PaStreamParameters *input,
                        const PaStreamParameters *output, double sample_rate,
                        unsigned long frames_per_buffer,
                        PaStreamCallback *callback, void *user_data) {
  PaError err = Pa_IsFormatSupported(input, output, sample_rate);
  if (err != paFormatIsSupported) {
    std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    return false;
  }
  err = Pa_OpenStream(stream, input, output, sample_rate, frames_per_buffer,
                      paClipOff, callback, user_data);
  if (err != paNoError) {
    std::cerr << "PortAudio error: " << Pa_GetErrorText(err) << std::endl;
    return false;
  }
  return true;
}

std::unique_ptr<AudioStream> build_input_stream(const DeviceConfig &config,
                                                InputCallback on_input,
                                                StreamErrorCallback on_error) {
  PaStreamParameters parameters;
  if (!make_parameters(config, parameters)) {
    return nullptr;
  }
  std::unique_ptr<AudioStream> stream(new AudioStream());
  stream->on_input_ = std::move(on_input);
  stream->on_error_ = std::move(on_error);
  if (!open_stream(&stream->stream_, &parameters, NULL,
                   config.format.sample_rate, config.frames_per_buffer,
                   &AudioStream::pa_callback, stream.get())) {
    stream->stream_ = nullptr;
    return nullptr;
  }
  return stream;
}

std::unique_ptr<AudioStream> build_output_stream(
    const DeviceConfig &config, OutputCallback on_output,
    StreamErrorCallback on_error) {
  PaStreamParameters parameters;
  if (!make_parameters(config, parameters)) {
    return nullptr;
  }
  std::unique_ptr<AudioStream> stream(new AudioStream());
  stream->on_output_ = std::move(on_output);
  stream->on_error_ = std::move(on_error);
  if (!open_stream(&stream->stream_, NULL, &parameters,
                   config.format.sample_rate, config.frames_per_buffer,
                   &AudioStream::pa_callback, stream.get())) {
    stream->stream_ = nullptr;
    return nullptr;
  }
  return stream;
}

StreamError DefaultOutputDevice::open(const AudioFormat &format,
                                      OutputCallback on_output,
                                      StreamErrorCallback on_error) {
  audio_.reset(new PortAudioSession());
  if (!audio_->ok()) {
    return StreamError::DeviceError;
  }
  DeviceConfig config;
  StreamError err = default_output_config(format, config);
  if (err != StreamError::None) {
    return err;
  }
  stream_ = build_output_stream(config, std::move(on_output),
                                std::move(on_error));
  if (!stream_) {
    return StreamError::DeviceError;
  }
  return StreamError::None;
}

StreamError DefaultOutputDevice::start() {
  if (!stream_) {
    return StreamError::DeviceError;
  }
  return stream_->start();
}

StreamError DefaultOutputDevice::stop() {
  if (!stream_) {
    return StreamError::None;
  }
  return stream_->stop();
}
