// Copyright 2026 The screenrec Authors
// PulseAudio Simple API capture for the Linux capture service.

#include "platform/linux/x11_audio_source.h"

#include <chrono>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "core/logger.h"

#include <pulse/simple.h>
#include <pulse/error.h>

namespace screenrec {
namespace internal {

PulseAudioSource::PulseAudioSource(bool from_microphone, int sample_rate,
                                   int channels)
    : from_microphone_(from_microphone),
      sample_rate_(sample_rate > 0 ? sample_rate : 44100),
      channels_(channels > 0 ? channels : 2) {}

PulseAudioSource::~PulseAudioSource() {
  Stop();
  if (pa_simple_) {
    pa_simple_free(pa_simple_);
    pa_simple_ = nullptr;
  }
}

bool PulseAudioSource::Open(Error* err) {
  if (pa_simple_) return true;

  pa_sample_spec spec = {};
  spec.format = PA_SAMPLE_S16LE;
  spec.rate = static_cast<uint32_t>(sample_rate_);
  spec.channels = static_cast<uint8_t>(channels_);

  // nullptr = PulseAudio default source (microphone).
  const char* pa_device = from_microphone_ ? nullptr : "@DEFAULT_MONITOR@";

  int error = 0;
  pa_simple_ = pa_simple_new(nullptr, "screenrec", PA_STREAM_RECORD,
                             pa_device,
                             from_microphone_ ? "microphone" : "system audio",
                             &spec, nullptr, nullptr, &error);
  if (!pa_simple_) {
    if (error == PA_ERR_ACCESS || error == PA_ERR_AUTHKEY) {
      return Fail(err, kScreenRecErrorPermissionDenied,
                  std::string("Audio capture was refused: ") +
                      pa_strerror(error),
                  "Allow screenrec to record audio in your sound settings");
    }
    return Fail(err, kScreenRecErrorCaptureStart,
                std::string("PulseAudio connection failed: ") +
                    pa_strerror(error),
                "Check that PulseAudio or PipeWire-Pulse is running");
  }

  SCREENREC_LOG_INFO("PulseAudio capture opened: {}Hz, {}ch, device={}",
                     sample_rate_, channels_,
                     pa_device ? pa_device : "default");
  return true;
}

bool PulseAudioSource::Start(SampleSink sink, StreamErrorSink on_error,
                             Error* err) {
  if (!pa_simple_ && !Open(err)) return false;
  if (capturing_.load()) return true;

  sink_ = std::move(sink);
  on_error_ = std::move(on_error);
  capturing_.store(true, std::memory_order_release);
  capture_thread_ = std::thread(&PulseAudioSource::CaptureLoop, this);
  return true;
}

void PulseAudioSource::Stop() {
  capturing_.store(false, std::memory_order_release);
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
}

void PulseAudioSource::CaptureLoop() {
  // Read buffer: 10ms of audio at a time.
  const int frames_per_read = sample_rate_ / 100;
  const size_t bytes_per_read =
      static_cast<size_t>(frames_per_read) * channels_ * sizeof(int16_t);
  const auto chunk_duration = std::chrono::nanoseconds(
      static_cast<int64_t>(frames_per_read) * 1000000000LL / sample_rate_);

  while (capturing_.load(std::memory_order_acquire)) {
    MediaSample sample;
    sample.kind = MediaKind::kAudio;
    sample.sample_rate = sample_rate_;
    sample.channels = channels_;
    sample.data.resize(bytes_per_read);

    int error = 0;
    if (pa_simple_read(pa_simple_, sample.data.data(), bytes_per_read,
                       &error) < 0) {
      ++read_failures_;
      SCREENREC_LOG_ERROR("pa_simple_read failed: {}", pa_strerror(error));
      if (capturing_.load(std::memory_order_acquire) && on_error_) {
        Error e;
        e.Set(kScreenRecErrorCaptureFailed,
              std::string("Audio capture stopped: ") + pa_strerror(error),
              "Check that PulseAudio or PipeWire-Pulse is still running");
        on_error_(e);
      }
      break;
    }
    if (!capturing_.load(std::memory_order_acquire)) break;

    // The chunk ends now; stamp its first frame.
    auto start = std::chrono::steady_clock::now() - chunk_duration;
    sample.timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                              start.time_since_epoch())
                              .count();
    if (sink_) sink_(sample);
  }
}

}  // namespace internal
}  // namespace screenrec
