// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_PLATFORM_LINUX_X11_AUDIO_SOURCE_H_
#define SCREENREC_PLATFORM_LINUX_X11_AUDIO_SOURCE_H_

#include <atomic>
#include <cstdint>
#include <thread>

#include "core/capture_service.h"

struct pa_simple;

namespace screenrec {
namespace internal {

/// PulseAudio capture of the default monitor (system audio) or the default
/// input (microphone).  Delivers 10 ms S16LE chunks from its own thread.
class PulseAudioSource {
 public:
  PulseAudioSource(bool from_microphone, int sample_rate, int channels);
  ~PulseAudioSource();

  PulseAudioSource(const PulseAudioSource&) = delete;
  PulseAudioSource& operator=(const PulseAudioSource&) = delete;

  /// Connect to the server.  Failure maps to kScreenRecErrorCaptureStart,
  /// or kScreenRecErrorPermissionDenied when access is refused.
  bool Open(Error* err);

  /// Begin delivering to `sink`.  A failed read ends the capture thread and
  /// is reported once through `on_error`.
  bool Start(SampleSink sink, StreamErrorSink on_error, Error* err);

  /// Stop reading and join the capture thread.
  void Stop();

  int64_t read_failures() const { return read_failures_.load(); }

 private:
  void CaptureLoop();

  bool from_microphone_;
  int sample_rate_;
  int channels_;

  pa_simple* pa_simple_ = nullptr;
  SampleSink sink_;
  StreamErrorSink on_error_;

  std::thread capture_thread_;
  std::atomic<bool> capturing_{false};
  std::atomic<int64_t> read_failures_{0};
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_PLATFORM_LINUX_X11_AUDIO_SOURCE_H_
