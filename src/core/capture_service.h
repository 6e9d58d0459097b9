// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_CAPTURE_SERVICE_H_
#define SCREENREC_CORE_CAPTURE_SERVICE_H_

#include <functional>
#include <memory>

#include "core/error.h"
#include "core/geometry.h"
#include "core/media_sample.h"

namespace screenrec {
namespace internal {

/// Frame and audio parameters for a capture stream.
struct FrameConfig {
  int fps = 30;
  bool show_cursor = false;
  bool capture_audio = false;
  bool audio_from_microphone = false;
  int audio_sample_rate = 44100;
  int audio_channels = 2;
};

/// Receives samples on the capture service's own threads.  Must not block.
using SampleSink = std::function<void(const MediaSample& sample)>;

/// Receives a failure that ended delivery of one kind mid-capture.  Called
/// on the failing delivery thread.  Must not block.
using StreamErrorSink = std::function<void(const Error& err)>;

/// A running (or ready-to-run) capture.  Not restartable.
///
/// Samples of one kind are delivered in order from one thread; video and
/// audio arrive on different threads and interleave freely.  After Stop()
/// returns no further samples are delivered.
class CaptureStream {
 public:
  virtual ~CaptureStream() = default;

  // Non-copyable.
  CaptureStream(const CaptureStream&) = delete;
  CaptureStream& operator=(const CaptureStream&) = delete;

  /// Register the sink for one kind.  Call before Start().
  virtual void AddSampleSink(MediaKind kind, SampleSink sink) = 0;

  /// Register the sink for mid-capture failures.  Call before Start().
  virtual void SetErrorSink(StreamErrorSink sink) = 0;

  virtual bool Start(Error* err) = 0;

  /// Stop delivery and join the delivery threads.
  virtual bool Stop(Error* err) = 0;

 protected:
  CaptureStream() = default;
};

/// Creates capture streams for a target.
class CaptureService {
 public:
  virtual ~CaptureService() = default;

  // Non-copyable.
  CaptureService(const CaptureService&) = delete;
  CaptureService& operator=(const CaptureService&) = delete;

  /// Null on failure, with `err` describing why (permission problems map
  /// to kScreenRecErrorPermissionDenied).
  virtual std::unique_ptr<CaptureStream> CreateStream(
      const CaptureTarget& target, const RecordingGeometry& geometry,
      const FrameConfig& config, Error* err) = 0;

 protected:
  CaptureService() = default;
};

/// Defined in platform/<os>/xxx_capture_service.cpp.
std::unique_ptr<CaptureService> CreatePlatformCaptureService();

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_CAPTURE_SERVICE_H_
