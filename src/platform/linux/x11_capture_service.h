// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_PLATFORM_LINUX_X11_CAPTURE_SERVICE_H_
#define SCREENREC_PLATFORM_LINUX_X11_CAPTURE_SERVICE_H_

#include <atomic>
#include <memory>
#include <thread>

#include "core/capture_service.h"
#include "platform/linux/x11_audio_source.h"

namespace screenrec {
namespace internal {

/// Copies `src_rect` of an X screen (clipped to the screen) into a packed
/// BGRA frame of `out_w` x `out_h`.  Uncovered pixels are opaque black.
bool GrabX11Frame(void* display, int screen, const PixelRect& src_rect,
                  int out_w, int out_h, MediaSample* out);

/// Paints a small arrow at (`x`, `y`) of a BGRA frame.
void DrawCursorMarker(MediaSample* frame, int x, int y);

/// Polls the X server with XGetImage at the configured frame rate, and
/// optionally runs a PulseAudio source alongside.
class X11CaptureStream : public CaptureStream {
 public:
  X11CaptureStream(const CaptureTarget& target,
                   const RecordingGeometry& geometry,
                   const FrameConfig& config);
  ~X11CaptureStream() override;

  void AddSampleSink(MediaKind kind, SampleSink sink) override;
  void SetErrorSink(StreamErrorSink sink) override;
  bool Start(Error* err) override;
  bool Stop(Error* err) override;

 private:
  void FrameLoop();
  bool CaptureOne(MediaSample* out);

  CaptureTarget target_;
  RecordingGeometry geometry_;
  FrameConfig config_;

  SampleSink video_sink_;
  SampleSink audio_sink_;
  StreamErrorSink error_sink_;

  void* display_ = nullptr;  // Display* owned by the frame thread
  std::unique_ptr<PulseAudioSource> audio_;

  std::thread frame_thread_;
  std::atomic<bool> running_{false};
  bool started_ = false;
  int64_t failed_grabs_ = 0;
};

class X11CaptureService : public CaptureService {
 public:
  X11CaptureService() = default;

  std::unique_ptr<CaptureStream> CreateStream(
      const CaptureTarget& target, const RecordingGeometry& geometry,
      const FrameConfig& config, Error* err) override;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_PLATFORM_LINUX_X11_CAPTURE_SERVICE_H_
