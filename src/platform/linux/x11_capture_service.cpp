// Copyright 2026 The screenrec Authors

#include "platform/linux/x11_capture_service.h"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "core/logger.h"
#include "platform/linux/x11_enumeration_service.h"

namespace screenrec {
namespace internal {

namespace {

constexpr int kCursorHeight = 16;

int64_t MonotonicNowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// Copy an XImage into the BGRA frame at (dst_x, dst_y).
void BlitXImage(XImage* ximg, uint8_t* frame, int frame_stride, int dst_x,
                int dst_y) {
  const int w = ximg->width;
  const int h = ximg->height;

  // Fast path: 32bpp little-endian with standard RGB masks (most common).
  // In-memory layout is already B G R pad.
  if (ximg->bits_per_pixel == 32 && ximg->byte_order == LSBFirst &&
      ximg->red_mask == 0xFF0000 && ximg->green_mask == 0x00FF00 &&
      ximg->blue_mask == 0x0000FF) {
    for (int y = 0; y < h; ++y) {
      const uint8_t* src = reinterpret_cast<const uint8_t*>(ximg->data) +
                           static_cast<ptrdiff_t>(y) * ximg->bytes_per_line;
      uint8_t* dst = frame +
                     static_cast<ptrdiff_t>(dst_y + y) * frame_stride +
                     static_cast<ptrdiff_t>(dst_x) * 4;
      std::memcpy(dst, src, static_cast<size_t>(w) * 4);
      for (int x = 0; x < w; ++x) dst[x * 4 + 3] = 0xFF;
    }
    return;
  }

  // Generic fallback via XGetPixel.
  for (int y = 0; y < h; ++y) {
    uint8_t* dst = frame + static_cast<ptrdiff_t>(dst_y + y) * frame_stride +
                   static_cast<ptrdiff_t>(dst_x) * 4;
    for (int x = 0; x < w; ++x) {
      unsigned long px = XGetPixel(ximg, x, y);
      dst[x * 4 + 0] = static_cast<uint8_t>((px >> 0) & 0xFF);
      dst[x * 4 + 1] = static_cast<uint8_t>((px >> 8) & 0xFF);
      dst[x * 4 + 2] = static_cast<uint8_t>((px >> 16) & 0xFF);
      dst[x * 4 + 3] = 0xFF;
    }
  }
}

}  // namespace

bool GrabX11Frame(void* display, int screen, const PixelRect& src_rect,
                  int out_w, int out_h, MediaSample* out) {
  auto* dpy = static_cast<Display*>(display);
  if (!dpy || !out || out_w <= 0 || out_h <= 0) return false;

  out->kind = MediaKind::kVideo;
  out->width = out_w;
  out->height = out_h;
  out->stride = out_w * 4;
  out->data.assign(static_cast<size_t>(out->stride) * out_h, 0);
  for (size_t i = 3; i < out->data.size(); i += 4) out->data[i] = 0xFF;

  const int scr_w = DisplayWidth(dpy, screen);
  const int scr_h = DisplayHeight(dpy, screen);

  // Clip the source rect to the screen; the uncovered part stays black.
  int x = src_rect.x;
  int y = src_rect.y;
  int w = std::min(src_rect.width, out_w);
  int h = std::min(src_rect.height, out_h);
  int dst_x = 0;
  int dst_y = 0;
  if (x < 0) { dst_x = -x; w += x; x = 0; }
  if (y < 0) { dst_y = -y; h += y; y = 0; }
  if (x + w > scr_w) w = scr_w - x;
  if (y + h > scr_h) h = scr_h - y;
  if (w <= 0 || h <= 0) return true;

  XImage* ximg = XGetImage(dpy, RootWindow(dpy, screen), x, y,
                           static_cast<unsigned>(w), static_cast<unsigned>(h),
                           AllPlanes, ZPixmap);
  if (!ximg) return false;
  BlitXImage(ximg, out->data.data(), out->stride, dst_x, dst_y);
  XDestroyImage(ximg);
  return true;
}

void DrawCursorMarker(MediaSample* frame, int x, int y) {
  if (!frame || frame->data.empty()) return;
  for (int r = 0; r < kCursorHeight; ++r) {
    const int span = (r * 5) / 8;
    for (int c = 0; c <= span; ++c) {
      const int px = x + c;
      const int py = y + r;
      if (px < 0 || py < 0 || px >= frame->width || py >= frame->height) {
        continue;
      }
      const bool edge = (c == 0 || c == span || r == kCursorHeight - 1);
      const uint8_t v = edge ? 0x00 : 0xFF;
      uint8_t* p = frame->data.data() +
                   static_cast<ptrdiff_t>(py) * frame->stride + px * 4;
      p[0] = v;
      p[1] = v;
      p[2] = v;
      p[3] = 0xFF;
    }
  }
}

// -----------------------------------------------------------------------

X11CaptureStream::X11CaptureStream(const CaptureTarget& target,
                                   const RecordingGeometry& geometry,
                                   const FrameConfig& config)
    : target_(target), geometry_(geometry), config_(config) {}

X11CaptureStream::~X11CaptureStream() {
  Error ignored;
  Stop(&ignored);
  if (display_) {
    XCloseDisplay(static_cast<Display*>(display_));
    display_ = nullptr;
  }
}

void X11CaptureStream::SetErrorSink(StreamErrorSink sink) {
  error_sink_ = std::move(sink);
}

void X11CaptureStream::AddSampleSink(MediaKind kind, SampleSink sink) {
  if (kind == MediaKind::kVideo)
    video_sink_ = std::move(sink);
  else
    audio_sink_ = std::move(sink);
}

bool X11CaptureStream::CaptureOne(MediaSample* out) {
  auto* dpy = static_cast<Display*>(display_);
  const int screen = static_cast<int>(target_.screen.display_id);
  if (!GrabX11Frame(dpy, screen, geometry_.pixel_source_rect,
                    geometry_.pixel_output_size.width,
                    geometry_.pixel_output_size.height, out)) {
    return false;
  }

  if (config_.show_cursor) {
    Window root_ret, child_ret;
    int root_x = 0, root_y = 0, win_x = 0, win_y = 0;
    unsigned int mask = 0;
    if (XQueryPointer(dpy, RootWindow(dpy, screen), &root_ret, &child_ret,
                      &root_x, &root_y, &win_x, &win_y, &mask)) {
      DrawCursorMarker(out, root_x - geometry_.pixel_source_rect.x,
                       root_y - geometry_.pixel_source_rect.y);
    }
  }
  out->timestamp_ns = MonotonicNowNs();
  return true;
}

bool X11CaptureStream::Start(Error* err) {
  if (started_) {
    return Fail(err, kScreenRecErrorCaptureStart,
                "Capture stream already started");
  }
  started_ = true;

  if (!display_) {
    display_ = OpenX11Display(err);
    if (!display_) return false;
  }
  auto* dpy = static_cast<Display*>(display_);
  const int screen = static_cast<int>(target_.screen.display_id);
  if (screen < 0 || screen >= ScreenCount(dpy)) {
    return Fail(err, kScreenRecErrorScreenNotFound,
                "Screen " + std::to_string(screen) + " is gone");
  }

  // Probe one frame so an unreadable root fails here and not mid-session.
  MediaSample probe;
  if (!CaptureOne(&probe)) {
    return Fail(err, kScreenRecErrorCaptureStart,
                "XGetImage failed on screen " + std::to_string(screen),
                "Screen capture needs an X11 session; Wayland sessions "
                "must run the app under XWayland");
  }

  if (config_.capture_audio) {
    audio_.reset(new PulseAudioSource(config_.audio_from_microphone,
                                      config_.audio_sample_rate,
                                      config_.audio_channels));
    if (!audio_->Open(err)) {
      audio_.reset();
      return false;
    }
  }

  running_.store(true, std::memory_order_release);
  frame_thread_ = std::thread(&X11CaptureStream::FrameLoop, this);

  if (audio_ && !audio_->Start(audio_sink_, error_sink_, err)) {
    running_.store(false, std::memory_order_release);
    frame_thread_.join();
    return false;
  }

  SCREENREC_LOG_INFO("X11 capture started: screen {}, {}x{} at ({}, {}), "
                     "{} fps{}",
                     screen, geometry_.pixel_output_size.width,
                     geometry_.pixel_output_size.height,
                     geometry_.pixel_source_rect.x,
                     geometry_.pixel_source_rect.y, config_.fps,
                     config_.capture_audio ? ", with audio" : "");
  return true;
}

bool X11CaptureStream::Stop(Error* err) {
  (void)err;
  running_.store(false, std::memory_order_release);
  if (frame_thread_.joinable()) {
    frame_thread_.join();
  }
  if (audio_) {
    audio_->Stop();
    if (audio_->read_failures() > 0) {
      SCREENREC_LOG_WARN("Audio capture ended early after a failed read");
    }
  }
  if (failed_grabs_ > 0) {
    SCREENREC_LOG_WARN("{} frame grab(s) failed during capture",
                       failed_grabs_);
    failed_grabs_ = 0;
  }
  return true;
}

void X11CaptureStream::FrameLoop() {
  const auto interval = std::chrono::nanoseconds(1000000000LL / config_.fps);
  auto next_tick = std::chrono::steady_clock::now();

  while (running_.load(std::memory_order_acquire)) {
    MediaSample frame;
    if (CaptureOne(&frame)) {
      if (video_sink_) video_sink_(frame);
    } else {
      ++failed_grabs_;
    }

    next_tick += interval;
    auto now = std::chrono::steady_clock::now();
    if (next_tick > now) {
      std::this_thread::sleep_for(next_tick - now);
    } else {
      // Fell behind; skip the missed ticks instead of bursting.
      next_tick = now;
    }
  }
}

std::unique_ptr<CaptureStream> X11CaptureService::CreateStream(
    const CaptureTarget& target, const RecordingGeometry& geometry,
    const FrameConfig& config, Error* err) {
  if (geometry.pixel_output_size.width < 1 ||
      geometry.pixel_output_size.height < 1) {
    Fail(err, kScreenRecErrorInvalidParam, "Empty capture geometry");
    return nullptr;
  }
  if (config.fps <= 0) {
    Fail(err, kScreenRecErrorInvalidParam, "Frame rate must be positive");
    return nullptr;
  }
  return std::unique_ptr<CaptureStream>(
      new X11CaptureStream(target, geometry, config));
}

// Factory function.
std::unique_ptr<CaptureService> CreatePlatformCaptureService() {
  return std::make_unique<X11CaptureService>();
}

}  // namespace internal
}  // namespace screenrec
