// Copyright 2026 The screenrec Authors

#include "core/session_config.h"

#include <cmath>
#include <string>

#include "core/logger.h"

namespace screenrec {
namespace internal {

namespace {

constexpr double kReferencePixels = 1920.0 * 1080.0;
constexpr double kReferenceFps = 30.0;
constexpr int kKeyframeIntervalSeconds = 3;

int64_t BaseBitRate(Quality q) {
  switch (q) {
    case Quality::kLow:    return 2'000'000;
    case Quality::kMedium: return 5'000'000;
    case Quality::kHigh:   return 10'000'000;
  }
  return 5'000'000;
}

const char* H264Profile(Quality q) {
  switch (q) {
    case Quality::kLow:    return "baseline";
    case Quality::kMedium: return "main";
    case Quality::kHigh:   return "high";
  }
  return "main";
}

}  // namespace

const char* QualityName(Quality q) {
  switch (q) {
    case Quality::kLow:    return "low";
    case Quality::kMedium: return "medium";
    case Quality::kHigh:   return "high";
  }
  return "unknown";
}

const char* CodecName(VideoCodec c) {
  return c == VideoCodec::kHevc ? "hevc" : "h264";
}

bool SessionConfigurator::ValidateRequest(const RecordRequest& request,
                                          Error* err) {
  if (request.fps != 15 && request.fps != 30 && request.fps != 60) {
    return Fail(err, kScreenRecErrorConfiguration,
                "Unsupported frame rate " + std::to_string(request.fps),
                "Supported frame rates are 15, 30 and 60");
  }
  if (request.duration_ms != kContinuousDuration &&
      request.duration_ms < kMinDurationMs) {
    return Fail(err, kScreenRecErrorConfiguration,
                "Duration " + std::to_string(request.duration_ms) +
                    " ms is too short",
                "Minimum duration is 100 ms; omit the duration to record "
                "until Ctrl+C");
  }
  if (request.countdown_s < 0 || request.countdown_s > kMaxCountdownSeconds) {
    return Fail(err, kScreenRecErrorConfiguration,
                "Countdown " + std::to_string(request.countdown_s) +
                    " s is out of range",
                "Countdown must be between 0 and 60 seconds");
  }
  if (request.finalize_timeout.count() <= 0 ||
      request.interrupt_grace.count() <= 0) {
    return Fail(err, kScreenRecErrorConfiguration,
                "Timeouts must be positive");
  }
  return true;
}

int64_t SessionConfigurator::ComputeVideoBitRate(Quality quality,
                                                 const PixelSize& size,
                                                 int fps) {
  const double area_factor =
      static_cast<double>(size.area()) / kReferencePixels;
  const double fps_factor = fps / kReferenceFps;
  return static_cast<int64_t>(
      std::llround(BaseBitRate(quality) * area_factor * fps_factor));
}

VideoCodec SessionConfigurator::SelectCodec(Quality quality,
                                            const PixelSize& size,
                                            ContainerFormat container) {
  if (quality == Quality::kHigh &&
      static_cast<double>(size.area()) > kReferencePixels &&
      container == ContainerFormat::kMov) {
    return VideoCodec::kHevc;
  }
  return VideoCodec::kH264;
}

VideoEncodingSettings SessionConfigurator::MakeVideoSettings(
    Quality quality, const PixelSize& size, int fps,
    ContainerFormat container) {
  VideoEncodingSettings v;
  v.codec = SelectCodec(quality, size, container);
  v.width = size.width;
  v.height = size.height;
  v.fps = fps;
  v.bit_rate = ComputeVideoBitRate(quality, size, fps);
  v.keyframe_interval = fps * kKeyframeIntervalSeconds;
  v.profile = H264Profile(quality);
  return v;
}

AudioEncodingSettings SessionConfigurator::MakeAudioSettings(
    Quality quality, AudioSource source) {
  AudioEncodingSettings a;
  a.source = source;
  a.channels = 2;
  switch (quality) {
    case Quality::kLow:
      a.sample_rate = 22050;
      a.bit_rate = 64000;
      break;
    case Quality::kMedium:
      a.sample_rate = 44100;
      a.bit_rate = 128000;
      break;
    case Quality::kHigh:
      a.sample_rate = 48000;
      a.bit_rate = 192000;
      break;
  }
  return a;
}

bool SessionConfigurator::Build(const RecordRequest& request,
                                const ResolvedTarget& resolved,
                                SessionConfig* out, Error* err) {
  if (!out) return Fail(err, kScreenRecErrorInvalidParam, "out is null");
  if (!ValidateRequest(request, err)) return false;

  const PixelSize& size = resolved.geometry.pixel_output_size;
  if (size.width < 1 || size.height < 1) {
    return Fail(err, kScreenRecErrorConfiguration,
                "Resolved output size is empty");
  }

  std::string path = request.output_path;
  if (output_) {
    if (!output_->Resolve(request.output_path, request.container,
                          request.overwrite, &path, err)) {
      return false;
    }
  } else if (path.empty()) {
    return Fail(err, kScreenRecErrorOutputPath, "No output path given");
  }

  SessionConfig c;
  c.geometry = resolved.geometry;
  c.target = resolved.target;
  c.duration_ms = request.duration_ms;
  c.fps = request.fps;
  c.quality = request.quality;
  c.show_cursor = request.show_cursor;
  c.video = MakeVideoSettings(request.quality, size, request.fps,
                              request.container);
  c.audio = MakeAudioSettings(request.audio_quality, request.audio_source);
  c.container = request.container;
  c.output_path = path;
  c.countdown_s = request.countdown_s;
  c.finalize_timeout = request.finalize_timeout;
  c.interrupt_grace = request.interrupt_grace;

  SCREENREC_LOG_INFO("Recording {}x{} @ {} fps, {} {} kbps{} -> {}",
                     c.video.width, c.video.height, c.fps,
                     CodecName(c.video.codec), c.video.bit_rate / 1000,
                     c.audio_enabled() ? ", with audio" : "", c.output_path);

  *out = c;
  return true;
}

}  // namespace internal
}  // namespace screenrec
