// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_SESSION_CONFIG_H_
#define SCREENREC_CORE_SESSION_CONFIG_H_

#include <chrono>
#include <cstdint>
#include <string>

#include "core/area_spec.h"
#include "core/error.h"
#include "core/geometry.h"
#include "core/geometry_resolver.h"
#include "core/output_path.h"

namespace screenrec {
namespace internal {

enum class Quality { kLow, kMedium, kHigh };
enum class VideoCodec { kH264, kHevc };
enum class AudioSource { kNone, kSystem, kMicrophone };

/// Duration marker for "record until interrupted".
constexpr int64_t kContinuousDuration = -1;
constexpr int64_t kMinDurationMs = 100;
constexpr int kMaxCountdownSeconds = 60;

const char* QualityName(Quality q);
const char* CodecName(VideoCodec c);

struct VideoEncodingSettings {
  VideoCodec codec = VideoCodec::kH264;
  int width = 0;
  int height = 0;
  int fps = 30;
  int64_t bit_rate = 0;        ///< bits per second
  int keyframe_interval = 90;  ///< frames
  std::string profile;         ///< "baseline", "main", "high"
};

struct AudioEncodingSettings {
  AudioSource source = AudioSource::kNone;
  int sample_rate = 44100;
  int channels = 2;
  int bit_rate = 128000;
};

/// Raw recording choices, as collected from the caller.
struct RecordRequest {
  TargetSelector target = TargetSelector::Screen(0);
  AreaSpec area;
  int64_t duration_ms = 10000;
  int fps = 30;
  Quality quality = Quality::kMedium;
  bool show_cursor = false;
  AudioSource audio_source = AudioSource::kNone;
  Quality audio_quality = Quality::kMedium;
  ContainerFormat container = ContainerFormat::kMov;
  std::string output_path;
  bool overwrite = false;
  int countdown_s = 0;
  std::chrono::milliseconds finalize_timeout{5000};
  std::chrono::milliseconds interrupt_grace{10000};
  bool handle_interrupts = false;
  bool show_progress = false;
};

/// Everything one recording attempt needs.  Built once by
/// SessionConfigurator and only ever read afterwards.
struct SessionConfig {
  RecordingGeometry geometry;
  CaptureTarget target;
  int64_t duration_ms = 10000;
  int fps = 30;
  Quality quality = Quality::kMedium;
  bool show_cursor = false;
  VideoEncodingSettings video;
  AudioEncodingSettings audio;
  ContainerFormat container = ContainerFormat::kMov;
  std::string output_path;
  int countdown_s = 0;
  std::chrono::milliseconds finalize_timeout{5000};
  std::chrono::milliseconds interrupt_grace{10000};

  bool continuous() const { return duration_ms == kContinuousDuration; }
  bool audio_enabled() const { return audio.source != AudioSource::kNone; }
};

/// Combines a resolved target with the user's quality choices and the
/// output destination into a SessionConfig.
class SessionConfigurator {
 public:
  /// `output` is not owned and may be null, in which case the requested
  /// path is used verbatim.
  explicit SessionConfigurator(OutputPathResolver* output) : output_(output) {}

  bool Build(const RecordRequest& request, const ResolvedTarget& resolved,
             SessionConfig* out, Error* err);

  /// fps, duration and countdown checks.
  static bool ValidateRequest(const RecordRequest& request, Error* err);

  /// base(quality) * (area / 1920x1080) * (fps / 30).
  static int64_t ComputeVideoBitRate(Quality quality, const PixelSize& size,
                                     int fps);

  static VideoCodec SelectCodec(Quality quality, const PixelSize& size,
                                ContainerFormat container);

  static VideoEncodingSettings MakeVideoSettings(Quality quality,
                                                 const PixelSize& size,
                                                 int fps,
                                                 ContainerFormat container);

  static AudioEncodingSettings MakeAudioSettings(Quality quality,
                                                 AudioSource source);

 private:
  OutputPathResolver* output_;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_SESSION_CONFIG_H_
