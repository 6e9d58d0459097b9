// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_MEDIA_SAMPLE_H_
#define SCREENREC_CORE_MEDIA_SAMPLE_H_

#include <cstdint>
#include <vector>

namespace screenrec {
namespace internal {

enum class MediaKind { kVideo = 0, kAudio = 1 };

inline const char* MediaKindName(MediaKind kind) {
  return kind == MediaKind::kVideo ? "video" : "audio";
}

/// One buffer delivered by the capture service.
///
/// Video: packed BGRA, `stride` bytes per row.
/// Audio: interleaved S16LE PCM.
struct MediaSample {
  MediaKind kind = MediaKind::kVideo;
  int64_t timestamp_ns = 0;  ///< Monotonic capture time
  std::vector<uint8_t> data;

  // Video.
  int width = 0;
  int height = 0;
  int stride = 0;

  // Audio.
  int sample_rate = 0;
  int channels = 0;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_MEDIA_SAMPLE_H_
