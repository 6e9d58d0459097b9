// Copyright 2026 The screenrec Authors
// Linux container writer: GStreamer appsrc -> encoder -> qtmux/mp4mux.

#include "core/container_writer.h"

#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "core/logger.h"

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>

namespace screenrec {
namespace internal {

namespace {

// Queued input allowed per track before IsReadyForMoreData() says no.
constexpr int kVideoQueueFrames = 8;
constexpr guint64 kAudioQueueBytes = 48000 * 2 * 2;  // ~1 s stereo S16LE

// Upper bound on the background EOS wait; the session applies its own,
// shorter, finalize timeout on top.
constexpr GstClockTime kEosWaitLimit = 120 * GST_SECOND;

int EvenUp(int v) { return (v + 1) & ~1; }

std::string EncoderChain(const VideoEncodingSettings& v) {
  const int kbps = static_cast<int>(v.bit_rate / 1000);
  if (v.codec == VideoCodec::kHevc) {
    return "x265enc tune=zerolatency speed-preset=veryfast bitrate=" +
           std::to_string(kbps) +
           " key-int-max=" + std::to_string(v.keyframe_interval) +
           " ! h265parse";
  }
  // x264enc uses kbps.
  return "x264enc tune=zerolatency speed-preset=veryfast bitrate=" +
         std::to_string(kbps) +
         " key-int-max=" + std::to_string(v.keyframe_interval) +
         " ! video/x-h264,profile=" + v.profile + " ! h264parse";
}

class X11ContainerWriter
    : public ContainerWriter,
      public std::enable_shared_from_this<X11ContainerWriter> {
 public:
  X11ContainerWriter(std::string path, ContainerFormat format)
      : path_(std::move(path)), format_(format) {}

  ~X11ContainerWriter() override { CleanupPipeline(); }

  bool AddVideoTrack(const VideoEncodingSettings& settings,
                     Error* err) override {
    if (pipeline_) {
      return Fail(err, kScreenRecErrorCaptureStart,
                  "Tracks must be added before writing begins");
    }
    if (settings.width < 1 || settings.height < 1 || settings.fps < 1) {
      return Fail(err, kScreenRecErrorInvalidParam,
                  "Invalid video track settings");
    }
    video_ = settings;
    has_video_ = true;
    return true;
  }

  bool AddAudioTrack(const AudioEncodingSettings& settings,
                     Error* err) override {
    if (pipeline_) {
      return Fail(err, kScreenRecErrorCaptureStart,
                  "Tracks must be added before writing begins");
    }
    audio_ = settings;
    has_audio_ = true;
    return true;
  }

  bool BeginWriting(Error* err) override {
    if (!has_video_) {
      return Fail(err, kScreenRecErrorCaptureStart, "No video track added");
    }

    // appsrc -> videoconvert -> videoscale (even size) -> encoder -> mux
    std::string desc =
        "appsrc name=videosrc is-live=true format=time "
        "caps=\"video/x-raw,format=BGRA,width=" +
        std::to_string(video_.width) +
        ",height=" + std::to_string(video_.height) +
        ",framerate=" + std::to_string(video_.fps) +
        "/1\" ! queue ! videoconvert ! videoscale "
        "! video/x-raw,format=I420,width=" +
        std::to_string(EvenUp(video_.width)) +
        ",height=" + std::to_string(EvenUp(video_.height)) + " ! " +
        EncoderChain(video_) + " ! queue ! mux. ";

    if (has_audio_) {
      desc +=
          "appsrc name=audiosrc is-live=true format=time "
          "caps=\"audio/x-raw,format=S16LE,layout=interleaved,rate=" +
          std::to_string(audio_.sample_rate) +
          ",channels=" + std::to_string(audio_.channels) +
          "\" ! queue ! audioconvert ! audioresample ! avenc_aac bitrate=" +
          std::to_string(audio_.bit_rate) + " ! aacparse ! queue ! mux. ";
    }

    desc += (format_ == ContainerFormat::kMp4) ? "mp4mux name=mux"
                                               : "qtmux name=mux";
    desc += " ! filesink name=sink";

    GError* error = nullptr;
    pipeline_ = gst_parse_launch(desc.c_str(), &error);
    if (!pipeline_ || error) {
      std::string msg = error ? error->message : "unknown";
      if (error) g_error_free(error);
      CleanupPipeline();
      return Fail(err, kScreenRecErrorCaptureStart,
                  "GStreamer pipeline creation failed: " + msg,
                  "Install the GStreamer good, ugly and libav plugin sets");
    }

    GstElement* sink = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
    if (sink) {
      g_object_set(sink, "location", path_.c_str(), nullptr);
      gst_object_unref(sink);
    }

    video_src_ = gst_bin_get_by_name(GST_BIN(pipeline_), "videosrc");
    if (has_audio_) {
      audio_src_ = gst_bin_get_by_name(GST_BIN(pipeline_), "audiosrc");
    }
    if (!video_src_ || (has_audio_ && !audio_src_)) {
      CleanupPipeline();
      return Fail(err, kScreenRecErrorCaptureStart,
                  "Failed to get appsrc element from pipeline");
    }

    video_limit_ = static_cast<guint64>(video_.width) * video_.height * 4 *
                   kVideoQueueFrames;
    audio_limit_ = kAudioQueueBytes;
    g_object_set(video_src_, "max-bytes", video_limit_, "block", FALSE,
                 nullptr);
    if (audio_src_) {
      g_object_set(audio_src_, "max-bytes", audio_limit_, "block", FALSE,
                   nullptr);
    }

    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) ==
        GST_STATE_CHANGE_FAILURE) {
      CleanupPipeline();
      return Fail(err, kScreenRecErrorCaptureStart,
                  "Failed to set GStreamer pipeline to PLAYING");
    }

    SCREENREC_LOG_INFO("Writer started: {}x{} @{}fps {} {}kbps{} -> {}",
                       video_.width, video_.height, video_.fps,
                       CodecName(video_.codec), video_.bit_rate / 1000,
                       has_audio_ ? " + AAC" : "", path_);
    return true;
  }

  void AnchorTimeline(int64_t timestamp_ns) override {
    anchor_ns_.store(timestamp_ns, std::memory_order_release);
    anchored_.store(true, std::memory_order_release);
  }

  bool IsReadyForMoreData(MediaKind kind) const override {
    GstElement* src = SourceFor(kind);
    if (!src || finished(kind)) return false;
    const guint64 level =
        gst_app_src_get_current_level_bytes(GST_APP_SRC(src));
    return level < (kind == MediaKind::kVideo ? video_limit_ : audio_limit_);
  }

  bool Append(const MediaSample& sample) override {
    GstElement* src = SourceFor(sample.kind);
    if (!src || finished(sample.kind) || failed_.load()) return false;
    if (!anchored_.load(std::memory_order_acquire)) return false;
    if (PollBusError()) return false;

    int64_t pts = sample.timestamp_ns -
                  anchor_ns_.load(std::memory_order_acquire);
    if (pts < 0) pts = 0;

    GstBuffer* buffer = nullptr;
    if (sample.kind == MediaKind::kVideo) {
      buffer = MakeVideoBuffer(sample);
      if (buffer) {
        GST_BUFFER_DURATION(buffer) = GST_SECOND / video_.fps;
      }
    } else {
      buffer = gst_buffer_new_allocate(nullptr, sample.data.size(), nullptr);
      if (buffer) {
        gst_buffer_fill(buffer, 0, sample.data.data(), sample.data.size());
        const int frame_bytes = sample.channels * 2;
        if (frame_bytes > 0 && sample.sample_rate > 0) {
          GST_BUFFER_DURATION(buffer) = gst_util_uint64_scale(
              sample.data.size() / frame_bytes, GST_SECOND,
              sample.sample_rate);
        }
      }
    }
    if (!buffer) {
      SCREENREC_LOG_ERROR("gst_buffer_new_allocate failed");
      return false;
    }
    GST_BUFFER_PTS(buffer) = static_cast<GstClockTime>(pts);

    // Push buffer to appsrc (takes ownership).
    GstFlowReturn flow = gst_app_src_push_buffer(GST_APP_SRC(src), buffer);
    if (flow != GST_FLOW_OK) {
      SCREENREC_LOG_ERROR("gst_app_src_push_buffer({}) failed: {}",
                          MediaKindName(sample.kind),
                          static_cast<int>(flow));
      return false;
    }
    return true;
  }

  void MarkInputFinished(MediaKind kind) override {
    GstElement* src = SourceFor(kind);
    if (!src) return;
    std::atomic<bool>& flag =
        kind == MediaKind::kVideo ? video_finished_ : audio_finished_;
    if (flag.exchange(true)) return;
    gst_app_src_end_of_stream(GST_APP_SRC(src));
  }

  void Finalize(FinalizeCallback completion) override {
    if (!pipeline_) {
      Error e;
      e.Set(kScreenRecErrorFinalizeFailed, "Writer was never started");
      if (completion) completion(false, e);
      return;
    }
    MarkInputFinished(MediaKind::kVideo);
    if (has_audio_) MarkInputFinished(MediaKind::kAudio);

    // Wait for EOS off the caller's thread; the muxer writes the moov atom
    // while draining.  The thread keeps this writer alive until done.
    auto self = shared_from_this();
    std::thread([self, completion]() {
      Error e;
      bool ok = self->WaitForEos(&e);
      gst_element_set_state(self->pipeline_, GST_STATE_NULL);
      if (ok) {
        SCREENREC_LOG_INFO("Writer finalized: {} ({} bytes)", self->path_,
                           self->BytesWritten());
      }
      if (completion) completion(ok, e);
    }).detach();
  }

  void Cancel() override {
    CleanupPipeline();
    if (::unlink(path_.c_str()) == 0) {
      SCREENREC_LOG_DEBUG("Removed unfinished output {}", path_);
    }
  }

  int64_t BytesWritten() const override {
    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) return 0;
    return static_cast<int64_t>(st.st_size);
  }

 private:
  GstElement* SourceFor(MediaKind kind) const {
    return kind == MediaKind::kVideo ? video_src_ : audio_src_;
  }

  bool finished(MediaKind kind) const {
    return kind == MediaKind::kVideo ? video_finished_.load()
                                     : audio_finished_.load();
  }

  GstBuffer* MakeVideoBuffer(const MediaSample& sample) const {
    if (sample.width != video_.width || sample.height != video_.height) {
      SCREENREC_LOG_WARN("Frame size {}x{} does not match track {}x{}",
                         sample.width, sample.height, video_.width,
                         video_.height);
      return nullptr;
    }
    const gsize row = static_cast<gsize>(video_.width) * 4;
    GstBuffer* buffer =
        gst_buffer_new_allocate(nullptr, row * video_.height, nullptr);
    if (!buffer) return nullptr;

    GstMapInfo map;
    if (!gst_buffer_map(buffer, &map, GST_MAP_WRITE)) {
      gst_buffer_unref(buffer);
      return nullptr;
    }
    // Copy row-by-row (strides may differ).
    for (int y = 0; y < video_.height; ++y) {
      std::memcpy(map.data + y * row,
                  sample.data.data() + static_cast<size_t>(y) * sample.stride,
                  row);
    }
    gst_buffer_unmap(buffer, &map);
    return buffer;
  }

  // Non-blocking check for an asynchronous pipeline failure.
  bool PollBusError() {
    if (failed_.load()) return true;
    GstBus* bus = gst_element_get_bus(pipeline_);
    if (!bus) return false;
    GstMessage* msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR);
    gst_object_unref(bus);
    if (!msg) return false;
    RecordBusError(msg);
    gst_message_unref(msg);
    return true;
  }

  void RecordBusError(GstMessage* msg) {
    GError* gerr = nullptr;
    gst_message_parse_error(msg, &gerr, nullptr);
    std::lock_guard<std::mutex> lock(error_mu_);
    pipeline_error_ = gerr ? gerr->message : "unknown";
    if (gerr) g_error_free(gerr);
    failed_.store(true);
    SCREENREC_LOG_ERROR("GStreamer pipeline error: {}", pipeline_error_);
  }

  bool WaitForEos(Error* err) {
    if (failed_.load()) {
      std::lock_guard<std::mutex> lock(error_mu_);
      return Fail(err, kScreenRecErrorFinalizeFailed,
                  "Encoding failed: " + pipeline_error_);
    }
    GstBus* bus = gst_element_get_bus(pipeline_);
    if (!bus) {
      return Fail(err, kScreenRecErrorFinalizeFailed, "Pipeline has no bus");
    }
    GstMessage* msg = gst_bus_timed_pop_filtered(
        bus, kEosWaitLimit,
        static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
    gst_object_unref(bus);

    if (!msg) {
      return Fail(err, kScreenRecErrorFinalizeTimeout,
                  "Muxer did not drain within the EOS wait limit");
    }
    bool ok = true;
    if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
      RecordBusError(msg);
      std::lock_guard<std::mutex> lock(error_mu_);
      ok = Fail(err, kScreenRecErrorFinalizeFailed,
                "Finalizing failed: " + pipeline_error_);
    }
    gst_message_unref(msg);
    return ok;
  }

  void CleanupPipeline() {
    if (video_src_) {
      gst_object_unref(video_src_);
      video_src_ = nullptr;
    }
    if (audio_src_) {
      gst_object_unref(audio_src_);
      audio_src_ = nullptr;
    }
    if (pipeline_) {
      gst_element_set_state(pipeline_, GST_STATE_NULL);
      gst_object_unref(pipeline_);
      pipeline_ = nullptr;
    }
  }

  std::string path_;
  ContainerFormat format_;

  VideoEncodingSettings video_;
  AudioEncodingSettings audio_;
  bool has_video_ = false;
  bool has_audio_ = false;

  // GStreamer objects.
  GstElement* pipeline_ = nullptr;
  GstElement* video_src_ = nullptr;
  GstElement* audio_src_ = nullptr;
  guint64 video_limit_ = 0;
  guint64 audio_limit_ = 0;

  std::atomic<int64_t> anchor_ns_{0};
  std::atomic<bool> anchored_{false};
  std::atomic<bool> video_finished_{false};
  std::atomic<bool> audio_finished_{false};
  std::atomic<bool> failed_{false};

  std::mutex error_mu_;
  std::string pipeline_error_;
};

class X11ContainerWriterFactory : public ContainerWriterFactory {
 public:
  std::shared_ptr<ContainerWriter> Create(const std::string& path,
                                          ContainerFormat format,
                                          Error* err) override {
    // Initialize GStreamer (process-global, idempotent).
    GError* gerr = nullptr;
    if (!gst_init_check(nullptr, nullptr, &gerr)) {
      std::string msg = gerr ? gerr->message : "unknown";
      if (gerr) g_error_free(gerr);
      Fail(err, kScreenRecErrorCaptureStart,
           "GStreamer initialization failed: " + msg);
      return nullptr;
    }
    return std::make_shared<X11ContainerWriter>(path, format);
  }
};

}  // namespace

std::unique_ptr<ContainerWriterFactory> CreatePlatformWriterFactory() {
  return std::make_unique<X11ContainerWriterFactory>();
}

}  // namespace internal
}  // namespace screenrec
