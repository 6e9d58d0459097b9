// Copyright 2026 The screenrec Authors

#include "core/capture_lifecycle_controller.h"

#include <utility>

#include "core/duration_timekeeper.h"
#include "core/logger.h"

namespace screenrec {
namespace internal {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

namespace {

constexpr int64_t kDropLogEvery = 100;
constexpr std::chrono::milliseconds kErrorPollInterval{100};

/// Shared between Run() and the writer's completion callback, which may
/// fire after Run() has stopped waiting.
struct FinalizeWaiter {
  std::mutex mu;
  std::condition_variable cv;
  bool done = false;
  bool ok = false;
  Error error;
};

int64_t SteadyNs(std::chrono::steady_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             t.time_since_epoch())
      .count();
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:        return "idle";
    case SessionState::kConfiguring: return "configuring";
    case SessionState::kCapturing:   return "capturing";
    case SessionState::kStopping:    return "stopping";
    case SessionState::kFinalizing:  return "finalizing";
    case SessionState::kCompleted:   return "completed";
    case SessionState::kFailed:      return "failed";
  }
  return "unknown";
}

const char* OutcomeReasonName(OutcomeReason reason) {
  switch (reason) {
    case OutcomeReason::kCompleted:          return "completed";
    case OutcomeReason::kInterruptedByUser:  return "interrupted by user";
    case OutcomeReason::kSafetyTimeout:      return "safety timeout";
    case OutcomeReason::kConfigurationError: return "configuration error";
    case OutcomeReason::kCaptureStartError:  return "capture start error";
    case OutcomeReason::kStopError:          return "stop error";
    case OutcomeReason::kFinalizeError:      return "finalize error";
    case OutcomeReason::kFinalizeTimeout:    return "finalize timeout";
    case OutcomeReason::kCancelled:          return "cancelled";
    case OutcomeReason::kCaptureError:       return "capture error";
  }
  return "unknown";
}

SessionOutcome SessionOutcome::Failure(OutcomeReason reason, const Error& err) {
  SessionOutcome o;
  o.state = SessionState::kFailed;
  o.reason = reason;
  o.error = err;
  return o;
}

CaptureLifecycleController::CaptureLifecycleController(
    CaptureService* capture, ContainerWriterFactory* writers, Clock* clock)
    : capture_(capture),
      writers_(writers),
      clock_(clock ? clock : SystemClock()) {}

CaptureLifecycleController::~CaptureLifecycleController() {
  // A stream that was started is always stopped by BeginStopping() before
  // Run() returns; this only covers a controller torn down mid-Run.
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (stream_ && capture_started_ && !stop_done_) {
    Error err;
    if (!stream_->Stop(&err)) {
      SCREENREC_LOG_WARN("Stopping capture on teardown failed: {}",
                         err.message);
    }
  }
}

void CaptureLifecycleController::SetState(SessionState s) {
  SessionState prev = state_.exchange(s);
  if (prev != s) {
    SCREENREC_LOG_DEBUG("Session state {} -> {}", SessionStateName(prev),
                        SessionStateName(s));
  }
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------

SessionOutcome CaptureLifecycleController::Run(const SessionConfig& config) {
  SetState(SessionState::kConfiguring);

  Error err;
  if (!Configure(config, &err)) {
    SetState(SessionState::kFailed);
    return SessionOutcome::Failure(OutcomeReason::kCaptureStartError, err);
  }

  if (!StartCapture(&err)) {
    if (writer_) writer_->Cancel();
    SetState(SessionState::kFailed);
    bool cancelled = err.code == kScreenRecErrorCancelled;
    return SessionOutcome::Failure(cancelled
                                       ? OutcomeReason::kCancelled
                                       : OutcomeReason::kCaptureStartError,
                                   err);
  }

  WaitForStop(config);
  return FinalizeSession(config);
}

bool CaptureLifecycleController::Configure(const SessionConfig& config,
                                           Error* err) {
  if (!capture_ || !writers_) {
    return Fail(err, kScreenRecErrorNotInitialized,
                "Capture or writer service unavailable");
  }

  writer_ = writers_->Create(config.output_path, config.container, err);
  if (!writer_) return false;

  if (!writer_->AddVideoTrack(config.video, err)) {
    writer_->Cancel();
    return false;
  }
  if (config.audio_enabled() && !writer_->AddAudioTrack(config.audio, err)) {
    writer_->Cancel();
    return false;
  }

  FrameConfig frame;
  frame.fps = config.fps;
  frame.show_cursor = config.show_cursor;
  frame.capture_audio = config.audio_enabled();
  frame.audio_from_microphone =
      config.audio.source == AudioSource::kMicrophone;
  frame.audio_sample_rate = config.audio.sample_rate;
  frame.audio_channels = config.audio.channels;

  std::unique_ptr<CaptureStream> stream =
      capture_->CreateStream(config.target, config.geometry, frame, err);
  if (!stream) {
    writer_->Cancel();
    return false;
  }

  stream->AddSampleSink(MediaKind::kVideo,
                        [this](const MediaSample& s) { OnSample(s); });
  if (config.audio_enabled()) {
    stream->AddSampleSink(MediaKind::kAudio,
                          [this](const MediaSample& s) { OnSample(s); });
  }
  stream->SetErrorSink([this](const Error& e) { OnStreamError(e); });

  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  stream_ = std::move(stream);
  return true;
}

bool CaptureLifecycleController::StartCapture(Error* err) {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);

  // An interrupt that arrives while configuring cancels before any sample
  // is written.
  if (guard_.tripped()) {
    return Fail(err, kScreenRecErrorCancelled,
                "Recording cancelled before capture started");
  }

  if (!writer_->BeginWriting(err)) return false;

  {
    std::lock_guard<std::mutex> v(video_gate_.mu);
    video_gate_.accepting = true;
  }
  {
    std::lock_guard<std::mutex> a(audio_gate_.mu);
    audio_gate_.accepting = true;
  }

  capture_start_ = clock_->SteadyNow();
  capture_start_ns_.store(SteadyNs(capture_start_));
  if (!stream_->Start(err)) {
    CloseGates();
    return false;
  }
  capture_started_ = true;
  SetState(SessionState::kCapturing);
  SCREENREC_LOG_INFO("Recording started");
  return true;
}

void CaptureLifecycleController::WaitForStop(const SessionConfig& config) {
  if (!config.continuous()) {
    DurationTimekeeper timekeeper(clock_, &guard_);
    TimekeeperReport report =
        timekeeper.Run(milliseconds(config.duration_ms));
    switch (report.result) {
      case TimekeeperResult::kOnTime:
        BeginStopping(StopCause::kTimer);
        break;
      case TimekeeperResult::kSafetyTimeout:
        BeginStopping(StopCause::kSafetyTimeout);
        break;
      case TimekeeperResult::kUserInterrupted:
        BeginStopping(StopCause::kInterrupt);
        break;
      case TimekeeperResult::kStoppedByError:
        BeginStopping(StopCause::kError);
        break;
    }
  }

  // Continuous mode ends only through the interrupt path or an error raised
  // by a sample callback.  In timed mode this waits for whichever path won.
  // Sample callbacks cannot signal stop_cv_, so errors are polled.
  std::unique_lock<std::mutex> lock(lifecycle_mu_);
  while (!stop_done_) {
    if (guard_.error_raised() && !guard_.tripped()) {
      lock.unlock();
      BeginStopping(StopCause::kError);
      lock.lock();
      continue;
    }
    stop_cv_.wait_for(lock, kErrorPollInterval);
  }
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------

bool CaptureLifecycleController::BeginStopping(StopCause cause) {
  if (!guard_.TryTrip(cause)) return false;

  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  stop_instant_ = clock_->SteadyNow();
  SCREENREC_LOG_INFO("Stopping capture ({})", StopCauseName(cause));

  if (capture_started_) {
    SetState(SessionState::kStopping);
    CloseGates();
    Error err;
    if (!stream_->Stop(&err)) {
      SCREENREC_LOG_ERROR("Stopping capture failed: {}", err.message);
      stop_error_ = err;
      if (stop_error_.ok()) {
        stop_error_.Set(kScreenRecErrorStopFailed, "Capture stop failed");
      }
    }
  }

  stop_done_ = true;
  stop_cv_.notify_all();
  return true;
}

void CaptureLifecycleController::RequestInterrupt() {
  guard_.RaiseInterrupt();
  BeginStopping(StopCause::kInterrupt);
}

void CaptureLifecycleController::CloseGates() {
  {
    std::lock_guard<std::mutex> v(video_gate_.mu);
    video_gate_.accepting = false;
  }
  {
    std::lock_guard<std::mutex> a(audio_gate_.mu);
    audio_gate_.accepting = false;
  }
}

// ---------------------------------------------------------------------------
// Samples
// ---------------------------------------------------------------------------

void CaptureLifecycleController::OnSample(const MediaSample& sample) {
  SampleGate& g = gate(sample.kind);
  std::lock_guard<std::mutex> lock(g.mu);
  if (!g.accepting) return;

  if (sample.kind == MediaKind::kVideo) {
    if (!anchored_.load(std::memory_order_acquire)) {
      writer_->AnchorTimeline(sample.timestamp_ns);
      anchor_ts_.store(sample.timestamp_ns, std::memory_order_relaxed);
      anchored_.store(true, std::memory_order_release);
    }
  } else if (!anchored_.load(std::memory_order_acquire) ||
             sample.timestamp_ns <
                 anchor_ts_.load(std::memory_order_relaxed)) {
    pre_anchor_dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  if (!writer_->IsReadyForMoreData(sample.kind)) {
    NoteDrop(sample.kind, g.dropped.fetch_add(1) + 1);
    return;
  }

  if (writer_->Append(sample)) {
    g.written.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  // A rejected append on a ready input means the writer has failed.  The
  // main flow notices the raised error and performs the stop; this thread
  // must not touch lifecycle_mu_, which is held while its thread is joined.
  g.dropped.fetch_add(1);
  if (!guard_.error_raised()) {
    Error e;
    e.Set(kScreenRecErrorCaptureFailed, std::string("Writer rejected a ") +
                                            MediaKindName(sample.kind) +
                                            " sample");
    OnStreamError(e);
  }
}

void CaptureLifecycleController::OnStreamError(const Error& e) {
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    if (!capture_error_.ok()) return;  // First failure wins.
    capture_error_ = e;
  }
  SCREENREC_LOG_ERROR("Capture failed: {}", e.message);
  guard_.RaiseError();
}

void CaptureLifecycleController::NoteDrop(MediaKind kind, int64_t count) {
  if (count == 1 || count % kDropLogEvery == 0) {
    SCREENREC_LOG_WARN("Writer not ready, dropped {} {} sample(s) so far",
                       count, MediaKindName(kind));
  }
}

ProgressSnapshot CaptureLifecycleController::Snapshot() const {
  ProgressSnapshot snap;
  snap.capturing = state_.load() == SessionState::kCapturing;
  if (snap.capturing) {
    int64_t now_ns = SteadyNs(clock_->SteadyNow());
    snap.elapsed = duration_cast<milliseconds>(
        std::chrono::nanoseconds(now_ns - capture_start_ns_.load()));
  }
  snap.video_frames_written = video_gate_.written.load();
  snap.video_frames_dropped = video_gate_.dropped.load();
  snap.audio_buffers_written = audio_gate_.written.load();
  return snap;
}

// ---------------------------------------------------------------------------
// Finalize
// ---------------------------------------------------------------------------

SessionOutcome CaptureLifecycleController::FinalizeSession(
    const SessionConfig& config) {
  SessionOutcome o;
  o.output_path = config.output_path;

  if (!guard_.TryEnterFinalize()) {
    // Unreachable with a single Run(); reported rather than finalizing twice.
    o.state = SessionState::kFailed;
    o.reason = OutcomeReason::kFinalizeError;
    o.error.Set(kScreenRecErrorFinalizeFailed, "Finalize already entered");
    return o;
  }

  Error stop_error;
  Error capture_error;
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    capture_error = capture_error_;
  }
  {
    std::lock_guard<std::mutex> lock(lifecycle_mu_);
    stop_error = stop_error_;
    o.elapsed = duration_cast<milliseconds>(stop_instant_ - capture_start_);
  }

  SetState(SessionState::kFinalizing);
  writer_->MarkInputFinished(MediaKind::kVideo);
  if (config.audio_enabled()) writer_->MarkInputFinished(MediaKind::kAudio);

  auto waiter = std::make_shared<FinalizeWaiter>();
  writer_->Finalize([waiter](bool ok, const Error& e) {
    std::lock_guard<std::mutex> lock(waiter->mu);
    waiter->done = true;
    waiter->ok = ok;
    waiter->error = e;
    waiter->cv.notify_all();
  });

  bool finalize_done = false;
  bool finalize_ok = false;
  Error finalize_error;
  {
    std::unique_lock<std::mutex> lock(waiter->mu);
    finalize_done = waiter->cv.wait_for(lock, config.finalize_timeout,
                                        [&] { return waiter->done; });
    finalize_ok = waiter->ok;
    finalize_error = waiter->error;
  }

  o.video_frames_written = video_gate_.written.load();
  o.video_frames_dropped = video_gate_.dropped.load();
  o.audio_buffers_written = audio_gate_.written.load();
  o.audio_buffers_dropped = audio_gate_.dropped.load();
  o.audio_pre_anchor_dropped = pre_anchor_dropped_.load();
  o.bytes_written = writer_->BytesWritten();
  o.output_written = o.bytes_written > 0;

  const StopCause cause = guard_.cause();
  o.stop_cause = cause;
  o.state = SessionState::kCompleted;
  o.reason = OutcomeReason::kCompleted;
  if (cause == StopCause::kInterrupt) {
    o.reason = OutcomeReason::kInterruptedByUser;
  } else if (cause == StopCause::kSafetyTimeout) {
    o.reason = OutcomeReason::kSafetyTimeout;
  }

  if (!finalize_done) {
    o.state = SessionState::kFailed;
    o.reason = OutcomeReason::kFinalizeTimeout;
    o.error.Set(kScreenRecErrorFinalizeTimeout,
                "Finalizing the output did not complete within " +
                    std::to_string(config.finalize_timeout.count()) + " ms",
                "The file may be incomplete; it is left on disk");
  } else if (!finalize_ok) {
    o.state = SessionState::kFailed;
    o.reason = OutcomeReason::kFinalizeError;
    o.error = finalize_error;
    if (o.error.ok()) {
      o.error.Set(kScreenRecErrorFinalizeFailed, "Writer failed to finalize");
    }
  } else if (!stop_error.ok()) {
    o.state = SessionState::kFailed;
    o.reason = OutcomeReason::kStopError;
    o.error = stop_error;
  } else if (cause == StopCause::kError) {
    o.state = SessionState::kFailed;
    o.reason = OutcomeReason::kCaptureError;
    o.error = capture_error;
  }
  o.possibly_incomplete = o.state == SessionState::kFailed;

  if (o.audio_pre_anchor_dropped > 0) {
    SCREENREC_LOG_DEBUG("Dropped {} audio buffer(s) before the first frame",
                        o.audio_pre_anchor_dropped);
  }
  if (o.video_frames_dropped > 0 || o.audio_buffers_dropped > 0) {
    SCREENREC_LOG_WARN("Dropped {} video frame(s) and {} audio buffer(s)",
                       o.video_frames_dropped, o.audio_buffers_dropped);
  }

  SetState(o.state);
  if (o.state == SessionState::kCompleted) {
    SCREENREC_LOG_INFO("Recording {} after {} ms: {} ({} frames)",
                       OutcomeReasonName(o.reason), o.elapsed.count(),
                       o.output_path, o.video_frames_written);
  } else {
    SCREENREC_LOG_ERROR("Recording failed ({}): {}",
                        OutcomeReasonName(o.reason), o.error.message);
    if (o.output_written) {
      SCREENREC_LOG_WARN("Partial output kept at {} (possibly incomplete)",
                         o.output_path);
    }
  }
  return o;
}

}  // namespace internal
}  // namespace screenrec
