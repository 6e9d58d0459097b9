// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_CAPTURE_LIFECYCLE_CONTROLLER_H_
#define SCREENREC_CORE_CAPTURE_LIFECYCLE_CONTROLLER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "core/capture_service.h"
#include "core/clock.h"
#include "core/container_writer.h"
#include "core/error.h"
#include "core/media_sample.h"
#include "core/session_config.h"
#include "core/stop_guard.h"

namespace screenrec {
namespace internal {

enum class SessionState {
  kIdle = 0,
  kConfiguring = 1,
  kCapturing = 2,
  kStopping = 3,
  kFinalizing = 4,
  kCompleted = 5,
  kFailed = 6,
};

enum class OutcomeReason {
  kCompleted = 0,
  kInterruptedByUser = 1,
  kSafetyTimeout = 2,
  kConfigurationError = 3,
  kCaptureStartError = 4,
  kStopError = 5,
  kFinalizeError = 6,
  kFinalizeTimeout = 7,
  kCancelled = 8,
  kCaptureError = 9,
};

const char* SessionStateName(SessionState state);
const char* OutcomeReasonName(OutcomeReason reason);

/// Terminal record of one recording attempt.
struct SessionOutcome {
  SessionState state = SessionState::kIdle;
  OutcomeReason reason = OutcomeReason::kCompleted;
  StopCause stop_cause = StopCause::kNone;  ///< Who won the stop transition
  Error error;
  std::chrono::milliseconds elapsed{0};
  std::string output_path;
  bool output_written = false;
  bool possibly_incomplete = false;
  int64_t video_frames_written = 0;
  int64_t video_frames_dropped = 0;
  int64_t audio_buffers_written = 0;
  int64_t audio_buffers_dropped = 0;
  int64_t audio_pre_anchor_dropped = 0;
  int64_t bytes_written = 0;

  /// A Failed outcome for errors raised before any capture resource exists.
  static SessionOutcome Failure(OutcomeReason reason, const Error& err);
};

/// Live counters for progress reporting.
struct ProgressSnapshot {
  bool capturing = false;
  std::chrono::milliseconds elapsed{0};
  int64_t video_frames_written = 0;
  int64_t video_frames_dropped = 0;
  int64_t audio_buffers_written = 0;
};

/// Drives one capture session: Configuring -> Capturing -> Stopping ->
/// Finalizing -> Completed | Failed.
///
/// Run() executes on the caller's thread.  RequestInterrupt() and
/// BeginStopping() may be called from any other thread.  Sample callbacks
/// run on the capture service's threads; they never stop the stream and
/// only take the per-modality gate lock.
class CaptureLifecycleController {
 public:
  /// None of the pointers are owned.
  CaptureLifecycleController(CaptureService* capture,
                             ContainerWriterFactory* writers, Clock* clock);
  ~CaptureLifecycleController();

  // Non-copyable.
  CaptureLifecycleController(const CaptureLifecycleController&) = delete;
  CaptureLifecycleController& operator=(const CaptureLifecycleController&) =
      delete;

  /// Blocks until the session reaches a terminal state.  Call once.
  SessionOutcome Run(const SessionConfig& config);

  /// Capturing -> Stopping.  Only the first caller (across all threads)
  /// stops the stream; the rest return false immediately.
  bool BeginStopping(StopCause cause);

  /// Interrupt path: raise the interrupt flag, then BeginStopping().
  void RequestInterrupt();

  SessionState state() const { return state_.load(); }
  const StopGuard& stop_guard() const { return guard_; }

  ProgressSnapshot Snapshot() const;

 private:
  /// Per-modality gate.  The mutex serializes appends of one kind and
  /// closes the kind atomically at the stop boundary.
  struct SampleGate {
    std::mutex mu;
    bool accepting = false;
    std::atomic<int64_t> written{0};
    std::atomic<int64_t> dropped{0};
  };

  SampleGate& gate(MediaKind kind) {
    return kind == MediaKind::kVideo ? video_gate_ : audio_gate_;
  }

  bool Configure(const SessionConfig& config, Error* err);
  bool StartCapture(Error* err);
  void WaitForStop(const SessionConfig& config);
  SessionOutcome FinalizeSession(const SessionConfig& config);

  void OnSample(const MediaSample& sample);
  // Records the first mid-capture failure and raises the stop guard.
  void OnStreamError(const Error& e);
  void NoteDrop(MediaKind kind, int64_t count);
  void CloseGates();
  void SetState(SessionState s);

  CaptureService* capture_;
  ContainerWriterFactory* writers_;
  Clock* clock_;

  StopGuard guard_;
  std::atomic<SessionState> state_{SessionState::kIdle};

  std::shared_ptr<ContainerWriter> writer_;
  std::unique_ptr<CaptureStream> stream_;

  // Guards stream start/stop and the stop latch.
  std::mutex lifecycle_mu_;
  std::condition_variable stop_cv_;
  bool capture_started_ = false;
  bool stop_done_ = false;
  Error stop_error_;

  std::mutex error_mu_;
  Error capture_error_;  // Set from sample threads.
  std::chrono::steady_clock::time_point capture_start_;
  std::chrono::steady_clock::time_point stop_instant_;

  SampleGate video_gate_;
  SampleGate audio_gate_;
  std::atomic<bool> anchored_{false};
  std::atomic<int64_t> anchor_ts_{0};
  std::atomic<int64_t> pre_anchor_dropped_{0};
  std::atomic<int64_t> capture_start_ns_{0};
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_CAPTURE_LIFECYCLE_CONTROLLER_H_
