// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_RECORDING_SESSION_H_
#define SCREENREC_CORE_RECORDING_SESSION_H_

#include <atomic>
#include <mutex>
#include <ostream>

#include "core/capture_lifecycle_controller.h"
#include "core/capture_service.h"
#include "core/clock.h"
#include "core/container_writer.h"
#include "core/enumeration_service.h"
#include "core/interrupt_coordinator.h"
#include "core/output_path.h"
#include "core/session_config.h"

namespace screenrec {
namespace internal {

/// Collaborators of a recording attempt.  None are owned; only
/// `enumeration`, `capture` and `writers` are required.
struct SessionServices {
  EnumerationService* enumeration = nullptr;
  CaptureService* capture = nullptr;
  ContainerWriterFactory* writers = nullptr;
  OutputPathResolver* output = nullptr;   ///< Null: use the path verbatim
  Clock* clock = nullptr;                 ///< Null: system clock
  InterruptCoordinator* interrupts = nullptr;
  std::ostream* progress_out = nullptr;   ///< Null: no progress line
};

/// One recording attempt: resolve the target, build the SessionConfig,
/// count down, then hand over to a CaptureLifecycleController.
class RecordingSession {
 public:
  explicit RecordingSession(const SessionServices& services);

  RecordingSession(const RecordingSession&) = delete;
  RecordingSession& operator=(const RecordingSession&) = delete;

  SessionOutcome Run(const RecordRequest& request);

  /// User interrupt.  Cancels a countdown, or stops an active capture.
  /// Any thread; no-op once the session has finished.
  void RequestStop();

  bool active() const { return running_.load(); }

 private:
  /// False if cancelled.
  bool Countdown(int seconds);

  SessionServices services_;
  Clock* clock_;

  std::mutex mu_;
  CaptureLifecycleController* controller_ = nullptr;  // Valid during Run.
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
};

/// Process exit status for an outcome (kScreenRecExit* values).
int ExitCodeFor(const SessionOutcome& outcome);

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_RECORDING_SESSION_H_
