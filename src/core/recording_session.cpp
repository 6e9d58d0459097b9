// Copyright 2026 The screenrec Authors

#include "core/recording_session.h"

#include <memory>

#include "core/geometry_resolver.h"
#include "core/logger.h"
#include "core/progress_reporter.h"

namespace screenrec {
namespace internal {

namespace {

constexpr std::chrono::milliseconds kCountdownTick{100};

OutcomeReason ReasonForSetupError(const Error& err) {
  return err.code == kScreenRecErrorCancelled
             ? OutcomeReason::kCancelled
             : OutcomeReason::kConfigurationError;
}

}  // namespace

RecordingSession::RecordingSession(const SessionServices& services)
    : services_(services),
      clock_(services.clock ? services.clock : SystemClock()) {}

SessionOutcome RecordingSession::Run(const RecordRequest& request) {
  if (running_.exchange(true)) {
    Error err;
    err.Set(kScreenRecErrorRecordInProgress, "A recording is already active");
    return SessionOutcome::Failure(OutcomeReason::kConfigurationError, err);
  }
  stop_requested_.store(false);

  struct RunningReset {
    std::atomic<bool>* flag;
    ~RunningReset() { flag->store(false); }
  } running_reset{&running_};

  // Idle -> Configuring: everything here fails before any capture resource
  // is acquired.
  Error err;
  if (!SessionConfigurator::ValidateRequest(request, &err)) {
    return SessionOutcome::Failure(OutcomeReason::kConfigurationError, err);
  }

  GeometryResolver resolver(services_.enumeration);
  ResolvedTarget resolved;
  if (!resolver.Resolve(request.target, request.area, &resolved, &err)) {
    return SessionOutcome::Failure(OutcomeReason::kConfigurationError, err);
  }

  SessionConfigurator configurator(services_.output);
  SessionConfig config;
  if (!configurator.Build(request, resolved, &config, &err)) {
    return SessionOutcome::Failure(ReasonForSetupError(err), err);
  }

  InterruptCoordinator* interrupts =
      request.handle_interrupts ? services_.interrupts : nullptr;
  if (interrupts) {
    interrupts->Register([this] { RequestStop(); }, config.interrupt_grace);
  }

  SessionOutcome outcome;
  if (!Countdown(config.countdown_s)) {
    err.Set(kScreenRecErrorCancelled, "Recording cancelled during countdown");
    outcome = SessionOutcome::Failure(OutcomeReason::kCancelled, err);
  } else {
    CaptureLifecycleController controller(services_.capture,
                                          services_.writers, clock_);
    {
      std::lock_guard<std::mutex> lock(mu_);
      controller_ = &controller;
    }
    // A stop that raced the hand-over is replayed on the controller.
    if (stop_requested_.load()) controller.RequestInterrupt();

    std::unique_ptr<ProgressReporter> progress;
    if (request.show_progress && services_.progress_out) {
      progress = std::make_unique<ProgressReporter>(
          [&controller] { return controller.Snapshot(); }, config.duration_ms,
          services_.progress_out);
      progress->Start();
    }

    outcome = controller.Run(config);

    if (progress) progress->Stop();
    std::lock_guard<std::mutex> lock(mu_);
    controller_ = nullptr;
  }

  if (interrupts) {
    interrupts->NotifyFinalized();
    interrupts->Unregister();
  }
  return outcome;
}

void RecordingSession::RequestStop() {
  stop_requested_.store(true);
  std::lock_guard<std::mutex> lock(mu_);
  if (controller_) controller_->RequestInterrupt();
}

bool RecordingSession::Countdown(int seconds) {
  if (seconds <= 0) return !stop_requested_.load();

  SCREENREC_LOG_INFO("Recording will start in {} s (press Ctrl+C to cancel)",
                     seconds);
  for (int remaining = seconds; remaining > 0; --remaining) {
    SCREENREC_LOG_INFO("  {}...", remaining);
    for (int i = 0; i < 10; ++i) {
      if (stop_requested_.load()) {
        SCREENREC_LOG_INFO("Countdown cancelled");
        return false;
      }
      clock_->SleepFor(kCountdownTick);
    }
  }
  return !stop_requested_.load();
}

int ExitCodeFor(const SessionOutcome& outcome) {
  switch (outcome.reason) {
    case OutcomeReason::kCompleted:
      return outcome.state == SessionState::kCompleted
                 ? kScreenRecExitOk
                 : kScreenRecExitFailure;
    case OutcomeReason::kInterruptedByUser:
    case OutcomeReason::kCancelled:
      return kScreenRecExitInterrupted;
    case OutcomeReason::kConfigurationError:
      return kScreenRecExitConfiguration;
    case OutcomeReason::kFinalizeTimeout:
      // Forced exit status only when the timeout cut short an interrupt.
      return outcome.stop_cause == StopCause::kInterrupt
                 ? kScreenRecExitFinalizeTimeout
                 : kScreenRecExitFailure;
    case OutcomeReason::kSafetyTimeout:
    case OutcomeReason::kCaptureStartError:
    case OutcomeReason::kStopError:
    case OutcomeReason::kFinalizeError:
    case OutcomeReason::kCaptureError:
      return kScreenRecExitFailure;
  }
  return kScreenRecExitFailure;
}

}  // namespace internal
}  // namespace screenrec
