// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_STOP_GUARD_H_
#define SCREENREC_CORE_STOP_GUARD_H_

#include <atomic>

namespace screenrec {
namespace internal {

/// Who won the race to stop the capture.
enum class StopCause {
  kNone = 0,
  kTimer = 1,       ///< Duration elapsed
  kInterrupt = 2,   ///< SIGINT/SIGTERM or screenrec_request_stop
  kError = 3,       ///< Capture or writer failure
  kSafetyTimeout = 4,
};

const char* StopCauseName(StopCause cause);

/// The single exclusive flag through which every stop path passes.
///
/// The timer path, the interrupt path and error paths all call TryTrip();
/// exactly one of them wins and performs the stop.  TryEnterFinalize()
/// likewise admits exactly one caller into finalization.
///
/// The interrupt and error flags are independent of the trip: they record
/// that a request was raised even if another path already won.
class StopGuard {
 public:
  StopGuard() = default;

  StopGuard(const StopGuard&) = delete;
  StopGuard& operator=(const StopGuard&) = delete;

  /// Idle -> tripped.  True for exactly one caller per guard.
  bool TryTrip(StopCause cause) {
    int expected = static_cast<int>(StopCause::kNone);
    return cause_.compare_exchange_strong(expected, static_cast<int>(cause),
                                          std::memory_order_acq_rel);
  }

  bool tripped() const {
    return cause_.load(std::memory_order_acquire) !=
           static_cast<int>(StopCause::kNone);
  }

  StopCause cause() const {
    return static_cast<StopCause>(cause_.load(std::memory_order_acquire));
  }

  void RaiseInterrupt() { interrupt_.store(true, std::memory_order_release); }
  bool interrupt_raised() const {
    return interrupt_.load(std::memory_order_acquire);
  }

  void RaiseError() { error_.store(true, std::memory_order_release); }
  bool error_raised() const { return error_.load(std::memory_order_acquire); }

  /// True for exactly one caller per guard.
  bool TryEnterFinalize() {
    return !finalize_entered_.exchange(true, std::memory_order_acq_rel);
  }

  bool finalize_entered() const {
    return finalize_entered_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<int> cause_{static_cast<int>(StopCause::kNone)};
  std::atomic<bool> interrupt_{false};
  std::atomic<bool> error_{false};
  std::atomic<bool> finalize_entered_{false};
};

inline const char* StopCauseName(StopCause cause) {
  switch (cause) {
    case StopCause::kNone:          return "none";
    case StopCause::kTimer:         return "timer";
    case StopCause::kInterrupt:     return "interrupt";
    case StopCause::kError:         return "error";
    case StopCause::kSafetyTimeout: return "safety-timeout";
  }
  return "unknown";
}

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_STOP_GUARD_H_
