// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_DURATION_TIMEKEEPER_H_
#define SCREENREC_CORE_DURATION_TIMEKEEPER_H_

#include <chrono>

#include "core/clock.h"
#include "core/stop_guard.h"

namespace screenrec {
namespace internal {

enum class TimekeeperResult {
  kOnTime,
  kUserInterrupted,
  kSafetyTimeout,
  kStoppedByError,
};

const char* TimekeeperResultName(TimekeeperResult result);

struct TimekeeperReport {
  TimekeeperResult result = TimekeeperResult::kOnTime;
  std::chrono::milliseconds elapsed{0};
};

/// Decides when a fixed-length recording stops.
///
/// Sleeps in short quanta and checks, in order: monotonic elapsed time
/// against the target; the wall clock against the expected end instant
/// (within the end margin once the target has been slept); the accumulated
/// sleep budget against target plus a safety margin; the interrupt and
/// error flags of the StopGuard.
class DurationTimekeeper {
 public:
  static constexpr std::chrono::milliseconds kDefaultQuantum{100};
  static constexpr std::chrono::milliseconds kDefaultEndMargin{50};
  static constexpr std::chrono::milliseconds kDefaultSafetyMargin{2000};

  /// Neither pointer is owned.
  DurationTimekeeper(Clock* clock, const StopGuard* guard)
      : clock_(clock), guard_(guard) {}

  void set_quantum(std::chrono::milliseconds q) { quantum_ = q; }
  void set_end_margin(std::chrono::milliseconds m) { end_margin_ = m; }
  void set_safety_margin(std::chrono::milliseconds m) { safety_margin_ = m; }

  /// Blocks until `target` has elapsed or a stop condition is seen.
  TimekeeperReport Run(std::chrono::milliseconds target);

 private:
  Clock* clock_;
  const StopGuard* guard_;
  std::chrono::milliseconds quantum_ = kDefaultQuantum;
  std::chrono::milliseconds end_margin_ = kDefaultEndMargin;
  std::chrono::milliseconds safety_margin_ = kDefaultSafetyMargin;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_DURATION_TIMEKEEPER_H_
