// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_CLOCK_H_
#define SCREENREC_CORE_CLOCK_H_

#include <chrono>

namespace screenrec {
namespace internal {

/// Time source for the session.  Tests substitute a manual clock so
/// duration logic runs without real sleeps.
class Clock {
 public:
  virtual ~Clock() = default;

  /// Monotonic time, used for elapsed measurements.
  virtual std::chrono::steady_clock::time_point SteadyNow() = 0;

  /// Wall-clock time, used for the absolute end-time cross-check.
  virtual std::chrono::system_clock::time_point WallNow() = 0;

  virtual void SleepFor(std::chrono::nanoseconds duration) = 0;
};

/// Process-wide real clock.  Never null.
Clock* SystemClock();

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_CLOCK_H_
