// Copyright 2026 The screenrec Authors

#include "core/duration_timekeeper.h"

#include <algorithm>

#include "core/logger.h"

namespace screenrec {
namespace internal {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;

constexpr milliseconds DurationTimekeeper::kDefaultQuantum;
constexpr milliseconds DurationTimekeeper::kDefaultEndMargin;
constexpr milliseconds DurationTimekeeper::kDefaultSafetyMargin;

const char* TimekeeperResultName(TimekeeperResult result) {
  switch (result) {
    case TimekeeperResult::kOnTime:          return "on-time";
    case TimekeeperResult::kUserInterrupted: return "user-interrupted";
    case TimekeeperResult::kSafetyTimeout:   return "safety-timeout";
    case TimekeeperResult::kStoppedByError:  return "stopped-by-error";
  }
  return "unknown";
}

TimekeeperReport DurationTimekeeper::Run(milliseconds target) {
  const auto start = clock_->SteadyNow();
  const auto expected_end = clock_->WallNow() + target;
  const nanoseconds target_ns = target;
  nanoseconds slept{0};

  SCREENREC_LOG_DEBUG("Timekeeper started, target {} ms", target.count());

  auto report = [&](TimekeeperResult r) {
    TimekeeperReport rep;
    rep.result = r;
    rep.elapsed = duration_cast<milliseconds>(clock_->SteadyNow() - start);
    SCREENREC_LOG_DEBUG("Timekeeper finished: {} after {} ms",
                        TimekeeperResultName(r), rep.elapsed.count());
    return rep;
  };

  for (;;) {
    const nanoseconds elapsed = clock_->SteadyNow() - start;
    if (elapsed >= target_ns) return report(TimekeeperResult::kOnTime);

    // Absolute cross-check against sleep-quantum drift.  The end margin
    // only applies once the full target has been slept.
    const auto wall_now = clock_->WallNow();
    if (wall_now >= expected_end ||
        (slept >= target_ns && wall_now + end_margin_ >= expected_end))
      return report(TimekeeperResult::kOnTime);

    // The monotonic clock disagrees with the time spent sleeping.
    if (std::max(elapsed, slept) > target_ns + safety_margin_) {
      SCREENREC_LOG_WARN(
          "Recording exceeded its duration by more than {} ms, forcing stop",
          safety_margin_.count());
      return report(TimekeeperResult::kSafetyTimeout);
    }

    if (guard_) {
      if (guard_->interrupt_raised())
        return report(TimekeeperResult::kUserInterrupted);
      if (guard_->error_raised())
        return report(TimekeeperResult::kStoppedByError);
    }

    nanoseconds step = std::min<nanoseconds>(quantum_, target_ns - elapsed);
    clock_->SleepFor(step);
    slept += step;
  }
}

}  // namespace internal
}  // namespace screenrec
