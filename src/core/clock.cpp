// Copyright 2026 The screenrec Authors

#include "core/clock.h"

#include <thread>

namespace screenrec {
namespace internal {

namespace {

class RealClock : public Clock {
 public:
  std::chrono::steady_clock::time_point SteadyNow() override {
    return std::chrono::steady_clock::now();
  }

  std::chrono::system_clock::time_point WallNow() override {
    return std::chrono::system_clock::now();
  }

  void SleepFor(std::chrono::nanoseconds duration) override {
    if (duration.count() > 0) std::this_thread::sleep_for(duration);
  }
};

}  // namespace

Clock* SystemClock() {
  static RealClock clock;
  return &clock;
}

}  // namespace internal
}  // namespace screenrec
