// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_PROGRESS_REPORTER_H_
#define SCREENREC_CORE_PROGRESS_REPORTER_H_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include "core/capture_lifecycle_controller.h"

namespace screenrec {
namespace internal {

/// Prints a status line once per interval while capture is running.
/// Output problems are ignored; the reporter never influences the session.
class ProgressReporter {
 public:
  using SnapshotFn = std::function<ProgressSnapshot()>;

  /// `expected_duration_ms` is kContinuousDuration for continuous mode.
  /// `out` is not owned and must outlive the reporter.
  ProgressReporter(SnapshotFn source, int64_t expected_duration_ms,
                   std::ostream* out,
                   std::chrono::milliseconds interval =
                       std::chrono::milliseconds(1000));
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter&) = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  void Start();

  /// Joins the timer thread and ends the status line.
  void Stop();

  /// Writes one line now if capturing.  Called by the timer thread.
  void Tick();

  int lines_written() const { return lines_written_; }

  static std::string FormatLine(const ProgressSnapshot& snap,
                                int64_t expected_duration_ms);

  /// "S.mmms" below a minute, "M:SS.mmm" above.
  static std::string FormatDuration(std::chrono::milliseconds d);

  /// `width` cells, filled in proportion to `fraction` (clamped to [0,1]).
  static std::string ProgressBar(double fraction, int width);

 private:
  void Loop();

  SnapshotFn source_;
  int64_t expected_duration_ms_;
  std::ostream* out_;
  std::chrono::milliseconds interval_;

  std::thread thread_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool running_ = false;
  int lines_written_ = 0;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_PROGRESS_REPORTER_H_
