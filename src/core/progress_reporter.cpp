// Copyright 2026 The screenrec Authors

#include "core/progress_reporter.h"

#include <algorithm>
#include <utility>

#include "spdlog/fmt/fmt.h"

#include "core/session_config.h"

namespace screenrec {
namespace internal {

namespace {

constexpr int kBarWidth = 30;
constexpr char kClearLine[] = "\r\033[K";

}  // namespace

ProgressReporter::ProgressReporter(SnapshotFn source,
                                   int64_t expected_duration_ms,
                                   std::ostream* out,
                                   std::chrono::milliseconds interval)
    : source_(std::move(source)),
      expected_duration_ms_(expected_duration_ms),
      out_(out),
      interval_(interval) {}

ProgressReporter::~ProgressReporter() { Stop(); }

void ProgressReporter::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_ || !out_ || !source_) return;
  running_ = true;
  thread_ = std::thread([this] { Loop(); });
}

void ProgressReporter::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  if (lines_written_ > 0 && out_) {
    *out_ << "\n" << std::flush;
  }
}

void ProgressReporter::Loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;
    lock.unlock();
    Tick();
    lock.lock();
  }
}

void ProgressReporter::Tick() {
  ProgressSnapshot snap = source_();
  if (!snap.capturing) return;
  *out_ << kClearLine << FormatLine(snap, expected_duration_ms_)
        << std::flush;
  out_->clear();  // A failed terminal write must not stop later ticks.
  ++lines_written_;
}

std::string ProgressReporter::FormatLine(const ProgressSnapshot& snap,
                                         int64_t expected_duration_ms) {
  std::string frames =
      fmt::format("{} frames", snap.video_frames_written);
  if (snap.video_frames_dropped > 0) {
    frames += fmt::format(", {} dropped", snap.video_frames_dropped);
  }

  if (expected_duration_ms == kContinuousDuration ||
      expected_duration_ms <= 0) {
    return fmt::format("Recording... | Elapsed: {} | {} (press Ctrl+C to stop)",
                       FormatDuration(snap.elapsed), frames);
  }

  const double fraction =
      static_cast<double>(snap.elapsed.count()) / expected_duration_ms;
  const std::chrono::milliseconds total(expected_duration_ms);
  const std::chrono::milliseconds remaining =
      std::max(std::chrono::milliseconds(0), total - snap.elapsed);
  return fmt::format("Recording [{}] {:.1f}% | {} / {} | Remaining: {} | {}",
                     ProgressBar(fraction, kBarWidth),
                     std::min(1.0, std::max(0.0, fraction)) * 100.0,
                     FormatDuration(snap.elapsed), FormatDuration(total),
                     FormatDuration(remaining), frames);
}

std::string ProgressReporter::FormatDuration(std::chrono::milliseconds d) {
  int64_t ms = std::max<int64_t>(0, d.count());
  int64_t total_s = ms / 1000;
  int64_t minutes = total_s / 60;
  int64_t seconds = total_s % 60;
  int64_t millis = ms % 1000;
  if (minutes > 0) {
    return fmt::format("{}:{:02d}.{:03d}", minutes, seconds, millis);
  }
  return fmt::format("{}.{:03d}s", seconds, millis);
}

std::string ProgressReporter::ProgressBar(double fraction, int width) {
  fraction = std::min(1.0, std::max(0.0, fraction));
  int filled = static_cast<int>(fraction * width);
  return std::string(filled, '#') + std::string(width - filled, '-');
}

}  // namespace internal
}  // namespace screenrec
