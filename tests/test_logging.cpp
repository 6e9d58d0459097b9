// Copyright 2026 The screenrec Authors
// Tests for: the screenrec logger (callback forwarding, level filtering,
//            error hints, drop warning cadence)

#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/capture_lifecycle_controller.h"
#include "core/logger.h"
#include "core/screenrec_context.h"
#include "fakes.h"
#include "gtest/gtest.h"
#include "screenrec/screenrec.h"

using screenrec::internal::CaptureLifecycleController;
using screenrec::internal::GetLogger;
using screenrec::internal::GetLogLevel;
using screenrec::internal::PixelSize;
using screenrec::internal::ScreenRecContextImpl;
using screenrec::internal::SessionConfig;
using screenrec::internal::SessionOutcome;
using screenrec::internal::test::FakeCaptureService;
using screenrec::internal::test::FakeClock;
using screenrec::internal::test::FakeEnumeration;
using screenrec::internal::test::FakeWriterFactory;
using screenrec::internal::test::MakeScreen;

namespace {

struct LogEntry {
  ScreenRecLogLevel level;
  std::string message;
};

/// Entries may arrive from capture threads.
class LogRecorder {
 public:
  void Add(ScreenRecLogLevel level, const char* message) {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.push_back({level, message ? message : ""});
  }

  std::vector<LogEntry> entries() {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
  }

  int CountContaining(ScreenRecLogLevel level, const std::string& needle) {
    std::lock_guard<std::mutex> lock(mu_);
    int n = 0;
    for (const auto& e : entries_) {
      if (e.level == level && e.message.find(needle) != std::string::npos) ++n;
    }
    return n;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
  }

 private:
  std::mutex mu_;
  std::vector<LogEntry> entries_;
};

void RecordEntry(ScreenRecLogLevel level, const char* message,
                 void* userdata) {
  static_cast<LogRecorder*>(userdata)->Add(level, message);
}

/// Logs again from inside the callback.
void EchoingCallback(ScreenRecLogLevel level, const char* message,
                     void* userdata) {
  static_cast<LogRecorder*>(userdata)->Add(level, message);
  screenrec_log(kScreenRecLogWarn, "echo from callback");
}

}  // namespace

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    screenrec_set_log_level(kScreenRecLogTrace);
    screenrec_set_log_callback(RecordEntry, &log_);
  }

  void TearDown() override {
    screenrec_set_log_callback(nullptr, nullptr);
    screenrec_set_log_level(kScreenRecLogInfo);
  }

  LogRecorder log_;
};

// ---------------------------------------------------------------------------
// Logger wiring
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, LoggerIsNamedAndFlushesWarnings) {
  auto logger = GetLogger();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "screenrec");
  // Warnings must reach the terminal before a forced exit.
  EXPECT_EQ(logger->flush_level(), spdlog::level::warn);
}

TEST_F(LoggingTest, CallbackGetsBareMessageAndLevel) {
  screenrec_log(kScreenRecLogWarn, "Less than 1 GiB free");

  auto entries = log_.entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].level, kScreenRecLogWarn);
  EXPECT_EQ(entries[0].message, "Less than 1 GiB free");
}

TEST_F(LoggingTest, EveryPublicLevelRoundTrips) {
  const ScreenRecLogLevel levels[] = {kScreenRecLogTrace, kScreenRecLogDebug,
                                      kScreenRecLogInfo,  kScreenRecLogWarn,
                                      kScreenRecLogError, kScreenRecLogFatal};
  for (ScreenRecLogLevel level : levels) {
    screenrec_set_log_level(level);
    EXPECT_EQ(GetLogLevel(), level) << level;

    log_.Clear();
    screenrec_log(level, "at threshold");
    auto entries = log_.entries();
    ASSERT_EQ(entries.size(), 1u) << level;
    EXPECT_EQ(entries[0].level, level);
  }
}

TEST_F(LoggingTest, LevelFiltering) {
  screenrec_set_log_level(kScreenRecLogWarn);

  screenrec_log(kScreenRecLogInfo, "Recording started");
  screenrec_log(kScreenRecLogWarn, "Writer not ready");
  screenrec_log(kScreenRecLogError, "Recording failed");

  auto entries = log_.entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].message, "Writer not ready");
  EXPECT_EQ(entries[1].level, kScreenRecLogError);
}

TEST_F(LoggingTest, UnregisterCallback) {
  screenrec_set_log_callback(nullptr, nullptr);
  screenrec_log(kScreenRecLogError, "after unregister");
  EXPECT_TRUE(log_.entries().empty());
}

TEST_F(LoggingTest, NullMessageIsIgnored) {
  screenrec_log(kScreenRecLogError, nullptr);
  EXPECT_TRUE(log_.entries().empty());
}

TEST_F(LoggingTest, CallbackMayLog) {
  screenrec_set_log_callback(EchoingCallback, &log_);
  screenrec_log(kScreenRecLogInfo, "outer");

  // The nested record is not fed back into the callback.
  auto entries = log_.entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].message, "outer");

  screenrec_log(kScreenRecLogInfo, "second");
  EXPECT_EQ(log_.entries().size(), 2u);
}

// ---------------------------------------------------------------------------
// What the library logs
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, ContextErrorLogsHintAtInfo) {
  auto enumeration = std::make_unique<FakeEnumeration>();
  enumeration->screens.push_back(MakeScreen(0, 0, 0, 1920, 1080, 1.0, true));
  ScreenRecContextImpl ctx;
  ASSERT_TRUE(ctx.InitializeWith(std::move(enumeration),
                                 std::make_unique<FakeCaptureService>(),
                                 std::make_unique<FakeWriterFactory>()));
  log_.Clear();

  ScreenRecRecordConfig c;
  std::memset(&c, 0, sizeof(c));
  c.target.kind = kScreenRecTargetScreen;
  c.duration_ms = 200;
  c.area = "center:abc:100";
  ScreenRecOutcome o;
  EXPECT_EQ(ctx.Record(&c, &o), kScreenRecErrorConfiguration);

  EXPECT_EQ(log_.CountContaining(kScreenRecLogError, "center:abc:100"), 1);
  EXPECT_EQ(log_.CountContaining(kScreenRecLogInfo, "Hint: "), 1);
  EXPECT_EQ(log_.CountContaining(kScreenRecLogError, "Hint: "), 0);

  // Hints are informational and disappear at warn level.
  screenrec_set_log_level(kScreenRecLogWarn);
  log_.Clear();
  EXPECT_EQ(ctx.Record(&c, &o), kScreenRecErrorConfiguration);
  EXPECT_EQ(log_.CountContaining(kScreenRecLogError, "center:abc:100"), 1);
  EXPECT_EQ(log_.CountContaining(kScreenRecLogInfo, "Hint: "), 0);
}

TEST_F(LoggingTest, DropWarningOnFirstAndEveryHundredth) {
  FakeClock clock;
  FakeCaptureService capture;
  FakeWriterFactory writers;
  writers.state().ready.store(false);

  SessionConfig c;
  c.geometry.pixel_output_size = PixelSize{640, 480};
  c.geometry.pixel_source_rect.width = 640;
  c.geometry.pixel_source_rect.height = 480;
  c.target.screen = MakeScreen(0, 0, 0, 640, 480, 1.0, true);
  c.duration_ms = 1000;
  c.video.width = 640;
  c.video.height = 480;
  c.output_path = "/tmp/screenrec-logging-test.mov";

  const struct {
    int samples;
    int warnings;
  } cases[] = {{1, 1}, {99, 1}, {100, 2}, {201, 3}};
  for (const auto& tc : cases) {
    capture.state().sync_video_samples = tc.samples;
    CaptureLifecycleController controller(&capture, &writers, &clock);
    log_.Clear();

    SessionOutcome o = controller.Run(c);
    EXPECT_EQ(o.video_frames_dropped, tc.samples);
    EXPECT_EQ(log_.CountContaining(kScreenRecLogWarn, "Writer not ready"),
              tc.warnings)
        << tc.samples;
    // The session total is reported once at finalize.
    EXPECT_EQ(log_.CountContaining(kScreenRecLogWarn,
                                   "Dropped " + std::to_string(tc.samples) +
                                       " video frame(s)"),
              1)
        << tc.samples;
  }
}
