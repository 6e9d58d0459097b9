// Copyright 2026 The screenrec Authors
// Tests for: screenrec_context_create, screenrec_context_destroy,
//            screenrec_get_last_error, screenrec_get_last_error_message,
//            screenrec_exit_code_for, ScreenRecContextImpl

#include <ftw.h>
#include <stdlib.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>

#include "core/screenrec_context.h"
#include "fakes.h"
#include "gtest/gtest.h"
#include "screenrec/screenrec.h"

using screenrec::internal::ScreenRecContextImpl;
using screenrec::internal::test::FakeCaptureService;
using screenrec::internal::test::FakeEnumeration;
using screenrec::internal::test::FakeWriterFactory;
using screenrec::internal::test::MakeScreen;
using screenrec::internal::test::MakeWindow;

// ---------------------------------------------------------------------------
// Context lifecycle
// ---------------------------------------------------------------------------

TEST(ContextTest, CreateReturnsNonNull) {
  ScreenRecContext* ctx = screenrec_context_create();
  ASSERT_NE(ctx, nullptr);
  screenrec_context_destroy(ctx);
}

TEST(ContextTest, DestroyNullIsSafe) {
  // Must not crash.
  screenrec_context_destroy(nullptr);
}

TEST(ContextTest, CreateMultipleContexts) {
  ScreenRecContext* a = screenrec_context_create();
  ScreenRecContext* b = screenrec_context_create();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a, b);
  screenrec_context_destroy(b);
  screenrec_context_destroy(a);
}

TEST(ContextTest, ScreenCountWithoutDisplay) {
  if (std::getenv("DISPLAY") != nullptr) {
    GTEST_SKIP() << "A display is available";
  }
  ScreenRecContext* ctx = screenrec_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(screenrec_get_screen_count(ctx), -1);
  EXPECT_EQ(screenrec_get_last_error(ctx), kScreenRecErrorDisplayUnavailable);
  EXPECT_STRNE(screenrec_get_last_error_hint(ctx), "");
  screenrec_context_destroy(ctx);
}

// ---------------------------------------------------------------------------
// Error state
// ---------------------------------------------------------------------------

TEST(ContextTest, InitialErrorIsOk) {
  ScreenRecContext* ctx = screenrec_context_create();
  ASSERT_NE(ctx, nullptr);
  EXPECT_EQ(screenrec_get_last_error(ctx), kScreenRecOk);
  EXPECT_STREQ(screenrec_get_last_error_message(ctx), "No error");
  screenrec_context_destroy(ctx);
}

TEST(ContextTest, NullContextCalls) {
  EXPECT_EQ(screenrec_get_last_error(nullptr), kScreenRecErrorInvalidParam);
  EXPECT_STREQ(screenrec_get_last_error_message(nullptr),
               "Invalid context (NULL)");
  EXPECT_STREQ(screenrec_get_last_error_hint(nullptr), "");
  EXPECT_EQ(screenrec_get_screen_count(nullptr), -1);
  EXPECT_EQ(screenrec_enumerate_applications(nullptr, nullptr, 0), -1);

  ScreenRecScreenInfo info;
  EXPECT_EQ(screenrec_get_screen_info(nullptr, 1, &info),
            kScreenRecErrorInvalidParam);
  ScreenRecRecordConfig config;
  std::memset(&config, 0, sizeof(config));
  ScreenRecOutcome outcome;
  EXPECT_EQ(screenrec_record(nullptr, &config, &outcome),
            kScreenRecErrorInvalidParam);
  screenrec_request_stop(nullptr);
}

// ---------------------------------------------------------------------------
// Exit codes
// ---------------------------------------------------------------------------

TEST(ContextTest, ExitCodeFor) {
  ScreenRecOutcome o;
  std::memset(&o, 0, sizeof(o));
  o.state = kScreenRecStateCompleted;
  o.reason = kScreenRecReasonCompleted;
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitOk);

  o.reason = kScreenRecReasonInterruptedByUser;
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitInterrupted);

  o.reason = kScreenRecReasonSafetyTimeout;
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitFailure);

  o.state = kScreenRecStateFailed;
  o.reason = kScreenRecReasonConfigurationError;
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitConfiguration);

  o.reason = kScreenRecReasonFinalizeTimeout;
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitFailure);
  o.interrupted = 1;
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitFinalizeTimeout);

  EXPECT_EQ(screenrec_exit_code_for(nullptr), kScreenRecExitFailure);
}

// ---------------------------------------------------------------------------
// ScreenRecContextImpl over in-memory services
// ---------------------------------------------------------------------------

namespace {

int RemoveEntry(const char* path, const struct stat* /*sb*/, int /*flag*/,
                struct FTW* /*ftw*/) {
  return ::remove(path);
}

}  // namespace

class ContextImplTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto enumeration = std::make_unique<FakeEnumeration>();
    enumeration->screens.push_back(
        MakeScreen(0, 0, 0, 1920, 1080, 1.0, true));
    enumeration->screens.push_back(MakeScreen(1, 1920, 0, 1440, 900, 2.0));
    enumeration->windows.push_back(
        MakeWindow(11, "Firefox", "Start Page", 50, 50, 1200, 800));
    enumeration->windows.push_back(
        MakeWindow(12, "Firefox", "Downloads", 100, 100, 400, 300));
    enumeration->AddApp("Firefox", "firefox", 321);
    enumeration->AddApp("Gedit", "gedit", 654);
    enumeration_ = enumeration.get();

    ASSERT_TRUE(ctx_.InitializeWith(std::move(enumeration),
                                    std::make_unique<FakeCaptureService>(),
                                    std::make_unique<FakeWriterFactory>()));
    ctx_.set_progress_stream(&progress_);
    ctx_.output_resolver().set_interactive_check([] { return false; });

    char tmpl[] = "/tmp/screenrec_ctx_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    dir_ = dir;
  }

  void TearDown() override {
    if (!dir_.empty()) {
      ::nftw(dir_.c_str(), &RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
    }
  }

  ScreenRecRecordConfig BaseConfig() {
    ScreenRecRecordConfig c;
    std::memset(&c, 0, sizeof(c));
    c.target.kind = kScreenRecTargetScreen;
    c.duration_ms = 200;
    path_ = dir_ + "/clip.mov";
    c.output_path = path_.c_str();
    return c;
  }

  ScreenRecContextImpl ctx_;
  FakeEnumeration* enumeration_ = nullptr;
  std::ostringstream progress_;
  std::string dir_;
  std::string path_;
};

TEST_F(ContextImplTest, InitializeWithRejectsMissingService) {
  ScreenRecContextImpl other;
  EXPECT_FALSE(other.InitializeWith(nullptr,
                                    std::make_unique<FakeCaptureService>(),
                                    std::make_unique<FakeWriterFactory>()));
  EXPECT_EQ(other.last_error(), kScreenRecErrorInvalidParam);
  EXPECT_FALSE(other.is_initialized());
}

TEST_F(ContextImplTest, NotInitialized) {
  ScreenRecContextImpl other;
  EXPECT_EQ(other.GetScreenCount(), -1);
  EXPECT_EQ(other.last_error(), kScreenRecErrorNotInitialized);

  ScreenRecRecordConfig c = BaseConfig();
  ScreenRecOutcome o;
  std::memset(&o, 0x7f, sizeof(o));
  EXPECT_EQ(other.Record(&c, &o), kScreenRecErrorNotInitialized);
  EXPECT_EQ(o.state, kScreenRecStateFailed);
  EXPECT_EQ(o.reason, kScreenRecReasonCaptureStartError);
  EXPECT_EQ(o.error, kScreenRecErrorNotInitialized);
  EXPECT_EQ(o.output_written, 0);
  EXPECT_STREQ(o.output_path, "");
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitFailure);
}

TEST_F(ContextImplTest, ScreenInfo) {
  EXPECT_EQ(ctx_.GetScreenCount(), 2);

  ScreenRecScreenInfo info;
  ASSERT_EQ(ctx_.GetScreenInfo(2, &info), kScreenRecOk);
  EXPECT_EQ(info.index, 2);
  EXPECT_EQ(info.pixel_width, 2880);
  EXPECT_EQ(info.pixel_height, 1800);
  EXPECT_DOUBLE_EQ(info.scale_factor, 2.0);
  EXPECT_DOUBLE_EQ(info.frame.x, 1920);
  EXPECT_EQ(info.is_primary, 0);
  EXPECT_STREQ(info.name, "Screen 2");

  ASSERT_EQ(ctx_.GetScreenInfo(1, &info), kScreenRecOk);
  EXPECT_EQ(info.is_primary, 1);

  EXPECT_EQ(ctx_.GetScreenInfo(0, &info), kScreenRecErrorScreenNotFound);
  EXPECT_EQ(ctx_.GetScreenInfo(3, &info), kScreenRecErrorScreenNotFound);
  EXPECT_EQ(ctx_.GetScreenInfo(1, nullptr), kScreenRecErrorInvalidParam);
}

TEST_F(ContextImplTest, EnumerateApplications) {
  EXPECT_EQ(ctx_.EnumerateApplications(nullptr, 0), 2);

  ScreenRecApplicationInfo apps[4];
  ASSERT_EQ(ctx_.EnumerateApplications(apps, 4), 2);
  EXPECT_STREQ(apps[0].id, "Firefox");
  EXPECT_STREQ(apps[0].name, "firefox");
  EXPECT_EQ(apps[0].pid, 321);
  EXPECT_EQ(apps[0].window_count, 2);
  EXPECT_EQ(apps[1].window_count, 0);

  EXPECT_EQ(ctx_.EnumerateApplications(apps, 1), 1);
  EXPECT_EQ(ctx_.EnumerateApplications(apps, 0), -1);
  EXPECT_EQ(ctx_.last_error(), kScreenRecErrorInvalidParam);
}

TEST_F(ContextImplTest, EnumerationFailureIsReported) {
  enumeration_->fail_code = kScreenRecErrorDisplayUnavailable;
  EXPECT_EQ(ctx_.GetScreenCount(), -1);
  EXPECT_EQ(ctx_.last_error(), kScreenRecErrorDisplayUnavailable);
}

TEST_F(ContextImplTest, ResolveScreenGeometry) {
  ScreenRecTarget target;
  target.kind = kScreenRecTargetScreen;
  target.screen_index = 0;
  target.application = nullptr;

  ScreenRecGeometry g;
  ASSERT_EQ(ctx_.ResolveGeometry(&target, "center:800:600", &g), kScreenRecOk);
  EXPECT_EQ(g.pixel_width, 800);
  EXPECT_EQ(g.pixel_height, 600);
  EXPECT_DOUBLE_EQ(g.logical_source.x, 560);
  EXPECT_DOUBLE_EQ(g.logical_source.y, 240);
  EXPECT_EQ(g.screen_index, 1);
  EXPECT_EQ(g.window_id, 0u);

  target.screen_index = 2;
  ASSERT_EQ(ctx_.ResolveGeometry(&target, nullptr, &g), kScreenRecOk);
  EXPECT_EQ(g.pixel_width, 2880);
  EXPECT_EQ(g.screen_index, 2);
}

TEST_F(ContextImplTest, ResolveApplicationGeometry) {
  ScreenRecTarget target;
  target.kind = kScreenRecTargetApplication;
  target.screen_index = 0;
  target.application = "firefox";

  ScreenRecGeometry g;
  ASSERT_EQ(ctx_.ResolveGeometry(&target, nullptr, &g), kScreenRecOk);
  EXPECT_EQ(g.window_id, 11u);
  EXPECT_STREQ(g.window_title, "Start Page");
  EXPECT_EQ(g.pixel_width, 1200);

  target.application = "";
  EXPECT_EQ(ctx_.ResolveGeometry(&target, nullptr, &g),
            kScreenRecErrorInvalidParam);
  target.application = "thunderbird";
  EXPECT_EQ(ctx_.ResolveGeometry(&target, nullptr, &g),
            kScreenRecErrorApplicationNotFound);
}

TEST_F(ContextImplTest, ResolveRejectsBadArea) {
  ScreenRecTarget target;
  target.kind = kScreenRecTargetScreen;
  target.screen_index = 1;
  target.application = nullptr;

  ScreenRecGeometry g;
  EXPECT_EQ(ctx_.ResolveGeometry(&target, "10:10", &g),
            kScreenRecErrorConfiguration);
  EXPECT_STRNE(ctx_.last_error_hint(), "");
  EXPECT_EQ(ctx_.ResolveGeometry(&target, "0:0:4000:100", &g),
            kScreenRecErrorAreaOutOfBounds);
  EXPECT_EQ(ctx_.ResolveGeometry(nullptr, nullptr, &g),
            kScreenRecErrorInvalidParam);
}

TEST_F(ContextImplTest, RecordCompletes) {
  ScreenRecRecordConfig c = BaseConfig();
  ScreenRecOutcome o;
  ASSERT_EQ(ctx_.Record(&c, &o), kScreenRecOk) << ctx_.last_error_message();
  EXPECT_EQ(o.state, kScreenRecStateCompleted);
  EXPECT_EQ(o.reason, kScreenRecReasonCompleted);
  EXPECT_EQ(o.error, kScreenRecOk);
  EXPECT_GE(o.elapsed_ms, 200);
  EXPECT_EQ(o.video_frames_written, 3);
  EXPECT_EQ(o.output_written, 1);
  EXPECT_EQ(std::string(o.output_path), path_);
  EXPECT_EQ(o.interrupted, 0);
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitOk);
  EXPECT_EQ(ctx_.last_error(), kScreenRecOk);
}

TEST_F(ContextImplTest, RecordConfigurationError) {
  ScreenRecRecordConfig c = BaseConfig();
  c.fps = 24;
  ScreenRecOutcome o;
  EXPECT_EQ(ctx_.Record(&c, &o), kScreenRecErrorConfiguration);
  EXPECT_EQ(o.state, kScreenRecStateFailed);
  EXPECT_EQ(o.reason, kScreenRecReasonConfigurationError);
  EXPECT_EQ(o.output_written, 0);
  EXPECT_STREQ(o.output_path, "");
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitConfiguration);
}

TEST_F(ContextImplTest, RecordBadAreaString) {
  ScreenRecRecordConfig c = BaseConfig();
  c.area = "center:abc:100";
  ScreenRecOutcome o;
  EXPECT_EQ(ctx_.Record(&c, &o), kScreenRecErrorConfiguration);
  EXPECT_EQ(o.state, kScreenRecStateFailed);
  EXPECT_EQ(o.reason, kScreenRecReasonConfigurationError);
}

TEST_F(ContextImplTest, RecordNullArguments) {
  ScreenRecRecordConfig c = BaseConfig();
  ScreenRecOutcome o;
  std::memset(&o, 0x7f, sizeof(o));
  EXPECT_EQ(ctx_.Record(nullptr, &o), kScreenRecErrorInvalidParam);
  EXPECT_EQ(o.state, kScreenRecStateFailed);
  EXPECT_EQ(o.reason, kScreenRecReasonConfigurationError);
  EXPECT_EQ(o.error, kScreenRecErrorInvalidParam);
  EXPECT_EQ(o.output_written, 0);
  EXPECT_EQ(screenrec_exit_code_for(&o), kScreenRecExitConfiguration);
  EXPECT_EQ(ctx_.Record(&c, nullptr), kScreenRecErrorInvalidParam);
}

TEST_F(ContextImplTest, RequestStopWithoutSessionIsHarmless) {
  ctx_.RequestStop();
  ScreenRecRecordConfig c = BaseConfig();
  ScreenRecOutcome o;
  EXPECT_EQ(ctx_.Record(&c, &o), kScreenRecOk);
  EXPECT_EQ(o.reason, kScreenRecReasonCompleted);
}
