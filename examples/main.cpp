// Copyright 2026 The screenrec Authors
//
// screenrec -- command-line screen recorder.
// Entry point: merges settings.ini and argv, then drives the C API.

#include <cstdio>
#include <memory>
#include <string>

#include "cli_options.h"
#include "core/platform_settings.h"
#include "screenrec/screenrec.h"

namespace {

const char* ReasonText(ScreenRecOutcomeReason reason) {
  switch (reason) {
    case kScreenRecReasonCompleted:          return "completed";
    case kScreenRecReasonInterruptedByUser:  return "stopped by user";
    case kScreenRecReasonSafetyTimeout:      return "stopped by safety timeout";
    case kScreenRecReasonConfigurationError: return "configuration error";
    case kScreenRecReasonCaptureStartError:  return "capture failed to start";
    case kScreenRecReasonStopError:          return "capture failed to stop";
    case kScreenRecReasonFinalizeError:      return "finalizing failed";
    case kScreenRecReasonFinalizeTimeout:    return "finalizing timed out";
    case kScreenRecReasonCancelled:          return "cancelled";
    case kScreenRecReasonCaptureError:       return "capture error";
  }
  return "unknown";
}

void PrintLastError(ScreenRecContext* ctx) {
  std::fprintf(stderr, "error: %s\n", screenrec_get_last_error_message(ctx));
  const char* hint = screenrec_get_last_error_hint(ctx);
  if (hint && hint[0]) std::fprintf(stderr, "  hint: %s\n", hint);
}

int ListScreens(ScreenRecContext* ctx) {
  int count = screenrec_get_screen_count(ctx);
  if (count < 0) {
    PrintLastError(ctx);
    return kScreenRecExitFailure;
  }
  std::printf("Available screens:\n");
  for (int i = 1; i <= count; ++i) {
    ScreenRecScreenInfo info;
    if (screenrec_get_screen_info(ctx, i, &info) != kScreenRecOk) {
      PrintLastError(ctx);
      return kScreenRecExitFailure;
    }
    std::printf("  %d: %s  %dx%d pixels (%.0fx%.0f @ %.2fx)%s\n", info.index,
                info.name, info.pixel_width, info.pixel_height,
                info.frame.width, info.frame.height,
                info.scale_factor, info.is_primary ? "  [primary]" : "");
  }
  return kScreenRecExitOk;
}

int ListApps(ScreenRecContext* ctx) {
  int count = screenrec_enumerate_applications(ctx, nullptr, 0);
  if (count < 0) {
    PrintLastError(ctx);
    return kScreenRecExitFailure;
  }
  if (count == 0) {
    std::printf("No applications with recordable windows.\n");
    return kScreenRecExitOk;
  }
  std::unique_ptr<ScreenRecApplicationInfo[]> apps(
      new ScreenRecApplicationInfo[count]);
  count = screenrec_enumerate_applications(ctx, apps.get(), count);
  if (count < 0) {
    PrintLastError(ctx);
    return kScreenRecExitFailure;
  }
  std::printf("Running applications:\n");
  for (int i = 0; i < count; ++i) {
    std::printf("  %-24s %-24s pid %-7d %d window%s\n", apps[i].name,
                apps[i].id, apps[i].pid, apps[i].window_count,
                apps[i].window_count == 1 ? "" : "s");
  }
  return kScreenRecExitOk;
}

int Record(ScreenRecContext* ctx, const CliOptions& opts) {
  ScreenRecRecordConfig cfg = ToRecordConfig(opts);
  ScreenRecOutcome outcome = {};
  ScreenRecError rc = screenrec_record(ctx, &cfg, &outcome);
  if (rc == kScreenRecErrorInvalidParam) {
    PrintLastError(ctx);
    return kScreenRecExitFailure;
  }

  if (outcome.state == kScreenRecStateCompleted &&
      outcome.reason == kScreenRecReasonCompleted) {
    std::printf("Saved %s (%.1f s, %lld frames", outcome.output_path,
                outcome.elapsed_ms / 1000.0,
                static_cast<long long>(outcome.video_frames_written));
    if (outcome.video_frames_dropped > 0) {
      std::printf(", %lld dropped",
                  static_cast<long long>(outcome.video_frames_dropped));
    }
    std::printf(")\n");
  } else if (outcome.output_written) {
    std::printf("Recording %s; saved %s (%.1f s)%s\n",
                ReasonText(outcome.reason), outcome.output_path,
                outcome.elapsed_ms / 1000.0,
                outcome.possibly_incomplete ? ", file may be incomplete" : "");
  } else if (outcome.reason == kScreenRecReasonCancelled) {
    std::printf("Recording cancelled; nothing was saved.\n");
  }
  if (rc != kScreenRecOk && outcome.reason != kScreenRecReasonCancelled) {
    PrintLastError(ctx);
  }
  return screenrec_exit_code_for(&outcome);
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  auto settings = CreatePlatformSettings();
  ApplySettings(settings.get(), &opts);

  std::string error;
  if (!ParseCliOptions(argc, argv, &opts, &error)) {
    std::fprintf(stderr, "error: %s\n", error.c_str());
    std::fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
    return kScreenRecExitConfiguration;
  }

  if (opts.command == CliCommand::kHelp) {
    PrintUsage(stdout, argv[0]);
    return kScreenRecExitOk;
  }
  if (opts.command == CliCommand::kVersion) {
    std::printf("screenrec %s\n", screenrec_version_string());
    return kScreenRecExitOk;
  }

  screenrec_set_log_level(opts.log_level);

  ScreenRecContext* ctx = screenrec_context_create();
  if (!ctx) {
    std::fprintf(stderr, "error: out of memory\n");
    return kScreenRecExitFailure;
  }

  int ret = kScreenRecExitOk;
  switch (opts.command) {
    case CliCommand::kListScreens:
      ret = ListScreens(ctx);
      break;
    case CliCommand::kListApps:
      ret = ListApps(ctx);
      break;
    default:
      ret = Record(ctx, opts);
      break;
  }

  screenrec_context_destroy(ctx);
  return ret;
}
