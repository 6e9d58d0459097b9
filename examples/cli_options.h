// Copyright 2026 The screenrec Authors
//
// Command-line parsing for the screenrec front end.

#ifndef SCREENREC_EXAMPLES_CLI_OPTIONS_H_
#define SCREENREC_EXAMPLES_CLI_OPTIONS_H_

#include <cstdint>
#include <cstdio>
#include <string>

#include "screenrec/screenrec.h"

class IPlatformSettings;

enum class CliCommand {
  kRecord,
  kListScreens,
  kListApps,
  kHelp,
  kVersion,
};

/// Everything the front end needs, after settings.ini and argv are merged.
struct CliOptions {
  CliCommand command = CliCommand::kRecord;

  int screen = 1;               // 1-based, as typed
  bool screen_given = false;
  std::string application;
  std::string area;
  int64_t duration_ms = 10000;
  bool continuous = false;
  int fps = 30;
  ScreenRecQuality quality = kScreenRecQualityMedium;
  bool show_cursor = false;
  ScreenRecAudioSource audio_source = kScreenRecAudioNone;
  ScreenRecQuality audio_quality = kScreenRecQualityMedium;
  ScreenRecContainer container = kScreenRecContainerMov;
  std::string output;
  std::string output_dir;       // From settings.ini only
  bool overwrite = false;
  int countdown_s = 0;
  bool show_progress = true;
  ScreenRecLogLevel log_level = kScreenRecLogInfo;
};

/// Fold settings.ini values into `opts`.  Unreadable values are reported
/// on stderr and skipped.
void ApplySettings(IPlatformSettings* settings, CliOptions* opts);

/// Parse argv over the current contents of `opts`.  On failure returns
/// false with a one-line description in `error`.
bool ParseCliOptions(int argc, char* argv[], CliOptions* opts,
                     std::string* error);

/// Build the C API request.  The returned struct points into `opts`.
ScreenRecRecordConfig ToRecordConfig(const CliOptions& opts);

bool ParseQuality(const std::string& text, ScreenRecQuality* out);
bool ParseLogLevel(const std::string& text, ScreenRecLogLevel* out);

void PrintUsage(std::FILE* out, const char* prog);

#endif  // SCREENREC_EXAMPLES_CLI_OPTIONS_H_
