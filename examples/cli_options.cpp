// Copyright 2026 The screenrec Authors

#include "cli_options.h"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "core/platform_settings.h"

namespace {

enum LongOnly {
  kOptFps = 256,
  kOptQuality,
  kOptAudioQuality,
  kOptSystemAudio,
  kOptShowCursor,
  kOptCountdown,
  kOptFormat,
  kOptContinuous,
  kOptNoProgress,
  kOptLogLevel,
  kOptVersion,
};

const struct option kLongOptions[] = {
    {"duration", required_argument, nullptr, 'd'},
    {"continuous", no_argument, nullptr, kOptContinuous},
    {"output", required_argument, nullptr, 'o'},
    {"force", no_argument, nullptr, 'f'},
    {"area", required_argument, nullptr, 'a'},
    {"screen", required_argument, nullptr, 's'},
    {"screen-list", no_argument, nullptr, 'l'},
    {"app", required_argument, nullptr, 'A'},
    {"app-list", no_argument, nullptr, 'L'},
    {"enable-microphone", no_argument, nullptr, 'm'},
    {"system-audio", no_argument, nullptr, kOptSystemAudio},
    {"audio-quality", required_argument, nullptr, kOptAudioQuality},
    {"fps", required_argument, nullptr, kOptFps},
    {"quality", required_argument, nullptr, kOptQuality},
    {"show-cursor", no_argument, nullptr, kOptShowCursor},
    {"countdown", required_argument, nullptr, kOptCountdown},
    {"format", required_argument, nullptr, kOptFormat},
    {"no-progress", no_argument, nullptr, kOptNoProgress},
    {"log-level", required_argument, nullptr, kOptLogLevel},
    {"verbose", no_argument, nullptr, 'v'},
    {"version", no_argument, nullptr, kOptVersion},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool ParseInt64(const char* text, int64_t* out) {
  if (!text || !*text) return false;
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(text, &end, 10);
  if (errno != 0 || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

bool ParseInt(const char* text, int* out) {
  int64_t v = 0;
  if (!ParseInt64(text, &v) || v < -2147483647LL || v > 2147483647LL)
    return false;
  *out = static_cast<int>(v);
  return true;
}

bool ParseBool(const std::string& text, bool* out) {
  std::string t = Lower(text);
  if (t == "1" || t == "true" || t == "yes" || t == "on") {
    *out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "no" || t == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseContainer(const std::string& text, ScreenRecContainer* out) {
  std::string t = Lower(text);
  if (t == "mov") {
    *out = kScreenRecContainerMov;
    return true;
  }
  if (t == "mp4") {
    *out = kScreenRecContainerMp4;
    return true;
  }
  return false;
}

void WarnSetting(IPlatformSettings* settings, const char* key,
                 const std::string& value) {
  std::fprintf(stderr, "warning: ignoring %s=%s in %s\n", key, value.c_str(),
               settings->Location().c_str());
}

}  // namespace

bool ParseQuality(const std::string& text, ScreenRecQuality* out) {
  std::string t = Lower(text);
  if (t == "low") {
    *out = kScreenRecQualityLow;
  } else if (t == "medium") {
    *out = kScreenRecQualityMedium;
  } else if (t == "high") {
    *out = kScreenRecQualityHigh;
  } else {
    return false;
  }
  return true;
}

bool ParseLogLevel(const std::string& text, ScreenRecLogLevel* out) {
  std::string t = Lower(text);
  if (t == "trace") {
    *out = kScreenRecLogTrace;
  } else if (t == "debug") {
    *out = kScreenRecLogDebug;
  } else if (t == "info") {
    *out = kScreenRecLogInfo;
  } else if (t == "warn" || t == "warning") {
    *out = kScreenRecLogWarn;
  } else if (t == "error") {
    *out = kScreenRecLogError;
  } else if (t == "fatal" || t == "critical") {
    *out = kScreenRecLogFatal;
  } else {
    return false;
  }
  return true;
}

void ApplySettings(IPlatformSettings* settings, CliOptions* opts) {
  if (!settings || !opts) return;

  int fps = 0;
  if (settings->GetInt("fps", &fps)) opts->fps = fps;

  std::string value;
  if (settings->GetString("quality", &value) &&
      !ParseQuality(value, &opts->quality)) {
    WarnSetting(settings, "quality", value);
  }
  if (settings->GetString("audio_quality", &value) &&
      !ParseQuality(value, &opts->audio_quality)) {
    WarnSetting(settings, "audio_quality", value);
  }
  if (settings->GetString("output_dir", &value)) {
    opts->output_dir = value;
  }
  if (settings->GetString("show_cursor", &value) &&
      !ParseBool(value, &opts->show_cursor)) {
    WarnSetting(settings, "show_cursor", value);
  }
  if (settings->GetString("log_level", &value) &&
      !ParseLogLevel(value, &opts->log_level)) {
    WarnSetting(settings, "log_level", value);
  }
}

bool ParseCliOptions(int argc, char* argv[], CliOptions* opts,
                     std::string* error) {
  bool list_screens = false;
  bool list_apps = false;
  bool area_given = false;
  bool duration_given = false;

  optind = 1;
  opterr = 0;
  int c;
  while ((c = getopt_long(argc, argv, ":d:o:fa:s:lA:Lmvh", kLongOptions,
                          nullptr)) != -1) {
    switch (c) {
      case 'd':
        if (!ParseInt64(optarg, &opts->duration_ms)) {
          *error = std::string("invalid --duration '") + optarg +
                   "' (milliseconds expected)";
          return false;
        }
        duration_given = true;
        break;
      case kOptContinuous:
        opts->continuous = true;
        break;
      case 'o':
        opts->output = optarg;
        break;
      case 'f':
        opts->overwrite = true;
        break;
      case 'a':
        opts->area = optarg;
        area_given = true;
        break;
      case 's':
        if (!ParseInt(optarg, &opts->screen) || opts->screen < 1) {
          *error = std::string("invalid --screen '") + optarg +
                   "' (1 = primary, 2+ = secondary)";
          return false;
        }
        opts->screen_given = true;
        break;
      case 'l':
        list_screens = true;
        break;
      case 'A':
        opts->application = optarg;
        break;
      case 'L':
        list_apps = true;
        break;
      case 'm':
        opts->audio_source = kScreenRecAudioMicrophone;
        break;
      case kOptSystemAudio:
        opts->audio_source = kScreenRecAudioSystem;
        break;
      case kOptAudioQuality:
        if (!ParseQuality(optarg, &opts->audio_quality)) {
          *error = std::string("invalid --audio-quality '") + optarg +
                   "' (low, medium or high)";
          return false;
        }
        break;
      case kOptFps:
        if (!ParseInt(optarg, &opts->fps)) {
          *error = std::string("invalid --fps '") + optarg + "'";
          return false;
        }
        break;
      case kOptQuality:
        if (!ParseQuality(optarg, &opts->quality)) {
          *error = std::string("invalid --quality '") + optarg +
                   "' (low, medium or high)";
          return false;
        }
        break;
      case kOptShowCursor:
        opts->show_cursor = true;
        break;
      case kOptCountdown:
        if (!ParseInt(optarg, &opts->countdown_s)) {
          *error = std::string("invalid --countdown '") + optarg + "'";
          return false;
        }
        break;
      case kOptFormat:
        if (!ParseContainer(optarg, &opts->container)) {
          *error = std::string("invalid --format '") + optarg +
                   "' (mov or mp4)";
          return false;
        }
        break;
      case kOptNoProgress:
        opts->show_progress = false;
        break;
      case kOptLogLevel:
        if (!ParseLogLevel(optarg, &opts->log_level)) {
          *error = std::string("invalid --log-level '") + optarg + "'";
          return false;
        }
        break;
      case 'v':
        opts->log_level = kScreenRecLogDebug;
        break;
      case kOptVersion:
        opts->command = CliCommand::kVersion;
        return true;
      case 'h':
        opts->command = CliCommand::kHelp;
        return true;
      case ':':
        *error = std::string("option '") + argv[optind - 1] +
                 "' requires a value";
        return false;
      default:
        *error = std::string("unknown option '") + argv[optind - 1] + "'";
        return false;
    }
  }

  if (optind < argc) {
    *error = std::string("unexpected argument '") + argv[optind] + "'";
    return false;
  }
  if (list_screens && list_apps) {
    *error = "--screen-list and --app-list cannot be combined";
    return false;
  }
  if (list_screens) {
    opts->command = CliCommand::kListScreens;
    return true;
  }
  if (list_apps) {
    opts->command = CliCommand::kListApps;
    return true;
  }
  if (!opts->application.empty() && (opts->screen_given || area_given)) {
    *error = "--app cannot be combined with --screen or --area";
    return false;
  }
  if (opts->continuous && duration_given) {
    *error = "--continuous cannot be combined with --duration";
    return false;
  }
  opts->command = CliCommand::kRecord;
  return true;
}

ScreenRecRecordConfig ToRecordConfig(const CliOptions& opts) {
  ScreenRecRecordConfig cfg;
  std::memset(&cfg, 0, sizeof(cfg));

  if (opts.application.empty()) {
    cfg.target.kind = kScreenRecTargetScreen;
    cfg.target.screen_index = opts.screen;
  } else {
    cfg.target.kind = kScreenRecTargetApplication;
    cfg.target.application = opts.application.c_str();
  }
  cfg.area = opts.area.empty() ? nullptr : opts.area.c_str();
  cfg.duration_ms =
      opts.continuous ? SCREENREC_DURATION_CONTINUOUS : opts.duration_ms;
  cfg.fps = opts.fps;
  cfg.quality = opts.quality;
  cfg.show_cursor = opts.show_cursor ? 1 : 0;
  cfg.audio_source = opts.audio_source;
  cfg.audio_quality = opts.audio_quality;
  cfg.container = opts.container;
  if (!opts.output.empty()) {
    cfg.output_path = opts.output.c_str();
  } else if (!opts.output_dir.empty()) {
    cfg.output_path = opts.output_dir.c_str();
  }
  cfg.overwrite = opts.overwrite ? 1 : 0;
  cfg.countdown_s = opts.countdown_s;
  cfg.handle_interrupts = 1;
  cfg.show_progress = opts.show_progress ? 1 : 0;
  return cfg;
}

void PrintUsage(std::FILE* out, const char* prog) {
  std::fprintf(out,
      "Usage: %s [options]\n"
      "\n"
      "Record the screen, a region of it, or an application's window.\n"
      "\n"
      "Duration:\n"
      "  -d, --duration <ms>        Recording length in milliseconds "
      "(default 10000)\n"
      "      --continuous           Record until Ctrl+C\n"
      "\n"
      "Target:\n"
      "  -s, --screen <n>           Screen to record (1 = primary)\n"
      "  -a, --area <spec>          x:y:width:height or center:width:height\n"
      "  -A, --app <name>           Record the main window of an application\n"
      "  -l, --screen-list          List screens and exit\n"
      "  -L, --app-list             List applications and exit\n"
      "\n"
      "Output:\n"
      "  -o, --output <path>        Output file or directory (default: "
      "timestamped name)\n"
      "      --format <mov|mp4>     Container (default mov)\n"
      "  -f, --force                Overwrite an existing file without "
      "asking\n"
      "\n"
      "Quality:\n"
      "      --fps <15|30|60>       Frame rate (default 30)\n"
      "      --quality <level>      low, medium or high (default medium)\n"
      "      --show-cursor          Draw the pointer into the recording\n"
      "\n"
      "Audio:\n"
      "      --system-audio         Record what the speakers play\n"
      "  -m, --enable-microphone    Record the default microphone\n"
      "      --audio-quality <lvl>  low, medium or high (default medium)\n"
      "\n"
      "Other:\n"
      "      --countdown <s>        Wait before recording (0-60)\n"
      "      --no-progress          Do not print the status line\n"
      "      --log-level <level>    trace, debug, info, warn, error\n"
      "  -v, --verbose              Same as --log-level debug\n"
      "      --version              Print the version and exit\n"
      "  -h, --help                 Show this help\n"
      "\n"
      "Defaults are read from $XDG_CONFIG_HOME/screenrec/settings.ini.\n"
      "\n"
      "Exit status: 0 success, 1 failure, 2 invalid options, "
      "124 forced exit after a stuck finalize, 130 interrupted.\n",
      prog);
}
