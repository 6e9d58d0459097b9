// Copyright 2026 The screenrec Authors
//
// C++ RAII wrapper for the screenrec C API.
// Header-only, just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "screenrec/screenrec.hpp"
//   screenrec::Context ctx;
//   ScreenRecRecordConfig cfg = screenrec::DefaultRecordConfig();
//   cfg.duration_ms = 5000;
//   ScreenRecOutcome out = ctx.Record(cfg);
//   printf("%s (%lld ms)\n", out.output_path, (long long)out.elapsed_ms);

#ifndef SCREENREC_SCREENREC_HPP_
#define SCREENREC_SCREENREC_HPP_

#include "screenrec/screenrec.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace screenrec {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(ScreenRecError code, const char* msg, const char* hint = nullptr)
      : std::runtime_error(msg ? msg : "screenrec error"),
        code_(code),
        hint_(hint ? hint : "") {}
  ScreenRecError code() const noexcept { return code_; }
  const std::string& hint() const noexcept { return hint_; }

 private:
  ScreenRecError code_;
  std::string hint_;
};

/// Zero-initialized config with the screenrec defaults filled in.
inline ScreenRecRecordConfig DefaultRecordConfig() {
  ScreenRecRecordConfig cfg = {};
  cfg.target.kind = kScreenRecTargetScreen;
  cfg.target.screen_index = 1;
  cfg.duration_ms = 10000;
  cfg.fps = 30;
  cfg.quality = kScreenRecQualityMedium;
  cfg.audio_quality = kScreenRecQualityMedium;
  cfg.container = kScreenRecContainerMov;
  cfg.finalize_timeout_ms = 5000;
  cfg.interrupt_grace_ms = 10000;
  return cfg;
}

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(screenrec_context_create()) {
    if (!raw_) throw Error(kScreenRecErrorNotInitialized, "Context creation failed");
  }
  ~Context() { screenrec_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      screenrec_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  ScreenRecContext* get() const noexcept { return raw_; }

  ScreenRecError last_error() const { return screenrec_get_last_error(raw_); }
  const char* last_error_message() const {
    return screenrec_get_last_error_message(raw_);
  }
  const char* last_error_hint() const {
    return screenrec_get_last_error_hint(raw_);
  }

  // -- Enumeration --

  int screen_count() {
    int n = screenrec_get_screen_count(raw_);
    if (n < 0) throw_last("screen enumeration failed");
    return n;
  }

  /// `index` is 1-based.
  ScreenRecScreenInfo screen_info(int index) {
    ScreenRecScreenInfo info = {};
    check(screenrec_get_screen_info(raw_, index, &info));
    return info;
  }

  std::vector<ScreenRecApplicationInfo> Applications(int max_count = 256) {
    std::vector<ScreenRecApplicationInfo> buf(max_count);
    int n = screenrec_enumerate_applications(raw_, buf.data(), max_count);
    if (n < 0) throw_last("application enumeration failed");
    buf.resize(n);
    return buf;
  }

  // -- Geometry --

  ScreenRecGeometry ResolveGeometry(const ScreenRecTarget& target,
                                    const char* area = nullptr) {
    ScreenRecGeometry g = {};
    check(screenrec_resolve_geometry(raw_, &target, area, &g));
    return g;
  }

  // -- Recording --

  /// Runs one recording.  Throws for configuration and start failures
  /// (nothing was written); failures after capture began are returned in
  /// the outcome so the partial file can be reported.
  ScreenRecOutcome Record(const ScreenRecRecordConfig& config) {
    ScreenRecOutcome out = {};
    ScreenRecError err = screenrec_record(raw_, &config, &out);
    if (err != kScreenRecOk && !out.output_written &&
        out.reason != kScreenRecReasonCancelled) {
      throw_last("record failed");
    }
    return out;
  }

  void RequestStop() noexcept { screenrec_request_stop(raw_); }

 private:
  void check(ScreenRecError err) {
    if (err != kScreenRecOk) throw_last(nullptr);
  }

  [[noreturn]] void throw_last(const char* fallback) {
    ScreenRecError code = screenrec_get_last_error(raw_);
    const char* msg = screenrec_get_last_error_message(raw_);
    throw Error(code == kScreenRecOk ? kScreenRecErrorUnknown : code,
                msg ? msg : fallback, screenrec_get_last_error_hint(raw_));
  }

  ScreenRecContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

inline int ExitCodeFor(const ScreenRecOutcome& outcome) {
  return screenrec_exit_code_for(&outcome);
}

inline void SetLogLevel(ScreenRecLogLevel level) {
  screenrec_set_log_level(level);
}

inline const char* version_string() { return screenrec_version_string(); }

}  // namespace screenrec

#endif  // SCREENREC_SCREENREC_HPP_
