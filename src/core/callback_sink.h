// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_CALLBACK_SINK_H_
#define SCREENREC_CORE_CALLBACK_SINK_H_

#include <memory>
#include <mutex>
#include <string>

#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/sink.h"

#include "screenrec/screenrec.h"

namespace screenrec {
namespace internal {

/// spdlog sink that hands each record to the user's C callback.
///
/// The callback gets the bare message; the level travels as its own
/// argument, so the logger's "[screenrec][level]" prefix is not applied
/// here.  Records can come from capture threads, so the callback runs
/// outside the sink's lock and may itself call screenrec_log().  Records
/// logged from inside the callback reach the other sinks only.
class CallbackSink : public spdlog::sinks::sink {
 public:
  CallbackSink() : formatter_(new spdlog::pattern_formatter("%v")) {}

  /// nullptr disables forwarding.
  void SetCallback(screenrec_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(mu_);
    callback_ = callback;
    userdata_ = userdata;
  }

  void log(const spdlog::details::log_msg& msg) override {
    thread_local bool in_callback = false;
    if (in_callback) return;

    screenrec_log_callback_t callback;
    void* userdata;
    spdlog::memory_buf_t formatted;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!callback_) return;
      callback = callback_;
      userdata = userdata_;
      formatter_->format(msg, formatted);
    }
    std::string text(formatted.data(), formatted.size());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
      text.pop_back();

    in_callback = true;
    callback(FromSpdlogLevel(msg.level), text.c_str(), userdata);
    in_callback = false;
  }

  void flush() override {}

  // The logger's pattern carries a prefix the callback does not want.
  void set_pattern(const std::string& /*pattern*/) override {}
  void set_formatter(std::unique_ptr<spdlog::formatter> /*f*/) override {}

  static ScreenRecLogLevel FromSpdlogLevel(spdlog::level::level_enum lvl) {
    switch (lvl) {
      case spdlog::level::trace:    return kScreenRecLogTrace;
      case spdlog::level::debug:    return kScreenRecLogDebug;
      case spdlog::level::info:     return kScreenRecLogInfo;
      case spdlog::level::warn:     return kScreenRecLogWarn;
      case spdlog::level::err:      return kScreenRecLogError;
      case spdlog::level::critical: return kScreenRecLogFatal;
      default:                      return kScreenRecLogFatal;
    }
  }

 private:
  std::mutex mu_;
  std::unique_ptr<spdlog::formatter> formatter_;
  screenrec_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_CALLBACK_SINK_H_
