// Copyright 2026 The screenrec Authors

#include "core/logger.h"

#include <mutex>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace screenrec {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("screenrec", sinks);

    // [screenrec][level] message on stderr; the callback sink keeps its own
    // message-only format.
    g_logger->set_pattern("[screenrec][%l] %v");
    g_logger->set_level(spdlog::level::info);

    // Warnings are written out immediately so an abrupt exit (forced exit
    // after a finalize timeout) still leaves them on the terminal.
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(ScreenRecLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

ScreenRecLogLevel GetLogLevel() {
  InitLogger();
  return CallbackSink::FromSpdlogLevel(g_logger->level());
}

spdlog::level::level_enum ToSpdlogLevel(ScreenRecLogLevel level) {
  switch (level) {
    case kScreenRecLogTrace: return spdlog::level::trace;
    case kScreenRecLogDebug: return spdlog::level::debug;
    case kScreenRecLogInfo:  return spdlog::level::info;
    case kScreenRecLogWarn:  return spdlog::level::warn;
    case kScreenRecLogError: return spdlog::level::err;
    case kScreenRecLogFatal: return spdlog::level::critical;
    default:                 return spdlog::level::info;
  }
}

}  // namespace internal
}  // namespace screenrec
