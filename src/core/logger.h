// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_LOGGER_H_
#define SCREENREC_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "screenrec/screenrec.h"

namespace screenrec {
namespace internal {

class CallbackSink;

/// Initialize the process-wide screenrec logger (colored stderr sink plus
/// the user callback sink).  Idempotent.
void InitLogger();

/// The screenrec spdlog logger.
std::shared_ptr<spdlog::logger> GetLogger();

/// Sink used to route messages to a user-registered C callback.
std::shared_ptr<CallbackSink> GetCallbackSink();

void SetLogLevel(ScreenRecLogLevel level);
ScreenRecLogLevel GetLogLevel();

spdlog::level::level_enum ToSpdlogLevel(ScreenRecLogLevel level);

}  // namespace internal
}  // namespace screenrec

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define SCREENREC_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::screenrec::internal::GetLogger(), __VA_ARGS__)
#define SCREENREC_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::screenrec::internal::GetLogger(), __VA_ARGS__)
#define SCREENREC_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::screenrec::internal::GetLogger(), __VA_ARGS__)
#define SCREENREC_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::screenrec::internal::GetLogger(), __VA_ARGS__)
#define SCREENREC_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::screenrec::internal::GetLogger(), __VA_ARGS__)
#define SCREENREC_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::screenrec::internal::GetLogger(), __VA_ARGS__)

#endif  // SCREENREC_CORE_LOGGER_H_
