// Copyright 2026 The screenrec Authors
//
// This file implements all public C API functions declared in screenrec.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "screenrec/screenrec.h"

#include <new>

#include "core/callback_sink.h"
#include "core/logger.h"
#include "core/recording_session.h"
#include "core/screenrec_context.h"

using screenrec::internal::ScreenRecContextImpl;

// ---------------------------------------------------------------------------
// The opaque ScreenRecContext struct wraps the C++ implementation.
// ---------------------------------------------------------------------------
struct ScreenRecContext {
  ScreenRecContextImpl impl;
};

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

ScreenRecContext* screenrec_context_create(void) {
  auto* ctx = new (std::nothrow) ScreenRecContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize()) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void screenrec_context_destroy(ScreenRecContext* ctx) { delete ctx; }

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

ScreenRecError screenrec_get_last_error(const ScreenRecContext* ctx) {
  if (!ctx) return kScreenRecErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* screenrec_get_last_error_message(const ScreenRecContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

const char* screenrec_get_last_error_hint(const ScreenRecContext* ctx) {
  if (!ctx) return "";
  return ctx->impl.last_error_hint();
}

// ---------------------------------------------------------------------------
// Enumeration
// ---------------------------------------------------------------------------

int screenrec_get_screen_count(ScreenRecContext* ctx) {
  if (!ctx) return -1;
  return ctx->impl.GetScreenCount();
}

ScreenRecError screenrec_get_screen_info(ScreenRecContext* ctx,
                                         int screen_index,
                                         ScreenRecScreenInfo* out_info) {
  if (!ctx) return kScreenRecErrorInvalidParam;
  return ctx->impl.GetScreenInfo(screen_index, out_info);
}

int screenrec_enumerate_applications(ScreenRecContext* ctx,
                                     ScreenRecApplicationInfo* out_apps,
                                     int max_count) {
  if (!ctx) return -1;
  return ctx->impl.EnumerateApplications(out_apps, max_count);
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

ScreenRecError screenrec_resolve_geometry(ScreenRecContext* ctx,
                                          const ScreenRecTarget* target,
                                          const char* area,
                                          ScreenRecGeometry* out_geometry) {
  if (!ctx) return kScreenRecErrorInvalidParam;
  return ctx->impl.ResolveGeometry(target, area, out_geometry);
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

ScreenRecError screenrec_record(ScreenRecContext* ctx,
                                const ScreenRecRecordConfig* config,
                                ScreenRecOutcome* out_outcome) {
  if (!ctx) return kScreenRecErrorInvalidParam;
  return ctx->impl.Record(config, out_outcome);
}

void screenrec_request_stop(ScreenRecContext* ctx) {
  if (!ctx) return;
  ctx->impl.RequestStop();
}

int screenrec_exit_code_for(const ScreenRecOutcome* outcome) {
  if (!outcome) return kScreenRecExitFailure;
  screenrec::internal::SessionOutcome o;
  o.state = static_cast<screenrec::internal::SessionState>(outcome->state);
  o.reason = static_cast<screenrec::internal::OutcomeReason>(outcome->reason);
  o.stop_cause = outcome->interrupted
                     ? screenrec::internal::StopCause::kInterrupt
                     : screenrec::internal::StopCause::kNone;
  return screenrec::internal::ExitCodeFor(o);
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void screenrec_set_log_level(ScreenRecLogLevel level) {
  screenrec::internal::SetLogLevel(level);
}

void screenrec_set_log_callback(screenrec_log_callback_t callback,
                                void* userdata) {
  auto sink = screenrec::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void screenrec_log(ScreenRecLogLevel level, const char* message) {
  if (!message) return;
  auto logger = screenrec::internal::GetLogger();
  if (logger) {
    logger->log(screenrec::internal::ToSpdlogLevel(level), "{}", message);
  }
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* screenrec_version_string(void) { return SCREENREC_VERSION_STRING; }

int screenrec_version_major(void) { return SCREENREC_VERSION_MAJOR; }
int screenrec_version_minor(void) { return SCREENREC_VERSION_MINOR; }
int screenrec_version_patch(void) { return SCREENREC_VERSION_PATCH; }
