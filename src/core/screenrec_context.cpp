// Copyright 2026 The screenrec Authors

#include "core/screenrec_context.h"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

#include "core/area_spec.h"
#include "core/geometry_resolver.h"
#include "core/logger.h"

namespace screenrec {
namespace internal {

namespace {

void CopyString(const std::string& src, char* dst, size_t dst_size) {
  if (dst_size == 0) return;
  std::snprintf(dst, dst_size, "%s", src.c_str());
}

ScreenRecRect ToPublic(const Rect& r) {
  ScreenRecRect out;
  out.x = r.x;
  out.y = r.y;
  out.width = r.width;
  out.height = r.height;
  return out;
}

Quality ToQuality(ScreenRecQuality q) {
  switch (q) {
    case kScreenRecQualityLow:  return Quality::kLow;
    case kScreenRecQualityHigh: return Quality::kHigh;
    default:                    return Quality::kMedium;
  }
}

ScreenRecSessionState ToPublic(SessionState s) {
  return static_cast<ScreenRecSessionState>(static_cast<int>(s));
}

ScreenRecOutcomeReason ToPublic(OutcomeReason r) {
  return static_cast<ScreenRecOutcomeReason>(static_cast<int>(r));
}

void FillOutcome(const SessionOutcome& o, ScreenRecOutcome* out) {
  std::memset(out, 0, sizeof(*out));
  out->state = ToPublic(o.state);
  out->reason = ToPublic(o.reason);
  out->error = o.error.code;
  out->elapsed_ms = o.elapsed.count();
  out->output_written = o.output_written ? 1 : 0;
  out->possibly_incomplete = o.possibly_incomplete ? 1 : 0;
  out->interrupted = o.stop_cause == StopCause::kInterrupt ? 1 : 0;
  if (o.output_written) {
    CopyString(o.output_path, out->output_path, sizeof(out->output_path));
  }
  out->video_frames_written = o.video_frames_written;
  out->video_frames_dropped = o.video_frames_dropped;
  out->audio_buffers_written = o.audio_buffers_written;
  out->audio_buffers_dropped =
      o.audio_buffers_dropped + o.audio_pre_anchor_dropped;
  out->bytes_written = o.bytes_written;
}

}  // namespace

ScreenRecContextImpl::ScreenRecContextImpl() : progress_out_(&std::cout) {}

ScreenRecContextImpl::~ScreenRecContextImpl() {
  if (interrupts_) interrupts_->Uninstall();
}

bool ScreenRecContextImpl::Initialize() {
  std::lock_guard<std::mutex> lock(mu_);
  if (initialized_) return true;

  SCREENREC_LOG_DEBUG("Initializing screenrec context...");

  enumeration_ = CreatePlatformEnumerationService();
  capture_ = CreatePlatformCaptureService();
  writers_ = CreatePlatformWriterFactory();
  if (!enumeration_ || !capture_ || !writers_) {
    SetError(kScreenRecErrorNotSupported,
             "Failed to create platform capture services");
    return false;
  }

  initialized_ = true;
  ClearError();
  return true;
}

bool ScreenRecContextImpl::InitializeWith(
    std::unique_ptr<EnumerationService> enumeration,
    std::unique_ptr<CaptureService> capture,
    std::unique_ptr<ContainerWriterFactory> writers) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!enumeration || !capture || !writers) {
    SetError(kScreenRecErrorInvalidParam, "Missing service");
    return false;
  }
  enumeration_ = std::move(enumeration);
  capture_ = std::move(capture);
  writers_ = std::move(writers);
  initialized_ = true;
  ClearError();
  return true;
}

void ScreenRecContextImpl::SetError(const Error& err) {
  last_error_ = err;
  if (last_error_.code == kScreenRecOk) last_error_.code = kScreenRecErrorUnknown;
  SCREENREC_LOG_ERROR("Error {}: {}", static_cast<int>(last_error_.code),
                      last_error_.message);
  if (!last_error_.hint.empty()) {
    SCREENREC_LOG_INFO("Hint: {}", last_error_.hint);
  }
}

void ScreenRecContextImpl::SetError(ScreenRecError code,
                                    const std::string& message) {
  Error err;
  err.Set(code, message);
  SetError(err);
}

void ScreenRecContextImpl::ClearError() { last_error_.Clear(); }

// ---------------------------------------------------------------------------
// Enumeration
// ---------------------------------------------------------------------------

int ScreenRecContextImpl::GetScreenCount() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kScreenRecErrorNotInitialized, "Context not initialized");
    return -1;
  }
  std::vector<ScreenDescriptor> screens;
  Error err;
  if (!enumeration_->ListScreens(&screens, &err)) {
    SetError(err);
    return -1;
  }
  ClearError();
  return static_cast<int>(screens.size());
}

ScreenRecError ScreenRecContextImpl::GetScreenInfo(int screen_index,
                                                   ScreenRecScreenInfo* out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kScreenRecErrorNotInitialized, "Context not initialized");
    return kScreenRecErrorNotInitialized;
  }
  if (!out) {
    SetError(kScreenRecErrorInvalidParam, "out_info is NULL");
    return kScreenRecErrorInvalidParam;
  }

  std::vector<ScreenDescriptor> screens;
  Error err;
  if (!enumeration_->ListScreens(&screens, &err)) {
    SetError(err);
    return err.code;
  }
  if (screen_index < 1 || screen_index > static_cast<int>(screens.size())) {
    SetError(kScreenRecErrorScreenNotFound,
             "Screen " + std::to_string(screen_index) + " not found");
    return kScreenRecErrorScreenNotFound;
  }

  const ScreenDescriptor& s = screens[screen_index - 1];
  std::memset(out, 0, sizeof(*out));
  out->index = s.index + 1;
  out->display_id = s.display_id;
  out->frame = ToPublic(s.logical_frame);
  out->scale_factor = s.scale_factor;
  out->pixel_width = s.pixel_width();
  out->pixel_height = s.pixel_height();
  out->is_primary = s.is_primary ? 1 : 0;
  CopyString(s.name, out->name, sizeof(out->name));
  ClearError();
  return kScreenRecOk;
}

int ScreenRecContextImpl::EnumerateApplications(ScreenRecApplicationInfo* out,
                                                int max_count) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kScreenRecErrorNotInitialized, "Context not initialized");
    return -1;
  }
  const bool count_only = (out == nullptr && max_count == 0);
  if (!count_only && (!out || max_count <= 0)) {
    SetError(kScreenRecErrorInvalidParam, "Invalid output buffer");
    return -1;
  }

  std::vector<ApplicationDescriptor> apps;
  Error err;
  if (!enumeration_->ListApplications(&apps, &err)) {
    SetError(err);
    return -1;
  }
  if (count_only) {
    ClearError();
    return static_cast<int>(apps.size());
  }

  int count = 0;
  for (const auto& app : apps) {
    if (count >= max_count) break;
    ScreenRecApplicationInfo& info = out[count++];
    std::memset(&info, 0, sizeof(info));
    CopyString(app.id, info.id, sizeof(info.id));
    CopyString(app.name, info.name, sizeof(info.name));
    info.pid = app.pid;
    info.window_count = app.window_count;
  }
  ClearError();
  return count;
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

bool ScreenRecContextImpl::ToTargetSelector(const ScreenRecTarget& target,
                                            TargetSelector* out,
                                            Error* err) const {
  if (target.kind == kScreenRecTargetApplication) {
    if (!target.application || target.application[0] == '\0') {
      return Fail(err, kScreenRecErrorInvalidParam,
                  "Application name cannot be empty",
                  "Provide an application name or id");
    }
    *out = TargetSelector::Application(target.application);
    return true;
  }
  if (target.screen_index < 0) {
    return Fail(err, kScreenRecErrorScreenNotFound,
                "Screen index must be 1 or greater");
  }
  *out = TargetSelector::Screen(
      target.screen_index == 0 ? 0 : target.screen_index - 1);
  return true;
}

ScreenRecError ScreenRecContextImpl::ResolveGeometry(
    const ScreenRecTarget* target, const char* area, ScreenRecGeometry* out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_) {
    SetError(kScreenRecErrorNotInitialized, "Context not initialized");
    return kScreenRecErrorNotInitialized;
  }
  if (!target || !out) {
    SetError(kScreenRecErrorInvalidParam, "target or out_geometry is NULL");
    return kScreenRecErrorInvalidParam;
  }

  Error err;
  TargetSelector selector;
  AreaSpec spec;
  ResolvedTarget resolved;
  GeometryResolver resolver(enumeration_.get());
  if (!ToTargetSelector(*target, &selector, &err) ||
      !ParseAreaSpec(area ? area : "", &spec, &err) ||
      !resolver.Resolve(selector, spec, &resolved, &err)) {
    SetError(err);
    return err.code;
  }

  std::memset(out, 0, sizeof(*out));
  out->pixel_width = resolved.geometry.pixel_output_size.width;
  out->pixel_height = resolved.geometry.pixel_output_size.height;
  out->logical_source = ToPublic(resolved.geometry.logical_source_rect);
  out->scale_factor = resolved.geometry.scale_factor;
  out->screen_index = resolved.target.screen.index + 1;
  if (resolved.target.kind == CaptureTarget::Kind::kWindow) {
    out->window_id = resolved.target.window.window_id;
    CopyString(resolved.target.window.title, out->window_title,
               sizeof(out->window_title));
  }
  ClearError();
  return kScreenRecOk;
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

bool ScreenRecContextImpl::ToRecordRequest(const ScreenRecRecordConfig& c,
                                           RecordRequest* out,
                                           Error* err) const {
  RecordRequest r;
  if (!ToTargetSelector(c.target, &r.target, err)) return false;

  std::string area = c.area ? c.area : "";
  if (!ParseAreaSpec(area, &r.area, err)) return false;

  r.duration_ms = c.duration_ms == 0 ? 10000 : c.duration_ms;
  r.fps = c.fps == 0 ? 30 : c.fps;
  r.quality = ToQuality(c.quality);
  r.show_cursor = c.show_cursor != 0;
  switch (c.audio_source) {
    case kScreenRecAudioSystem:
      r.audio_source = AudioSource::kSystem;
      break;
    case kScreenRecAudioMicrophone:
      r.audio_source = AudioSource::kMicrophone;
      break;
    default:
      r.audio_source = AudioSource::kNone;
      break;
  }
  r.audio_quality = ToQuality(c.audio_quality);
  r.container = c.container == kScreenRecContainerMp4 ? ContainerFormat::kMp4
                                                      : ContainerFormat::kMov;
  r.output_path = c.output_path ? c.output_path : "";
  r.overwrite = c.overwrite != 0;
  r.countdown_s = c.countdown_s;
  if (c.finalize_timeout_ms > 0) {
    r.finalize_timeout = std::chrono::milliseconds(c.finalize_timeout_ms);
  }
  if (c.interrupt_grace_ms > 0) {
    r.interrupt_grace = std::chrono::milliseconds(c.interrupt_grace_ms);
  }
  r.handle_interrupts = c.handle_interrupts != 0;
  r.show_progress = c.show_progress != 0;
  *out = r;
  return true;
}

ScreenRecError ScreenRecContextImpl::Record(const ScreenRecRecordConfig* config,
                                            ScreenRecOutcome* out) {
  if (recording_.exchange(true)) {
    std::lock_guard<std::mutex> lock(mu_);
    Error err;
    err.Set(kScreenRecErrorRecordInProgress,
            "A recording is already active on this context");
    SetError(err);
    if (out) {
      FillOutcome(
          SessionOutcome::Failure(OutcomeReason::kCaptureStartError, err),
          out);
    }
    return err.code;
  }
  struct RecordingReset {
    std::atomic<bool>* flag;
    ~RecordingReset() { flag->store(false); }
  } reset{&recording_};

  RecordRequest request;
  SessionServices services;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!initialized_ || !config || !out) {
      Error err;
      OutcomeReason reason = OutcomeReason::kConfigurationError;
      if (!initialized_) {
        err.Set(kScreenRecErrorNotInitialized, "Context not initialized");
        reason = OutcomeReason::kCaptureStartError;
      } else {
        err.Set(kScreenRecErrorInvalidParam, "config or out_outcome is NULL");
      }
      SetError(err);
      if (out) FillOutcome(SessionOutcome::Failure(reason, err), out);
      return err.code;
    }

    Error err;
    if (!ToRecordRequest(*config, &request, &err)) {
      SetError(err);
      FillOutcome(
          SessionOutcome::Failure(OutcomeReason::kConfigurationError, err),
          out);
      return err.code;
    }

    if (request.handle_interrupts) {
      if (!interrupts_) interrupts_ = std::make_unique<InterruptCoordinator>();
      if (!interrupts_->Install(&err)) {
        SCREENREC_LOG_WARN("Interrupt handling unavailable: {}", err.message);
      }
    }

    services.enumeration = enumeration_.get();
    services.capture = capture_.get();
    services.writers = writers_.get();
    services.output = &output_;
    services.interrupts =
        interrupts_ && interrupts_->installed() ? interrupts_.get() : nullptr;
    services.progress_out = progress_out_;
  }

  RecordingSession session(services);
  {
    std::lock_guard<std::mutex> lock(session_mu_);
    session_ = &session;
  }
  SessionOutcome outcome = session.Run(request);
  {
    std::lock_guard<std::mutex> lock(session_mu_);
    session_ = nullptr;
  }
  if (services.interrupts) services.interrupts->Uninstall();

  std::lock_guard<std::mutex> lock(mu_);
  FillOutcome(outcome, out);
  const bool success = outcome.state == SessionState::kCompleted;
  if (success) {
    ClearError();
    return kScreenRecOk;
  }
  SetError(outcome.error);
  return last_error_.code;
}

void ScreenRecContextImpl::RequestStop() {
  std::lock_guard<std::mutex> lock(session_mu_);
  if (session_) session_->RequestStop();
}

}  // namespace internal
}  // namespace screenrec
