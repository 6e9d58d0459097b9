// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_SCREENREC_CONTEXT_H_
#define SCREENREC_CORE_SCREENREC_CONTEXT_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "core/capture_service.h"
#include "core/container_writer.h"
#include "core/enumeration_service.h"
#include "core/error.h"
#include "core/interrupt_coordinator.h"
#include "core/output_path.h"
#include "core/recording_session.h"
#include "core/session_config.h"
#include "screenrec/screenrec.h"

namespace screenrec {
namespace internal {

/// Internal implementation of the opaque ScreenRecContext handle.
///
/// Owns the platform services and bridges the public C API to the
/// internal C++ implementation.
class ScreenRecContextImpl {
 public:
  ScreenRecContextImpl();
  ~ScreenRecContextImpl();

  // Non-copyable.
  ScreenRecContextImpl(const ScreenRecContextImpl&) = delete;
  ScreenRecContextImpl& operator=(const ScreenRecContextImpl&) = delete;

  /// Create the platform services.  Does not contact the display server.
  bool Initialize();

  /// Use the given services instead of the platform ones.
  bool InitializeWith(std::unique_ptr<EnumerationService> enumeration,
                      std::unique_ptr<CaptureService> capture,
                      std::unique_ptr<ContainerWriterFactory> writers);

  bool is_initialized() const { return initialized_; }

  // -- Error state --

  ScreenRecError last_error() const { return last_error_.code; }
  const char* last_error_message() const {
    return last_error_.ok() ? "No error" : last_error_.message.c_str();
  }
  const char* last_error_hint() const { return last_error_.hint.c_str(); }

  void SetError(const Error& err);
  void SetError(ScreenRecError code, const std::string& message);
  void ClearError();

  // -- Enumeration --

  int GetScreenCount();
  ScreenRecError GetScreenInfo(int screen_index, ScreenRecScreenInfo* out);
  int EnumerateApplications(ScreenRecApplicationInfo* out, int max_count);

  // -- Geometry --

  ScreenRecError ResolveGeometry(const ScreenRecTarget* target,
                                 const char* area, ScreenRecGeometry* out);

  // -- Recording --

  ScreenRecError Record(const ScreenRecRecordConfig* config,
                        ScreenRecOutcome* out);
  void RequestStop();

  /// Where the progress line goes (default std::cout).  Not owned.
  void set_progress_stream(std::ostream* out) { progress_out_ = out; }

  OutputPathResolver& output_resolver() { return output_; }

 private:
  bool ToTargetSelector(const ScreenRecTarget& target, TargetSelector* out,
                        Error* err) const;
  bool ToRecordRequest(const ScreenRecRecordConfig& config,
                       RecordRequest* out, Error* err) const;

  std::unique_ptr<EnumerationService> enumeration_;
  std::unique_ptr<CaptureService> capture_;
  std::unique_ptr<ContainerWriterFactory> writers_;
  OutputPathResolver output_;
  std::unique_ptr<InterruptCoordinator> interrupts_;
  std::ostream* progress_out_;
  bool initialized_ = false;

  // Serializes everything except RequestStop().
  std::mutex mu_;

  // Guards session_; RequestStop() takes only this.
  std::mutex session_mu_;
  RecordingSession* session_ = nullptr;
  std::atomic<bool> recording_{false};

  Error last_error_;
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_SCREENREC_CONTEXT_H_
