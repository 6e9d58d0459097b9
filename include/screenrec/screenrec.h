// Copyright 2026 The screenrec Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef SCREENREC_SCREENREC_H_
#define SCREENREC_SCREENREC_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(SCREENREC_BUILDING)
#define SCREENREC_API __declspec(dllexport)
#else
#define SCREENREC_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define SCREENREC_API __attribute__((visibility("default")))
#else
#define SCREENREC_API
#endif

// ---------------------------------------------------------------------------
// Version (generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "screenrec/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
//   - Each ScreenRecContext is independent.  Only one recording may be active
//     per context at a time; a second screenrec_record() on the same context
//     fails with kScreenRecErrorRecordInProgress.
//   - screenrec_request_stop() may be called from any thread (including a
//     signal-watching thread) while screenrec_record() is blocked.
//   - All other functions on the SAME context must be serialized by the
//     caller.
//   - screenrec_set_log_level() and screenrec_set_log_callback() are
//     process-global and internally synchronized.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct ScreenRecContext ScreenRecContext;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by screenrec functions.
typedef enum ScreenRecError {
  kScreenRecOk = 0,
  kScreenRecErrorNotInitialized = -1,
  kScreenRecErrorInvalidParam = -2,
  kScreenRecErrorScreenNotFound = -3,
  kScreenRecErrorAreaOutOfBounds = -4,
  kScreenRecErrorApplicationNotFound = -5,
  kScreenRecErrorAmbiguousApplication = -6,
  kScreenRecErrorNoWindows = -7,
  kScreenRecErrorConfiguration = -8,     ///< Invalid fps/duration/quality/area
  kScreenRecErrorOutputPath = -9,        ///< Output destination unusable
  kScreenRecErrorCaptureStart = -10,     ///< Capture service refused to start
  kScreenRecErrorPermissionDenied = -11,
  kScreenRecErrorStopFailed = -12,
  kScreenRecErrorFinalizeFailed = -13,
  kScreenRecErrorFinalizeTimeout = -14,
  kScreenRecErrorRecordInProgress = -15,
  kScreenRecErrorCancelled = -16,        ///< User declined / interrupted early
  kScreenRecErrorNotSupported = -17,
  kScreenRecErrorDisplayUnavailable = -18,
  kScreenRecErrorCaptureFailed = -19,    ///< Capture or writing failed mid-session
  kScreenRecErrorUnknown = -99,
} ScreenRecError;

/// Log severity levels for the internal logging system.
typedef enum ScreenRecLogLevel {
  kScreenRecLogTrace = 0,
  kScreenRecLogDebug = 1,
  kScreenRecLogInfo = 2,   ///< Default
  kScreenRecLogWarn = 3,
  kScreenRecLogError = 4,
  kScreenRecLogFatal = 5,
} ScreenRecLogLevel;

/// User-defined log callback.  `message` is only valid for the duration of
/// the call.  May be invoked from any thread.
typedef void (*screenrec_log_callback_t)(ScreenRecLogLevel level,
                                         const char* message,
                                         void* userdata);

/// Rectangle in logical coordinates.
typedef struct ScreenRecRect {
  double x;
  double y;
  double width;
  double height;
} ScreenRecRect;

/// Information about a connected display.
typedef struct ScreenRecScreenInfo {
  int index;              ///< 1-based, primary screen first
  uint64_t display_id;    ///< Opaque platform display id
  ScreenRecRect frame;    ///< Logical frame
  double scale_factor;    ///< Pixels per logical unit
  int pixel_width;
  int pixel_height;
  int is_primary;
  char name[128];
} ScreenRecScreenInfo;

/// Information about an application that owns windows.
typedef struct ScreenRecApplicationInfo {
  char id[128];           ///< Application id (X11: WM_CLASS class)
  char name[128];         ///< Process name
  int32_t pid;
  int window_count;
} ScreenRecApplicationInfo;

/// What to record.
typedef enum ScreenRecTargetKind {
  kScreenRecTargetScreen = 0,
  kScreenRecTargetApplication = 1,
} ScreenRecTargetKind;

typedef struct ScreenRecTarget {
  ScreenRecTargetKind kind;
  int screen_index;          ///< 1-based, 0 = primary; kind == Screen
  const char* application;   ///< Name or id; used when kind == Application
} ScreenRecTarget;

/// Resolved capture geometry.
typedef struct ScreenRecGeometry {
  int pixel_width;
  int pixel_height;
  ScreenRecRect logical_source;
  double scale_factor;
  int screen_index;          ///< Target screen, or screen containing the window
  uint64_t window_id;        ///< 0 in screen mode
  char window_title[256];
} ScreenRecGeometry;

/// Video / audio quality tier.
typedef enum ScreenRecQuality {
  kScreenRecQualityLow = 0,
  kScreenRecQualityMedium = 1,
  kScreenRecQualityHigh = 2,
} ScreenRecQuality;

/// Audio source selection.
typedef enum ScreenRecAudioSource {
  kScreenRecAudioNone = 0,
  kScreenRecAudioSystem = 1,       ///< Monitor of the default output
  kScreenRecAudioMicrophone = 2,   ///< Default input device
} ScreenRecAudioSource;

/// Output container.
typedef enum ScreenRecContainer {
  kScreenRecContainerMov = 0,
  kScreenRecContainerMp4 = 1,
} ScreenRecContainer;

/// Pass as duration_ms to record until interrupted.
#define SCREENREC_DURATION_CONTINUOUS (-1)

/// Recording request.  Zero-initialize and fill the fields you need; zero
/// numeric fields take their documented defaults.
typedef struct ScreenRecRecordConfig {
  ScreenRecTarget target;
  const char* area;                ///< "x:y:w:h", "center:w:h" or NULL
  int64_t duration_ms;             ///< >= 100, continuous, or 0 = 10000
  int fps;                         ///< 15, 30 or 60 (0 = 30)
  ScreenRecQuality quality;
  int show_cursor;
  ScreenRecAudioSource audio_source;
  ScreenRecQuality audio_quality;
  ScreenRecContainer container;
  const char* output_path;         ///< NULL = timestamped name in cwd
  int overwrite;                   ///< Replace an existing file silently
  int countdown_s;                 ///< 0..60
  int finalize_timeout_ms;         ///< 0 = 5000
  int interrupt_grace_ms;          ///< 0 = 10000
  int handle_interrupts;           ///< Watch SIGINT/SIGTERM during the session
  int show_progress;               ///< Print a status line every second
} ScreenRecRecordConfig;

/// Session state machine states.
typedef enum ScreenRecSessionState {
  kScreenRecStateIdle = 0,
  kScreenRecStateConfiguring = 1,
  kScreenRecStateCapturing = 2,
  kScreenRecStateStopping = 3,
  kScreenRecStateFinalizing = 4,
  kScreenRecStateCompleted = 5,
  kScreenRecStateFailed = 6,
} ScreenRecSessionState;

/// Why the session ended.
typedef enum ScreenRecOutcomeReason {
  kScreenRecReasonCompleted = 0,
  kScreenRecReasonInterruptedByUser = 1,
  kScreenRecReasonSafetyTimeout = 2,
  kScreenRecReasonConfigurationError = 3,
  kScreenRecReasonCaptureStartError = 4,
  kScreenRecReasonStopError = 5,
  kScreenRecReasonFinalizeError = 6,
  kScreenRecReasonFinalizeTimeout = 7,
  kScreenRecReasonCancelled = 8,
  kScreenRecReasonCaptureError = 9,
} ScreenRecOutcomeReason;

/// Terminal outcome of one recording attempt.
typedef struct ScreenRecOutcome {
  ScreenRecSessionState state;     ///< Completed or Failed
  ScreenRecOutcomeReason reason;
  ScreenRecError error;
  int64_t elapsed_ms;
  int output_written;              ///< Non-zero if any bytes reached disk
  int possibly_incomplete;         ///< Non-zero if the file may be truncated
  int interrupted;                 ///< Non-zero if a user interrupt ended capture
  char output_path[1024];
  int64_t video_frames_written;
  int64_t video_frames_dropped;
  int64_t audio_buffers_written;
  int64_t audio_buffers_dropped;
  int64_t bytes_written;
} ScreenRecOutcome;

/// Process exit statuses used by the command-line front end.
enum {
  kScreenRecExitOk = 0,
  kScreenRecExitFailure = 1,
  kScreenRecExitConfiguration = 2,
  kScreenRecExitFinalizeTimeout = 124,
  kScreenRecExitInterrupted = 130,
};

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a new context.  Does not connect to the display server.
/// Returns NULL only on allocation failure.
SCREENREC_API ScreenRecContext* screenrec_context_create(void);

/// Destroy a context.  Safe to call with NULL.
SCREENREC_API void screenrec_context_destroy(ScreenRecContext* ctx);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

SCREENREC_API ScreenRecError
screenrec_get_last_error(const ScreenRecContext* ctx);

/// Human-readable message for the last error.  Never NULL.
SCREENREC_API const char* screenrec_get_last_error_message(
    const ScreenRecContext* ctx);

/// Remediation hint for the last error, or "" if none.  Never NULL.
SCREENREC_API const char* screenrec_get_last_error_hint(
    const ScreenRecContext* ctx);

// ---------------------------------------------------------------------------
// Enumeration
// ---------------------------------------------------------------------------

/// Number of connected screens, or -1 on failure.
SCREENREC_API int screenrec_get_screen_count(ScreenRecContext* ctx);

/// Information about a screen by 1-based index.
SCREENREC_API ScreenRecError screenrec_get_screen_info(
    ScreenRecContext* ctx, int screen_index, ScreenRecScreenInfo* out_info);

/// Fill up to `max_count` applications.  Returns the number written, or -1.
/// With `out_apps` NULL and `max_count` 0, returns the number available.
SCREENREC_API int screenrec_enumerate_applications(
    ScreenRecContext* ctx, ScreenRecApplicationInfo* out_apps, int max_count);

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

/// Resolve a target + area description into capture geometry.
/// `area` may be NULL for full screen / full window.
SCREENREC_API ScreenRecError screenrec_resolve_geometry(
    ScreenRecContext* ctx, const ScreenRecTarget* target, const char* area,
    ScreenRecGeometry* out_geometry);

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

/// Run one recording attempt to completion and fill `out_outcome`.
/// Blocks until the session is finalized (or the finalize timeout elapses).
/// Returns kScreenRecOk when the outcome is Completed or InterruptedByUser;
/// otherwise the error code also stored in out_outcome->error.
SCREENREC_API ScreenRecError screenrec_record(
    ScreenRecContext* ctx, const ScreenRecRecordConfig* config,
    ScreenRecOutcome* out_outcome);

/// Ask the active recording to stop as if the user interrupted it.
/// No-op if no recording is active.
SCREENREC_API void screenrec_request_stop(ScreenRecContext* ctx);

/// Map an outcome to the front end's process exit status.
SCREENREC_API int screenrec_exit_code_for(const ScreenRecOutcome* outcome);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

SCREENREC_API void screenrec_set_log_level(ScreenRecLogLevel level);

/// Register a log callback.  Pass NULL to unregister.
SCREENREC_API void screenrec_set_log_callback(
    screenrec_log_callback_t callback, void* userdata);

/// Emit a message through the screenrec logger.
SCREENREC_API void screenrec_log(ScreenRecLogLevel level, const char* message);

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

SCREENREC_API const char* screenrec_version_string(void);
SCREENREC_API int screenrec_version_major(void);
SCREENREC_API int screenrec_version_minor(void);
SCREENREC_API int screenrec_version_patch(void);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // SCREENREC_SCREENREC_H_
