// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_GEOMETRY_RESOLVER_H_
#define SCREENREC_CORE_GEOMETRY_RESOLVER_H_

#include <string>
#include <vector>

#include "core/area_spec.h"
#include "core/enumeration_service.h"
#include "core/error.h"
#include "core/geometry.h"

namespace screenrec {
namespace internal {

/// What the user asked to record.
struct TargetSelector {
  enum class Kind { kScreen, kApplication };

  Kind kind = Kind::kScreen;
  int screen_index = 0;       ///< 0-based
  std::string application;    ///< Name or application id

  static TargetSelector Screen(int index) {
    TargetSelector t;
    t.kind = Kind::kScreen;
    t.screen_index = index;
    return t;
  }
  static TargetSelector Application(const std::string& name) {
    TargetSelector t;
    t.kind = Kind::kApplication;
    t.application = name;
    return t;
  }
};

/// Output of a successful resolution.
struct ResolvedTarget {
  RecordingGeometry geometry;
  CaptureTarget target;
  std::vector<std::string> warnings;  ///< Non-fatal observations
};

/// Turns a target selector and area into validated capture geometry.
class GeometryResolver {
 public:
  explicit GeometryResolver(EnumerationService* enumeration)
      : enumeration_(enumeration) {}

  /// Query the enumeration service once and resolve.
  bool Resolve(const TargetSelector& selector, const AreaSpec& area,
               ResolvedTarget* out, Error* err);

  // -- Pure steps, usable without an enumeration service --

  /// Screen-mode geometry with bounds validation.
  static bool ResolveScreenArea(const ScreenDescriptor& screen,
                                const AreaSpec& area, RecordingGeometry* out,
                                std::vector<std::string>* warnings,
                                Error* err);

  /// Application-mode geometry.  No bounds validation is performed.
  static RecordingGeometry ResolveWindowGeometry(
      const WindowDescriptor& window, const ScreenDescriptor& screen);

  /// Exact name, exact id, then unique substring (all case-insensitive).
  static bool MatchApplication(const std::vector<ApplicationDescriptor>& apps,
                               const std::string& query,
                               ApplicationDescriptor* out, Error* err);

  /// Titled windows first, then the largest.  False if `windows` is empty.
  static bool SelectBestWindow(const std::vector<WindowDescriptor>& windows,
                               WindowDescriptor* out);

  /// Screen whose pixel bounds contain the centre of `frame` (scaled by
  /// that screen's factor), else the primary, else the first.  Null only
  /// if `screens` is empty.
  static const ScreenDescriptor* ContainingScreen(
      const std::vector<ScreenDescriptor>& screens, const Rect& frame);

 private:
  bool ResolveApplication(const std::string& query,
                          const std::vector<ScreenDescriptor>& screens,
                          ResolvedTarget* out, Error* err);

  EnumerationService* enumeration_;  // Not owned.
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_GEOMETRY_RESOLVER_H_
