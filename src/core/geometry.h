// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_GEOMETRY_H_
#define SCREENREC_CORE_GEOMETRY_H_

#include <cmath>
#include <cstdint>
#include <string>

namespace screenrec {
namespace internal {

/// Rectangle in logical units.
struct Rect {
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;

  double center_x() const { return x + width / 2.0; }
  double center_y() const { return y + height / 2.0; }
  double area() const { return width * height; }

  bool Contains(double px, double py) const {
    return px >= x && py >= y && px < x + width && py < y + height;
  }
};

/// Rectangle on a pixel grid.
struct PixelRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

struct PixelSize {
  int width = 0;
  int height = 0;

  int64_t area() const {
    return static_cast<int64_t>(width) * static_cast<int64_t>(height);
  }
};

/// A connected display, queried fresh for each session.
struct ScreenDescriptor {
  int index = 0;              ///< 0-based, primary first
  uint64_t display_id = 0;    ///< Platform display id (X11: screen number)
  Rect logical_frame;
  double scale_factor = 1.0;  ///< Pixels per logical unit
  bool is_primary = false;
  std::string name;

  int pixel_width() const {
    return static_cast<int>(std::lround(logical_frame.width * scale_factor));
  }
  int pixel_height() const {
    return static_cast<int>(std::lround(logical_frame.height * scale_factor));
  }

  /// Bounds in the global pixel space (logical origin scaled).
  PixelRect pixel_bounds() const {
    PixelRect r;
    r.x = static_cast<int>(std::lround(logical_frame.x * scale_factor));
    r.y = static_cast<int>(std::lround(logical_frame.y * scale_factor));
    r.width = pixel_width();
    r.height = pixel_height();
    return r;
  }
};

/// A top-level window, queried fresh for each session.
struct WindowDescriptor {
  uint64_t window_id = 0;
  std::string title;
  Rect logical_frame;         ///< Global logical coordinates
  bool on_screen = true;
  std::string application_id;
  int32_t pid = 0;
};

/// An application owning one or more eligible windows.
struct ApplicationDescriptor {
  std::string id;             ///< X11: WM_CLASS class
  std::string name;           ///< Process name
  int32_t pid = 0;
  int window_count = 0;
};

/// Resolved capture geometry.  Immutable once produced by the resolver.
///
/// `pixel_source_rect` is relative to the pixel origin of `screen` in both
/// modes; `logical_source_rect` is screen-relative in screen mode and the
/// verbatim window frame in application mode.
struct RecordingGeometry {
  PixelSize pixel_output_size;
  Rect logical_source_rect;
  PixelRect pixel_source_rect;
  double scale_factor = 1.0;
};

/// The content handed to the capture service.
struct CaptureTarget {
  enum class Kind { kScreen, kWindow };

  Kind kind = Kind::kScreen;
  ScreenDescriptor screen;    ///< Target screen, or the window's screen
  WindowDescriptor window;    ///< Valid when kind == kWindow
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_GEOMETRY_H_
