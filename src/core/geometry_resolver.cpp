// Copyright 2026 The screenrec Authors

#include "core/geometry_resolver.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#include "core/logger.h"

namespace screenrec {
namespace internal {

namespace {

constexpr int kSmallAreaWarnPx = 100;
constexpr double kLargeAreaWarnFraction = 0.8;

std::string ToLower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool ContainsNoCase(const std::string& haystack, const std::string& needle) {
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::string RectString(int x, int y, int w, int h) {
  return "(" + std::to_string(x) + ", " + std::to_string(y) + ", " +
         std::to_string(w) + "x" + std::to_string(h) + ")";
}

}  // namespace

bool GeometryResolver::Resolve(const TargetSelector& selector,
                               const AreaSpec& area, ResolvedTarget* out,
                               Error* err) {
  if (!out) return Fail(err, kScreenRecErrorInvalidParam, "out is null");
  if (!enumeration_) {
    return Fail(err, kScreenRecErrorNotInitialized,
                "No enumeration service available");
  }

  std::vector<ScreenDescriptor> screens;
  if (!enumeration_->ListScreens(&screens, err)) return false;
  if (screens.empty()) {
    return Fail(err, kScreenRecErrorScreenNotFound, "No screens detected");
  }

  *out = ResolvedTarget();

  if (selector.kind == TargetSelector::Kind::kApplication) {
    if (area.kind != AreaSpec::Kind::kFullScreen) {
      out->warnings.push_back("Area '" + area.ToString() +
                              "' is ignored when recording an application");
    }
    if (!ResolveApplication(selector.application, screens, out, err))
      return false;
  } else {
    int index = selector.screen_index;
    if (index < 0 || index >= static_cast<int>(screens.size())) {
      return Fail(err, kScreenRecErrorScreenNotFound,
                  "Screen " + std::to_string(index + 1) + " not found (" +
                      std::to_string(screens.size()) + " available)",
                  "Run with --list-screens to see available screens");
    }
    const ScreenDescriptor& screen = screens[index];
    if (!ResolveScreenArea(screen, area, &out->geometry, &out->warnings, err))
      return false;
    out->target.kind = CaptureTarget::Kind::kScreen;
    out->target.screen = screen;
  }

  for (const auto& w : out->warnings) SCREENREC_LOG_WARN("{}", w);

  SCREENREC_LOG_DEBUG(
      "Resolved geometry: output {}x{} px, logical source ({}, {}, {}x{}), "
      "scale {}",
      out->geometry.pixel_output_size.width,
      out->geometry.pixel_output_size.height,
      out->geometry.logical_source_rect.x, out->geometry.logical_source_rect.y,
      out->geometry.logical_source_rect.width,
      out->geometry.logical_source_rect.height, out->geometry.scale_factor);
  return true;
}

bool GeometryResolver::ResolveScreenArea(const ScreenDescriptor& screen,
                                         const AreaSpec& area,
                                         RecordingGeometry* out,
                                         std::vector<std::string>* warnings,
                                         Error* err) {
  const double scale = screen.scale_factor > 0 ? screen.scale_factor : 1.0;
  const int screen_w = screen.pixel_width();
  const int screen_h = screen.pixel_height();

  RecordingGeometry g;
  g.scale_factor = scale;

  if (area.kind == AreaSpec::Kind::kFullScreen) {
    g.pixel_output_size.width = screen_w;
    g.pixel_output_size.height = screen_h;
    g.pixel_source_rect = PixelRect{0, 0, screen_w, screen_h};
    g.logical_source_rect =
        Rect{0, 0, screen.logical_frame.width, screen.logical_frame.height};
    if (screen_w < 1 || screen_h < 1) {
      return Fail(err, kScreenRecErrorAreaOutOfBounds,
                  "Screen reports an empty pixel size");
    }
    *out = g;
    return true;
  }

  int x = area.x;
  int y = area.y;
  const int w = area.width;
  const int h = area.height;
  if (area.kind == AreaSpec::Kind::kCentered) {
    x = (screen_w - w) / 2;
    y = (screen_h - h) / 2;
  }

  if (w < 1 || h < 1 || x < 0 || y < 0 ||
      static_cast<int64_t>(x) + w > screen_w ||
      static_cast<int64_t>(y) + h > screen_h) {
    return Fail(err, kScreenRecErrorAreaOutOfBounds,
                "Area " + RectString(x, y, w, h) +
                    " is outside screen bounds " +
                    std::to_string(screen_w) + "x" + std::to_string(screen_h),
                "Coordinates are pixels relative to the screen's top-left "
                "corner");
  }

  if (warnings) {
    if (w < kSmallAreaWarnPx || h < kSmallAreaWarnPx) {
      warnings->push_back("Recording area " + std::to_string(w) + "x" +
                          std::to_string(h) + " is very small");
    }
    const double fraction = static_cast<double>(w) * h /
                            (static_cast<double>(screen_w) * screen_h);
    if (fraction > kLargeAreaWarnFraction) {
      warnings->push_back(
          "Recording area covers more than 80% of the screen; "
          "consider full screen");
    }
  }

  g.pixel_output_size.width = w;
  g.pixel_output_size.height = h;
  g.pixel_source_rect = PixelRect{x, y, w, h};
  g.logical_source_rect = Rect{x / scale, y / scale, w / scale, h / scale};
  *out = g;
  return true;
}

RecordingGeometry GeometryResolver::ResolveWindowGeometry(
    const WindowDescriptor& window, const ScreenDescriptor& screen) {
  const double scale = screen.scale_factor > 0 ? screen.scale_factor : 1.0;
  const Rect& f = window.logical_frame;

  RecordingGeometry g;
  g.scale_factor = scale;
  g.logical_source_rect = f;
  g.pixel_output_size.width = static_cast<int>(std::lround(f.width * scale));
  g.pixel_output_size.height = static_cast<int>(std::lround(f.height * scale));
  g.pixel_source_rect.x = static_cast<int>(
      std::lround((f.x - screen.logical_frame.x) * scale));
  g.pixel_source_rect.y = static_cast<int>(
      std::lround((f.y - screen.logical_frame.y) * scale));
  g.pixel_source_rect.width = g.pixel_output_size.width;
  g.pixel_source_rect.height = g.pixel_output_size.height;
  return g;
}

bool GeometryResolver::MatchApplication(
    const std::vector<ApplicationDescriptor>& apps, const std::string& query,
    ApplicationDescriptor* out, Error* err) {
  if (query.empty()) {
    return Fail(err, kScreenRecErrorInvalidParam, "Application name is empty");
  }
  const std::string q = ToLower(query);

  for (const auto& app : apps) {
    if (ToLower(app.name) == q) {
      *out = app;
      return true;
    }
  }
  for (const auto& app : apps) {
    if (ToLower(app.id) == q) {
      *out = app;
      return true;
    }
  }

  std::vector<const ApplicationDescriptor*> hits;
  for (const auto& app : apps) {
    if (ContainsNoCase(app.name, query) || ContainsNoCase(app.id, query))
      hits.push_back(&app);
  }

  if (hits.size() == 1) {
    *out = *hits.front();
    return true;
  }
  if (hits.empty()) {
    return Fail(err, kScreenRecErrorApplicationNotFound,
                "Application '" + query + "' not found",
                "Run with --list-apps to see running applications");
  }

  std::string candidates;
  for (const auto* app : hits) {
    if (!candidates.empty()) candidates += ", ";
    candidates += app->name + " (" + app->id + ")";
  }
  return Fail(err, kScreenRecErrorAmbiguousApplication,
              "Application '" + query + "' matches several applications: " +
                  candidates,
              "Use the exact application name or id");
}

bool GeometryResolver::SelectBestWindow(
    const std::vector<WindowDescriptor>& windows, WindowDescriptor* out) {
  const WindowDescriptor* best = nullptr;
  for (const auto& w : windows) {
    if (!best) {
      best = &w;
      continue;
    }
    const bool titled = !w.title.empty();
    const bool best_titled = !best->title.empty();
    if (titled != best_titled) {
      if (titled) best = &w;
      continue;
    }
    if (w.logical_frame.area() > best->logical_frame.area()) best = &w;
  }
  if (!best) return false;
  *out = *best;
  return true;
}

const ScreenDescriptor* GeometryResolver::ContainingScreen(
    const std::vector<ScreenDescriptor>& screens, const Rect& frame) {
  const double cx = frame.center_x();
  const double cy = frame.center_y();
  for (const auto& s : screens) {
    // Tested on the pixel grid the capture will read from.
    const PixelRect b = s.pixel_bounds();
    const double px = cx * s.scale_factor;
    const double py = cy * s.scale_factor;
    if (px >= b.x && py >= b.y && px < b.x + b.width && py < b.y + b.height)
      return &s;
  }
  for (const auto& s : screens) {
    if (s.is_primary) return &s;
  }
  return screens.empty() ? nullptr : &screens.front();
}

bool GeometryResolver::ResolveApplication(
    const std::string& query, const std::vector<ScreenDescriptor>& screens,
    ResolvedTarget* out, Error* err) {
  std::vector<ApplicationDescriptor> apps;
  if (!enumeration_->ListApplications(&apps, err)) return false;

  ApplicationDescriptor app;
  if (!MatchApplication(apps, query, &app, err)) return false;

  std::vector<WindowDescriptor> windows;
  if (!enumeration_->ListWindows(app.id, &windows, err)) return false;
  if (windows.empty()) {
    return Fail(err, kScreenRecErrorNoWindows,
                "Application '" + app.name + "' has no recordable windows",
                "Open a window of the application and try again");
  }

  bool any_on_screen = std::any_of(
      windows.begin(), windows.end(),
      [](const WindowDescriptor& w) { return w.on_screen; });
  if (!any_on_screen) {
    out->warnings.push_back("All windows of '" + app.name +
                            "' are off-screen or minimized");
  }

  WindowDescriptor window;
  SelectBestWindow(windows, &window);

  const ScreenDescriptor* screen =
      ContainingScreen(screens, window.logical_frame);
  RecordingGeometry g = ResolveWindowGeometry(window, *screen);
  if (g.pixel_output_size.width < 1 || g.pixel_output_size.height < 1) {
    return Fail(err, kScreenRecErrorAreaOutOfBounds,
                "Window '" + window.title + "' has an empty size");
  }

  SCREENREC_LOG_INFO("Selected window '{}' of {} on screen {}", window.title,
                     app.name, screen->index + 1);

  out->geometry = g;
  out->target.kind = CaptureTarget::Kind::kWindow;
  out->target.screen = *screen;
  out->target.window = window;
  return true;
}

}  // namespace internal
}  // namespace screenrec
