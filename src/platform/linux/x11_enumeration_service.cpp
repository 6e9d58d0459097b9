// Copyright 2026 The screenrec Authors

#include "platform/linux/x11_enumeration_service.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <string>

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/Xatom.h>

#include "core/logger.h"

namespace screenrec {
namespace internal {

namespace {

int LogX11Error(Display* dpy, XErrorEvent* ev) {
  char text[256] = {0};
  XGetErrorText(dpy, ev->error_code, text, sizeof(text));
  SCREENREC_LOG_DEBUG("X11 error ignored: {} (request {}, resource 0x{:x})",
                      text, static_cast<int>(ev->request_code),
                      static_cast<unsigned long>(ev->resourceid));
  return 0;
}

std::string ReadWindowTitle(Display* dpy, Window w, Atom net_wm_name,
                            Atom utf8_str) {
  // _NET_WM_NAME (UTF-8) > WM_NAME
  if (net_wm_name != None && utf8_str != None) {
    Atom type;
    int fmt;
    unsigned long items, after;
    unsigned char* data = nullptr;
    if (XGetWindowProperty(dpy, w, net_wm_name, 0, 1024, False, utf8_str,
                           &type, &fmt, &items, &after, &data) == Success &&
        data) {
      std::string title(reinterpret_cast<char*>(data), items);
      XFree(data);
      if (!title.empty()) return title;
    }
  }
  XTextProperty tp;
  if (XGetWMName(dpy, w, &tp) && tp.value) {
    std::string title(reinterpret_cast<char*>(tp.value), tp.nitems);
    XFree(tp.value);
    return title;
  }
  return std::string();
}

std::string ReadWindowClass(Display* dpy, Window w) {
  XClassHint hint;
  hint.res_name = nullptr;
  hint.res_class = nullptr;
  std::string cls;
  if (XGetClassHint(dpy, w, &hint)) {
    if (hint.res_class) cls = hint.res_class;
    else if (hint.res_name) cls = hint.res_name;
    if (hint.res_name) XFree(hint.res_name);
    if (hint.res_class) XFree(hint.res_class);
  }
  return cls;
}

int32_t ReadWindowPid(Display* dpy, Window w, Atom net_wm_pid) {
  if (net_wm_pid == None) return 0;
  Atom type;
  int fmt;
  unsigned long items, after;
  unsigned char* data = nullptr;
  int32_t pid = 0;
  if (XGetWindowProperty(dpy, w, net_wm_pid, 0, 1, False, XA_CARDINAL,
                         &type, &fmt, &items, &after, &data) == Success &&
      data) {
    if (items > 0) {
      pid = static_cast<int32_t>(*reinterpret_cast<unsigned long*>(data));
    }
    XFree(data);
  }
  return pid;
}

std::string ProcessName(int32_t pid) {
  if (pid <= 0) return std::string();
  char path[64];
  std::snprintf(path, sizeof(path), "/proc/%d/comm", pid);
  FILE* f = std::fopen(path, "r");
  if (!f) return std::string();
  char buf[256] = {0};
  std::string name;
  if (std::fgets(buf, sizeof(buf), f)) {
    size_t len = std::strlen(buf);
    if (len > 0 && buf[len - 1] == '\n') buf[len - 1] = '\0';
    name = buf;
  }
  std::fclose(f);
  return name;
}

}  // namespace

void InstallX11ErrorHandler() {
  static std::once_flag once;
  std::call_once(once, [] {
    XInitThreads();
    XSetErrorHandler(&LogX11Error);
  });
}

void* OpenX11Display(Error* err) {
  InstallX11ErrorHandler();
  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    const char* name = std::getenv("DISPLAY");
    Fail(err, kScreenRecErrorDisplayUnavailable,
         std::string("Cannot open X11 display ") +
             (name ? "'" + std::string(name) + "'" : "(DISPLAY is unset)"),
         "Run screenrec inside an X11 session or set DISPLAY");
    return nullptr;
  }
  return dpy;
}

double QueryX11ScaleFactor(void* display) {
  auto* dpy = static_cast<Display*>(display);
  if (dpy) {
    char* xdpi = XGetDefault(dpy, "Xft", "dpi");
    if (xdpi) {
      int dpi = std::atoi(xdpi);
      if (dpi > 0) return static_cast<double>(dpi) / 96.0;
    }
  }
  const char* gdk_scale = std::getenv("GDK_SCALE");
  if (gdk_scale) {
    double scale = std::atof(gdk_scale);
    if (scale > 0.0) return scale;
  }
  return 1.0;
}

X11EnumerationService::X11EnumerationService() = default;

X11EnumerationService::~X11EnumerationService() {
  if (display_) {
    XCloseDisplay(static_cast<Display*>(display_));
    display_ = nullptr;
  }
}

bool X11EnumerationService::EnsureDisplay(Error* err) {
  if (display_) return true;
  display_ = OpenX11Display(err);
  return display_ != nullptr;
}

bool X11EnumerationService::ListScreens(std::vector<ScreenDescriptor>* out,
                                        Error* err) {
  if (!out) return Fail(err, kScreenRecErrorInvalidParam, "null output");
  out->clear();
  if (!EnsureDisplay(err)) return false;

  auto* dpy = static_cast<Display*>(display_);
  const double scale = QueryX11ScaleFactor(dpy);
  const int count = ScreenCount(dpy);
  const int primary = DefaultScreen(dpy);

  // Primary first, then the remaining X screens laid out left to right.
  std::vector<int> order;
  order.push_back(primary);
  for (int s = 0; s < count; ++s) {
    if (s != primary) order.push_back(s);
  }

  double next_x = 0;
  for (int scr : order) {
    ScreenDescriptor d;
    d.index = static_cast<int>(out->size());
    d.display_id = static_cast<uint64_t>(scr);
    d.scale_factor = scale;
    d.is_primary = (scr == primary);
    d.logical_frame.x = next_x;
    d.logical_frame.y = 0;
    d.logical_frame.width = DisplayWidth(dpy, scr) / scale;
    d.logical_frame.height = DisplayHeight(dpy, scr) / scale;
    char name[32];
    std::snprintf(name, sizeof(name), "Screen %d", scr);
    d.name = name;
    next_x += d.logical_frame.width;
    out->push_back(d);
  }

  if (out->empty()) {
    return Fail(err, kScreenRecErrorScreenNotFound,
                "X server reports no screens");
  }
  SCREENREC_LOG_DEBUG("Found {} X11 screen(s), scale {:.2f}", out->size(),
                      scale);
  return true;
}

bool X11EnumerationService::CollectWindows(
    const std::vector<ScreenDescriptor>& screens,
    std::vector<WindowDescriptor>* out, Error* err) {
  (void)err;
  auto* dpy = static_cast<Display*>(display_);

  // Prefer EWMH _NET_CLIENT_LIST_STACKING (topmost last).
  Atom net_cl = XInternAtom(dpy, "_NET_CLIENT_LIST_STACKING", True);
  if (net_cl == None) net_cl = XInternAtom(dpy, "_NET_CLIENT_LIST", True);
  Atom net_wm_name = XInternAtom(dpy, "_NET_WM_NAME", True);
  Atom utf8_str = XInternAtom(dpy, "UTF8_STRING", True);
  Atom net_wm_pid = XInternAtom(dpy, "_NET_WM_PID", True);

  for (const auto& screen : screens) {
    int scr = static_cast<int>(screen.display_id);
    Window root = RootWindow(dpy, scr);

    Window* wins = nullptr;
    unsigned long n_wins = 0;
    bool ewmh = false;
    if (net_cl != None) {
      Atom type;
      int fmt;
      unsigned long items, after;
      unsigned char* data = nullptr;
      if (XGetWindowProperty(dpy, root, net_cl, 0, ~0L, False, XA_WINDOW,
                             &type, &fmt, &items, &after, &data) == Success &&
          data) {
        wins = reinterpret_cast<Window*>(data);
        n_wins = items;
        ewmh = true;
      }
    }

    Window root_ret, parent_ret;
    Window* children = nullptr;
    unsigned int n_children = 0;
    if (!ewmh) {
      XQueryTree(dpy, root, &root_ret, &parent_ret, &children, &n_children);
      wins = children;
      n_wins = n_children;
    }

    for (unsigned long i = 0; i < n_wins; ++i) {
      Window w = wins[i];
      XWindowAttributes a;
      if (!XGetWindowAttributes(dpy, w, &a)) continue;
      if (a.c_class == InputOnly) continue;

      // Size filters are in logical units.
      const double lw = a.width / screen.scale_factor;
      const double lh = a.height / screen.scale_factor;
      if (lw < kMinWindowWidth || lh < kMinWindowHeight) continue;
      std::string title = ReadWindowTitle(dpy, w, net_wm_name, utf8_str);
      if (title.empty() && (lw < kMinUntitledWidth || lh < kMinUntitledHeight)) {
        continue;
      }

      std::string cls = ReadWindowClass(dpy, w);
      if (cls.empty()) continue;

      int ax = 0, ay = 0;
      Window ch;
      XTranslateCoordinates(dpy, w, root, 0, 0, &ax, &ay, &ch);

      WindowDescriptor info;
      info.window_id = static_cast<uint64_t>(w);
      info.title = title;
      info.application_id = cls;
      info.pid = ReadWindowPid(dpy, w, net_wm_pid);
      info.on_screen = (a.map_state == IsViewable);
      info.logical_frame.x = screen.logical_frame.x + ax / screen.scale_factor;
      info.logical_frame.y = screen.logical_frame.y + ay / screen.scale_factor;
      info.logical_frame.width = a.width / screen.scale_factor;
      info.logical_frame.height = a.height / screen.scale_factor;
      out->push_back(info);
    }

    if (ewmh)
      XFree(wins);
    else if (children)
      XFree(children);
  }
  return true;
}

bool X11EnumerationService::ListApplications(
    std::vector<ApplicationDescriptor>* out, Error* err) {
  if (!out) return Fail(err, kScreenRecErrorInvalidParam, "null output");
  out->clear();

  std::vector<ScreenDescriptor> screens;
  if (!ListScreens(&screens, err)) return false;
  std::vector<WindowDescriptor> windows;
  if (!CollectWindows(screens, &windows, err)) return false;

  std::map<std::string, size_t> by_id;
  for (const auto& w : windows) {
    auto it = by_id.find(w.application_id);
    if (it != by_id.end()) {
      (*out)[it->second].window_count++;
      continue;
    }
    ApplicationDescriptor app;
    app.id = w.application_id;
    app.pid = w.pid;
    app.name = ProcessName(w.pid);
    if (app.name.empty()) app.name = w.application_id;
    app.window_count = 1;
    by_id[app.id] = out->size();
    out->push_back(app);
  }
  return true;
}

bool X11EnumerationService::ListWindows(const std::string& application_id,
                                        std::vector<WindowDescriptor>* out,
                                        Error* err) {
  if (!out) return Fail(err, kScreenRecErrorInvalidParam, "null output");
  out->clear();

  std::vector<ScreenDescriptor> screens;
  if (!ListScreens(&screens, err)) return false;
  std::vector<WindowDescriptor> windows;
  if (!CollectWindows(screens, &windows, err)) return false;

  for (auto& w : windows) {
    if (w.application_id == application_id) out->push_back(std::move(w));
  }
  return true;
}

// Factory function.
std::unique_ptr<EnumerationService> CreatePlatformEnumerationService() {
  return std::make_unique<X11EnumerationService>();
}

}  // namespace internal
}  // namespace screenrec
