// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_PLATFORM_LINUX_X11_ENUMERATION_SERVICE_H_
#define SCREENREC_PLATFORM_LINUX_X11_ENUMERATION_SERVICE_H_

#include <string>
#include <vector>

#include "core/enumeration_service.h"

namespace screenrec {
namespace internal {

/// Smallest window considered recordable, in logical units.
constexpr int kMinWindowWidth = 100;
constexpr int kMinWindowHeight = 50;
/// Untitled windows below this size are treated as utility surfaces.
constexpr int kMinUntitledWidth = 200;
constexpr int kMinUntitledHeight = 100;

/// Pixels per logical unit for the X server, from Xft.dpi or GDK_SCALE.
double QueryX11ScaleFactor(void* display);

/// Opens the X display named by $DISPLAY, mapping failure onto
/// kScreenRecErrorDisplayUnavailable.  Returns a Display* as void*.
void* OpenX11Display(Error* err);

/// Route Xlib protocol errors (BadWindow from windows closed mid-query)
/// to the log instead of terminating the process.  Idempotent.
void InstallX11ErrorHandler();

/// Screens and top-level windows via Xlib and the EWMH client list.
class X11EnumerationService : public EnumerationService {
 public:
  X11EnumerationService();
  ~X11EnumerationService() override;

  bool ListScreens(std::vector<ScreenDescriptor>* out, Error* err) override;
  bool ListApplications(std::vector<ApplicationDescriptor>* out,
                        Error* err) override;
  bool ListWindows(const std::string& application_id,
                   std::vector<WindowDescriptor>* out, Error* err) override;

 private:
  bool EnsureDisplay(Error* err);
  bool CollectWindows(const std::vector<ScreenDescriptor>& screens,
                      std::vector<WindowDescriptor>* out, Error* err);

  void* display_ = nullptr;  // Display* from X11
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_PLATFORM_LINUX_X11_ENUMERATION_SERVICE_H_
