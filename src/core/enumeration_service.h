// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_ENUMERATION_SERVICE_H_
#define SCREENREC_CORE_ENUMERATION_SERVICE_H_

#include <memory>
#include <string>
#include <vector>

#include "core/error.h"
#include "core/geometry.h"

namespace screenrec {
namespace internal {

/// Read-only queries over the displays and windows of the desktop session.
///
/// Implementations connect to the display server lazily on first use.
/// Results are never cached across calls; each geometry resolution sees the
/// current layout.
class EnumerationService {
 public:
  virtual ~EnumerationService() = default;

  // Non-copyable.
  EnumerationService(const EnumerationService&) = delete;
  EnumerationService& operator=(const EnumerationService&) = delete;

  /// Connected screens, primary first, with `index` assigned 0..n-1.
  virtual bool ListScreens(std::vector<ScreenDescriptor>* out,
                           Error* err) = 0;

  /// Applications owning at least one eligible window.
  virtual bool ListApplications(std::vector<ApplicationDescriptor>* out,
                                Error* err) = 0;

  /// Eligible windows owned by `application_id`.
  virtual bool ListWindows(const std::string& application_id,
                           std::vector<WindowDescriptor>* out,
                           Error* err) = 0;

 protected:
  EnumerationService() = default;
};

/// Defined in platform/<os>/xxx_enumeration_service.cpp.
std::unique_ptr<EnumerationService> CreatePlatformEnumerationService();

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_ENUMERATION_SERVICE_H_
