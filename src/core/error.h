// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_ERROR_H_
#define SCREENREC_CORE_ERROR_H_

#include <string>
#include <utility>

#include "screenrec/screenrec.h"

namespace screenrec {
namespace internal {

/// Failure detail carried by internal operations that return bool.
struct Error {
  ScreenRecError code = kScreenRecOk;
  std::string message;
  std::string hint;  ///< Remediation hint for the user, may be empty.

  bool ok() const { return code == kScreenRecOk; }

  void Set(ScreenRecError c, std::string msg, std::string h = std::string()) {
    code = c;
    message = std::move(msg);
    hint = std::move(h);
  }

  void Clear() {
    code = kScreenRecOk;
    message.clear();
    hint.clear();
  }
};

/// Fill `err` if non-null and return false, for one-line failure returns.
inline bool Fail(Error* err, ScreenRecError code, std::string message,
                 std::string hint = std::string()) {
  if (err) err->Set(code, std::move(message), std::move(hint));
  return false;
}

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_ERROR_H_
