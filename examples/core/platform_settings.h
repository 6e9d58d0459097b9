// Copyright 2026 The screenrec Authors
//
// IPlatformSettings: read-only access to the user's recording defaults.
//
// Linux:    $XDG_CONFIG_HOME/screenrec/settings.ini
//           (fallback ~/.config/screenrec/settings.ini)

#ifndef SCREENREC_EXAMPLES_CORE_PLATFORM_SETTINGS_H_
#define SCREENREC_EXAMPLES_CORE_PLATFORM_SETTINGS_H_

#include <memory>
#include <string>

class IPlatformSettings {
 public:
  virtual ~IPlatformSettings() = default;

  /// Read a 32-bit integer setting.  Returns true if the key exists and
  /// holds an integer.
  virtual bool GetInt(const char* key, int* out_value) = 0;

  /// Read a string setting.  Returns true if the key exists.
  virtual bool GetString(const char* key, std::string* out_value) = 0;

  /// Path of the backing store, for diagnostics.
  virtual std::string Location() const = 0;

 protected:
  IPlatformSettings() = default;

 private:
  IPlatformSettings(const IPlatformSettings&) = delete;
  IPlatformSettings& operator=(const IPlatformSettings&) = delete;
};

/// Factory: returns the platform-specific implementation.
std::unique_ptr<IPlatformSettings> CreatePlatformSettings();

#endif  // SCREENREC_EXAMPLES_CORE_PLATFORM_SETTINGS_H_
