// Copyright 2026 The screenrec Authors
// Linux implementation of IPlatformSettings using ~/.config/screenrec/settings.ini.

#include "core/platform_settings.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>

class LinuxPlatformSettings : public IPlatformSettings {
 public:
  LinuxPlatformSettings() { Load(); }

  bool GetInt(const char* key, int* out_value) override {
    auto it = data_.find(key);
    if (it == data_.end() || it->second.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(it->second.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    *out_value = static_cast<int>(v);
    return true;
  }

  bool GetString(const char* key, std::string* out_value) override {
    auto it = data_.find(key);
    if (it == data_.end()) return false;
    *out_value = it->second;
    return true;
  }

  std::string Location() const override { return GetConfigPath(); }

 private:
  static std::string GetXDGConfigHome() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0]) return xdg;
    const char* home = std::getenv("HOME");
    if (home) return std::string(home) + "/.config";
    return "/tmp";
  }

  static std::string GetConfigPath() {
    return GetXDGConfigHome() + "/screenrec/settings.ini";
  }

  void Load() {
    data_.clear();
    std::ifstream f(GetConfigPath());
    if (!f) return;
    std::string line;
    while (std::getline(f, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[')
        continue;
      auto eq = line.find('=');
      if (eq == std::string::npos) continue;
      std::string key = line.substr(0, eq);
      std::string val = line.substr(eq + 1);
      // Trim whitespace
      while (!key.empty() && (key.back() == ' ' || key.back() == '\t'))
        key.pop_back();
      while (!val.empty() && (val.front() == ' ' || val.front() == '\t'))
        val.erase(val.begin());
      while (!val.empty() && (val.back() == ' ' || val.back() == '\t'))
        val.pop_back();
      data_[key] = val;
    }
  }

  std::unordered_map<std::string, std::string> data_;
};

std::unique_ptr<IPlatformSettings> CreatePlatformSettings() {
  return std::make_unique<LinuxPlatformSettings>();
}
