// Copyright 2026 The screenrec Authors

#include "core/output_path.h"

#include <errno.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

#include "core/logger.h"

namespace screenrec {
namespace internal {

namespace {

constexpr int64_t kLowDiskSpaceBytes = 1024LL * 1024 * 1024;  // 1 GiB

bool HasExtension(const std::string& path) {
  size_t slash = path.find_last_of('/');
  size_t dot = path.find_last_of('.');
  return dot != std::string::npos &&
         (slash == std::string::npos || dot > slash + 1);
}

}  // namespace

const char* ContainerExtension(ContainerFormat format) {
  return format == ContainerFormat::kMp4 ? ".mp4" : ".mov";
}

bool PathExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

bool IsDirectory(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string DirName(const std::string& path) {
  size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

bool MakeDirectories(const std::string& dir) {
  if (dir.empty() || IsDirectory(dir)) return true;
  std::string parent = DirName(dir);
  if (parent != dir && !MakeDirectories(parent)) return false;
  if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) return false;
  return IsDirectory(dir);
}

OutputPathResolver::OutputPathResolver()
    : prompt_(&OutputPathResolver::PromptOnTerminal),
      interactive_check_([]() { return ::isatty(STDIN_FILENO) != 0; }) {}

std::string OutputPathResolver::DefaultFileName(ContainerFormat container,
                                                std::time_t now) {
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &local);
  return std::string(buf) + ContainerExtension(container);
}

std::string OutputPathResolver::NextAvailablePath(const std::string& path) {
  std::string stem = path;
  std::string ext;
  if (HasExtension(path)) {
    size_t dot = path.find_last_of('.');
    stem = path.substr(0, dot);
    ext = path.substr(dot);
  }
  for (int n = 2;; ++n) {
    std::string candidate = stem + "-" + std::to_string(n) + ext;
    if (!PathExists(candidate)) return candidate;
  }
}

int64_t OutputPathResolver::FreeBytes(const std::string& dir) {
  struct statvfs vfs;
  if (::statvfs(dir.c_str(), &vfs) != 0) return -1;
  return static_cast<int64_t>(vfs.f_bavail) *
         static_cast<int64_t>(vfs.f_frsize);
}

ConflictChoice OutputPathResolver::PromptOnTerminal(const std::string& path) {
  std::cout << "File already exists: " << path << "\n"
            << "  1. Overwrite existing file\n"
            << "  2. Auto-number (e.g. name-2.mov)\n"
            << "  3. Cancel recording\n"
            << "Enter choice (1-3): " << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) return ConflictChoice::kCancel;
  if (line == "1") return ConflictChoice::kOverwrite;
  if (line == "2") return ConflictChoice::kAutoNumber;
  return ConflictChoice::kCancel;
}

bool OutputPathResolver::Resolve(const std::string& requested,
                                 ContainerFormat container, bool overwrite,
                                 std::string* out_path, Error* err) {
  if (!out_path) return Fail(err, kScreenRecErrorInvalidParam, "out is null");

  std::string path;
  if (requested.empty()) {
    path = DefaultFileName(container, std::time(nullptr));
  } else if (IsDirectory(requested) || requested.back() == '/') {
    std::string dir = requested;
    if (dir.back() != '/') dir += '/';
    path = dir + DefaultFileName(container, std::time(nullptr));
  } else {
    path = requested;
    if (!HasExtension(path)) path += ContainerExtension(container);
  }

  std::string dir = DirName(path);
  if (!IsDirectory(dir)) {
    if (!MakeDirectories(dir)) {
      return Fail(err, kScreenRecErrorOutputPath,
                  "Cannot create output directory '" + dir +
                      "': " + std::strerror(errno),
                  "Check the path and its permissions");
    }
    SCREENREC_LOG_INFO("Created directory {}", dir);
  }
  if (::access(dir.c_str(), W_OK) != 0) {
    return Fail(err, kScreenRecErrorOutputPath,
                "Output directory '" + dir + "' is not writable",
                "Choose a different --output location");
  }

  if (PathExists(path)) {
    if (IsDirectory(path)) {
      return Fail(err, kScreenRecErrorOutputPath,
                  "Output path '" + path + "' is a directory");
    }
    ConflictChoice choice = ConflictChoice::kAutoNumber;
    if (overwrite) {
      choice = ConflictChoice::kOverwrite;
    } else if (prompt_ && interactive_check_ && interactive_check_()) {
      choice = prompt_(path);
    }

    switch (choice) {
      case ConflictChoice::kOverwrite:
        if (::unlink(path.c_str()) != 0) {
          return Fail(err, kScreenRecErrorOutputPath,
                      "Cannot remove existing file '" + path +
                          "': " + std::strerror(errno));
        }
        SCREENREC_LOG_INFO("Overwriting {}", path);
        break;
      case ConflictChoice::kAutoNumber:
        path = NextAvailablePath(path);
        SCREENREC_LOG_INFO("Output exists, writing to {}", path);
        break;
      case ConflictChoice::kCancel:
        return Fail(err, kScreenRecErrorCancelled,
                    "Recording cancelled: output file exists");
    }
  }

  int64_t free_bytes = FreeBytes(dir);
  if (free_bytes >= 0 && free_bytes < kLowDiskSpaceBytes) {
    SCREENREC_LOG_WARN("Low disk space: {} MiB free in {}",
                       free_bytes / (1024 * 1024), dir);
  }

  *out_path = path;
  return true;
}

}  // namespace internal
}  // namespace screenrec
