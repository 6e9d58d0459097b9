// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_OUTPUT_PATH_H_
#define SCREENREC_CORE_OUTPUT_PATH_H_

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>
#include <utility>

#include "core/error.h"

namespace screenrec {
namespace internal {

enum class ContainerFormat { kMov, kMp4 };

/// ".mov" or ".mp4".
const char* ContainerExtension(ContainerFormat format);

/// Answer to "the output file already exists".
enum class ConflictChoice { kOverwrite, kAutoNumber, kCancel };

/// Chooses the final output file and prepares its directory.
///
/// Conflict resolution order: explicit overwrite flag, then the interactive
/// prompt (only when stdin is a terminal), then auto-numbering.
class OutputPathResolver {
 public:
  using Prompt = std::function<ConflictChoice(const std::string& path)>;
  using InteractiveCheck = std::function<bool()>;

  /// Defaults: prompt on stdout/stdin, interactive when stdin is a TTY.
  OutputPathResolver();

  void set_prompt(Prompt prompt) { prompt_ = std::move(prompt); }
  void set_interactive_check(InteractiveCheck check) {
    interactive_check_ = std::move(check);
  }

  /// Resolve `requested` (may be empty) into a writable file path.
  /// Cancellation is reported as kScreenRecErrorCancelled.
  bool Resolve(const std::string& requested, ContainerFormat container,
               bool overwrite, std::string* out_path, Error* err);

  /// "YYYY-MM-DD_HH-MM-SS.<ext>" in local time.
  static std::string DefaultFileName(ContainerFormat container,
                                     std::time_t now);

  /// First "<stem>-N.<ext>" (N >= 2) that does not exist.
  static std::string NextAvailablePath(const std::string& path);

  /// Free bytes on the filesystem holding `dir`, or -1.
  static int64_t FreeBytes(const std::string& dir);

  /// Reads one answer (1/2/3) from stdin.
  static ConflictChoice PromptOnTerminal(const std::string& path);

 private:
  Prompt prompt_;
  InteractiveCheck interactive_check_;
};

// -- Small POSIX path helpers shared with the CLI --

bool PathExists(const std::string& path);
bool IsDirectory(const std::string& path);
std::string DirName(const std::string& path);

/// mkdir -p.
bool MakeDirectories(const std::string& dir);

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_OUTPUT_PATH_H_
