// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_INTERRUPT_COORDINATOR_H_
#define SCREENREC_CORE_INTERRUPT_COORDINATOR_H_

#include <signal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "core/error.h"

namespace screenrec {
namespace internal {

/// Turns SIGINT/SIGTERM into one graceful shutdown per session.
///
/// The signal handler only writes a byte to a self-pipe; a watcher thread
/// runs the registered handler, then waits up to the grace period for
/// NotifyFinalized().  If finalization does not report in time the exit
/// function is called with kScreenRecExitFinalizeTimeout.
///
/// At most one coordinator may be installed per process.
class InterruptCoordinator {
 public:
  using Handler = std::function<void()>;
  using ExitFunction = std::function<void(int status)>;

  static constexpr std::chrono::milliseconds kDefaultGrace{10000};

  InterruptCoordinator();
  ~InterruptCoordinator();

  // Non-copyable.
  InterruptCoordinator(const InterruptCoordinator&) = delete;
  InterruptCoordinator& operator=(const InterruptCoordinator&) = delete;

  /// Install the signal handlers and start the watcher thread.
  bool Install(Error* err);

  /// Restore the previous signal dispositions and join the watcher.
  void Uninstall();

  bool installed() const { return installed_; }

  /// Register the handler for the current session, replacing any previous
  /// one, and re-arm for a new interrupt.
  void Register(Handler handler,
                std::chrono::milliseconds grace = kDefaultGrace);

  void Unregister();

  /// Deliver an interrupt as if a signal had arrived.  Any thread.
  void Trigger();

  /// Finalization of the current session has finished, successfully or not.
  void NotifyFinalized();

  /// Defaults to flushing the log and calling std::_Exit().
  void set_exit_function(ExitFunction fn);

  /// An interrupt was handled since the last Register().
  bool triggered() const { return triggered_.load(); }

 private:
  void WatchLoop();
  void HandleInterrupt();

  bool installed_ = false;
  int pipe_fds_[2] = {-1, -1};
  std::thread watcher_;
  struct sigaction prev_int_;
  struct sigaction prev_term_;

  std::mutex mu_;
  std::condition_variable finalized_cv_;
  Handler handler_;
  ExitFunction exit_fn_;
  std::chrono::milliseconds grace_{kDefaultGrace};
  bool finalized_ = false;
  std::atomic<bool> triggered_{false};
};

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_INTERRUPT_COORDINATOR_H_
