// Copyright 2026 The screenrec Authors

#include "core/interrupt_coordinator.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include "core/logger.h"
#include "screenrec/screenrec.h"

namespace screenrec {
namespace internal {

constexpr std::chrono::milliseconds InterruptCoordinator::kDefaultGrace;

namespace {

constexpr char kInterruptByte = 'I';
constexpr char kQuitByte = 'Q';

// Write end of the installed coordinator's self-pipe, for the signal handler.
std::atomic<int> g_signal_fd{-1};

extern "C" void OnTerminationSignal(int /*signo*/) {
  int saved_errno = errno;
  int fd = g_signal_fd.load();
  if (fd >= 0) {
    char b = kInterruptByte;
    ssize_t n = ::write(fd, &b, 1);
    (void)n;  // Pipe full means an interrupt is already pending.
  }
  errno = saved_errno;
}

void DefaultExit(int status) {
  GetLogger()->flush();
  std::_Exit(status);
}

}  // namespace

InterruptCoordinator::InterruptCoordinator() : exit_fn_(&DefaultExit) {
  std::memset(&prev_int_, 0, sizeof(prev_int_));
  std::memset(&prev_term_, 0, sizeof(prev_term_));
}

InterruptCoordinator::~InterruptCoordinator() { Uninstall(); }

bool InterruptCoordinator::Install(Error* err) {
  if (installed_) return true;

  int expected = -1;
  if (g_signal_fd.load() != -1) {
    return Fail(err, kScreenRecErrorRecordInProgress,
                "Another interrupt coordinator is installed");
  }

  if (::pipe(pipe_fds_) != 0) {
    return Fail(err, kScreenRecErrorUnknown,
                std::string("pipe() failed: ") + std::strerror(errno));
  }
  for (int fd : pipe_fds_) {
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
  }
  ::fcntl(pipe_fds_[1], F_SETFL, ::fcntl(pipe_fds_[1], F_GETFL) | O_NONBLOCK);

  if (!g_signal_fd.compare_exchange_strong(expected, pipe_fds_[1])) {
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    return Fail(err, kScreenRecErrorRecordInProgress,
                "Another interrupt coordinator is installed");
  }

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = &OnTerminationSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  ::sigaction(SIGINT, &sa, &prev_int_);
  ::sigaction(SIGTERM, &sa, &prev_term_);

  watcher_ = std::thread([this] { WatchLoop(); });
  installed_ = true;
  SCREENREC_LOG_DEBUG("Interrupt handlers installed");
  return true;
}

void InterruptCoordinator::Uninstall() {
  if (!installed_) return;

  ::sigaction(SIGINT, &prev_int_, nullptr);
  ::sigaction(SIGTERM, &prev_term_, nullptr);
  g_signal_fd.store(-1);

  {
    std::lock_guard<std::mutex> lock(mu_);
    finalized_ = true;
  }
  finalized_cv_.notify_all();

  char b = kQuitByte;
  while (::write(pipe_fds_[1], &b, 1) < 0 && errno == EINTR) {
  }
  if (watcher_.joinable()) watcher_.join();

  ::close(pipe_fds_[0]);
  ::close(pipe_fds_[1]);
  pipe_fds_[0] = pipe_fds_[1] = -1;
  installed_ = false;
  SCREENREC_LOG_DEBUG("Interrupt handlers removed");
}

void InterruptCoordinator::Register(Handler handler,
                                    std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
  grace_ = grace;
  finalized_ = false;
  triggered_.store(false);
}

void InterruptCoordinator::Unregister() {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = nullptr;
}

void InterruptCoordinator::Trigger() {
  if (installed_) {
    char b = kInterruptByte;
    ssize_t n = ::write(pipe_fds_[1], &b, 1);
    if (n == 1) return;
  }
  HandleInterrupt();
}

void InterruptCoordinator::NotifyFinalized() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    finalized_ = true;
  }
  finalized_cv_.notify_all();
}

void InterruptCoordinator::set_exit_function(ExitFunction fn) {
  std::lock_guard<std::mutex> lock(mu_);
  exit_fn_ = std::move(fn);
}

void InterruptCoordinator::WatchLoop() {
  for (;;) {
    struct pollfd pfd;
    pfd.fd = pipe_fds_[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      SCREENREC_LOG_ERROR("poll() on interrupt pipe failed: {}",
                          std::strerror(errno));
      return;
    }
    char b = 0;
    ssize_t n = ::read(pipe_fds_[0], &b, 1);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) continue;
      return;
    }
    if (b == kQuitByte) return;
    HandleInterrupt();
  }
}

void InterruptCoordinator::HandleInterrupt() {
  if (triggered_.exchange(true)) {
    SCREENREC_LOG_INFO("Already stopping, please wait...");
    return;
  }

  Handler handler;
  ExitFunction exit_fn;
  std::chrono::milliseconds grace;
  {
    std::lock_guard<std::mutex> lock(mu_);
    handler = handler_;
    exit_fn = exit_fn_;
    grace = grace_;
  }

  if (!handler) {
    SCREENREC_LOG_INFO("Interrupted");
    if (exit_fn) exit_fn(kScreenRecExitInterrupted);
    return;
  }

  SCREENREC_LOG_INFO("Interrupt received, stopping recording...");
  handler();

  std::unique_lock<std::mutex> lock(mu_);
  if (!finalized_cv_.wait_for(lock, grace, [this] { return finalized_; })) {
    lock.unlock();
    SCREENREC_LOG_ERROR(
        "Finalization did not finish within {} ms, exiting; the output "
        "file may be incomplete",
        grace.count());
    if (exit_fn) exit_fn(kScreenRecExitFinalizeTimeout);
  }
}

}  // namespace internal
}  // namespace screenrec
