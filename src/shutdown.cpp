#include <authbridge/shutdown.hpp>

#include <trantor/utils/Logger.h>

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace authbridge {

namespace {
// Write end of the self-pipe of the handler that owns the signals.
std::atomic<int> g_signal_fd{-1};

constexpr unsigned char kStopWatcher = 0;
}  // namespace

ShutdownHandler::ShutdownHandler() = default;

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
}

void ShutdownHandler::SignalHandler(int signum) {
  int fd = g_signal_fd.load();
  if (fd < 0) return;
  int saved_errno = errno;
  unsigned char byte = static_cast<unsigned char>(signum);
  ssize_t n = write(fd, &byte, 1);
  (void)n;  // pipe full: a byte is already pending
  errno = saved_errno;
}

void ShutdownHandler::WatchSignals(int read_fd) {
  for (;;) {
    unsigned char byte = 0;
    ssize_t n = read(read_fd, &byte, 1);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0 || byte == kStopWatcher) return;

    received_signal_.store(byte);
    LOG_INFO << "Received signal " << static_cast<int>(byte) << ", shutting down";
    Shutdown();
    return;
  }
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (handlers_installed_) {
    return true;  // Already installed
  }
  if (g_signal_fd.load() >= 0) {
    return false;  // Another handler owns the signals
  }

  if (pipe(pipe_fds_) != 0) {
    return false;
  }
  fcntl(pipe_fds_[1], F_SETFL, fcntl(pipe_fds_[1], F_GETFL) | O_NONBLOCK);
  fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC);
  fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC);
  g_signal_fd.store(pipe_fds_[1]);

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;  // Restart interrupted syscalls

  bool ok = sigaction(SIGTERM, &sa, &old_sigterm_) == 0;
  if (ok && sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    ok = false;
  }
  if (ok && sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    ok = false;
  }
  if (!ok) {
    g_signal_fd.store(-1);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    return false;
  }

  watcher_ = std::thread(&ShutdownHandler::WatchSignals, this, pipe_fds_[0]);
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_installed_) {
      return;
    }

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    g_signal_fd.store(-1);

    unsigned char stop = kStopWatcher;
    ssize_t n = write(pipe_fds_[1], &stop, 1);
    (void)n;
    watcher = std::move(watcher_);
    handlers_installed_ = false;
  }

  // The watcher may be running Shutdown(), which takes mutex_.
  if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
    watcher.join();
  } else if (watcher.joinable()) {
    watcher.detach();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  close(pipe_fds_[0]);
  close(pipe_fds_[1]);
  pipe_fds_[0] = pipe_fds_[1] = -1;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    // Already shutting down, wait for completion
    WaitForShutdown();
    return false;
  }

  std::vector<std::function<void()>> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_copy = callbacks_;
  }

  for (const auto& callback : callbacks_copy) {
    if (callback) {
      callback();
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_complete_.store(true);
  }
  done_cv_.notify_all();
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load();
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return shutdown_complete_.load(); });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace authbridge
