#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace authbridge {

/**
 * ShutdownHandler provides graceful shutdown for the processor.
 *
 * Usage:
 *   1. Register callbacks with OnShutdown() (stop listeners, flush traces)
 *   2. Call InstallSignalHandlers() to catch SIGTERM/SIGINT/SIGHUP
 *   3. On signal, the callbacks run once, in registration order
 *
 * The signal handler only writes to a pipe; callbacks run on a watcher
 * thread, never in signal context.
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  // Non-copyable, non-movable
  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Install signal handlers for SIGTERM, SIGINT, and SIGHUP.
   * Returns true if handlers were installed successfully.
   *
   * Note: This modifies global signal handlers. Only one handler per
   * process may have them installed.
   */
  bool InstallSignalHandlers();

  /**
   * Restore original signal handlers and stop the watcher thread.
   */
  void RestoreSignalHandlers();

  /**
   * Trigger shutdown: run all registered callbacks.
   * Thread-safe and idempotent (safe to call multiple times).
   * Returns true if shutdown was performed, false if already shut down.
   */
  bool Shutdown();

  /**
   * Check if shutdown has been requested.
   */
  bool IsShutdownRequested() const;

  /**
   * Register a callback to run during shutdown.
   */
  void OnShutdown(std::function<void()> callback);

  /**
   * Block until shutdown is complete.
   */
  void WaitForShutdown();

  /** Signal that triggered shutdown, 0 if none. */
  int received_signal() const { return received_signal_.load(); }

 private:
  static void SignalHandler(int signum);
  void WatchSignals(int read_fd);

  std::mutex mutex_;
  std::condition_variable done_cv_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};
  std::atomic<int> received_signal_{0};
  bool handlers_installed_ = false;

  int pipe_fds_[2] = {-1, -1};
  std::thread watcher_;

  // Original signal handlers to restore
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/**
 * Global shutdown handler instance.
 */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace authbridge
