#pragma once

#include <csignal>

// Cross-thread (and signal-handler) cancellation for blocking calls.
// fd() becomes readable once cancel() has been called, so waits that
// multiplex it with their own descriptors wake up immediately.
class CancelToken {
 public:
  // Throws std::runtime_error if the wake-up pipe cannot be created.
  CancelToken();
  ~CancelToken();

  // Async-signal-safe.
  void cancel();
  bool cancelled() const;
  int fd() const;

 private:
  CancelToken(const CancelToken& other);
  CancelToken& operator=(const CancelToken& other);

  int read_fd_;
  int write_fd_;
  volatile sig_atomic_t cancelled_;
};
