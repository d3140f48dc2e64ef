#pragma once

#include <stdexcept>
#include <string>

// Invalid option values, or a document that breaks a caller-level
// invariant (duplicate snippet names or site addresses).
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message);
};

// The Caddyfile does not exist. Callers may offer to create a new one
// instead of treating this as a read failure.
class CaddyfileNotFound : public std::runtime_error {
 public:
  explicit CaddyfileNotFound(const std::string& path);
  virtual ~CaddyfileNotFound() throw();

  const std::string& path() const;

 private:
  std::string path_;
};

// The validating authority could not be asked at all: binary missing,
// spawn failure, timeout or cancellation. This means "unknown", never
// "invalid".
class ValidationUnavailable : public std::runtime_error {
 public:
  explicit ValidationUnavailable(const std::string& message);
};

// The admin API could not be reached (connect/read failure, timeout,
// cancellation).
class AdminUnreachable : public ValidationUnavailable {
 public:
  explicit AdminUnreachable(const std::string& message);
};

// The admin API answered with a non-success status. For /load this is the
// "reload rejected" case: the live server refused text that may have passed
// validation against a different snapshot.
class AdminError : public std::runtime_error {
 public:
  AdminError(int status, const std::string& message);
  virtual ~AdminError() throw();

  int status() const;
  const std::string& message() const;

 private:
  static std::string format(int status, const std::string& message);

  int status_;
  std::string message_;
};

// A child process could not be run to completion.
class ProcessError : public std::runtime_error {
 public:
  enum Kind {
    SPAWN_FAILED,  // pipe/fork/exec failure other than a missing binary
    NOT_FOUND,     // the executable does not exist
    TIMED_OUT,
    CANCELLED,
    IO_FAILED
  };

  ProcessError(Kind kind, const std::string& message);

  Kind kind() const;

 private:
  Kind kind_;
};
