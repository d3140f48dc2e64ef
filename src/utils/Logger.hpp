#pragma once

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

// Stream-style logger. LOG(level) builds a temporary Logger that collects the
// message and emits it (with source location) when the statement ends:
//
//   LOG(INFO) << "Parsed " << sites.size() << " site(s)";
//
// Messages go to stderr so command output on stdout stays clean.
class Logger {
 public:
  enum LogLevel { DEBUG, INFO, ERROR };

  Logger(LogLevel level, const char* file, int line);
  ~Logger();

  std::ostringstream& stream();

  static void setLevel(LogLevel level);
  static LogLevel level();
  static void log(LogLevel level, const std::string& message);
  static std::string levelToString(LogLevel level);

  // Accepts "debug", "info", "error" (any case) or "0" to "2".
  static bool parseLevel(const std::string& name, LogLevel& out);

 private:
  Logger(const Logger& other);
  Logger& operator=(const Logger& other);

  static LogLevel level_;

  static std::string getCurrentTime();

  LogLevel msgLevel_;
  const char* file_;
  int line_;
  std::ostringstream stream_;
};

#define LOG(level) Logger(Logger::level, __FILE__, __LINE__).stream()

// Log `msg` followed by the current errno description.
#define LOG_PERROR(level, msg) \
  LOG(level) << (msg) << ": " << std::strerror(errno)
