#include "Logger.hpp"

#include <cctype>
#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>

// Logger instance implementation used as a temporary RAII stream object
// constructed by the LOG(...) macro.

Logger::Logger(LogLevel level, const char* file, int line)
    : msgLevel_(level), file_(file), line_(line) {}

Logger::~Logger() {
  if (msgLevel_ < level_) {
    return;
  }
  const char* base = std::strrchr(file_, '/');
  std::ostringstream output;
  output << "(" << (base ? base + 1 : file_) << ":" << line_ << ") "
         << stream_.str();
  Logger::log(msgLevel_, output.str());
}

std::ostringstream& Logger::stream() {
  return stream_;
}

// Map numeric LOG_LEVEL macro to the LogLevel enum. Define LOG_LEVEL via
// -DLOG_LEVEL=N. If LOG_LEVEL is not defined here we default to INFO.
#ifndef LOG_LEVEL
#define LOG_LEVEL Logger::INFO
#endif

Logger::LogLevel Logger::level_ =
    (LOG_LEVEL >= Logger::DEBUG && LOG_LEVEL <= Logger::ERROR)
        ? static_cast<Logger::LogLevel>(LOG_LEVEL)
        : Logger::INFO;

void Logger::setLevel(LogLevel level) {
  level_ = level;
}

Logger::LogLevel Logger::level() {
  return level_;
}

std::string Logger::getCurrentTime() {
  static const size_t kTimeBufferSize = 32;
  time_t now = time(0);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  char buffer[kTimeBufferSize];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return std::string(buffer);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

void Logger::log(LogLevel level, const std::string& message) {
  if (level < level_) {
    return;
  }

  std::cerr << "[" << getCurrentTime() << "] [" << levelToString(level)
            << "] " << message << std::endl;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
  std::string v;
  for (size_t i = 0; i < name.size(); ++i) {
    v += static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
  }
  if (v == "0" || v == "debug") {
    out = DEBUG;
  } else if (v == "1" || v == "info") {
    out = INFO;
  } else if (v == "2" || v == "error") {
    out = ERROR;
  } else {
    return false;
  }
  return true;
}
