#include "Errors.hpp"

#include <sstream>

ConfigError::ConfigError(const std::string& message)
    : std::runtime_error(message) {}

CaddyfileNotFound::CaddyfileNotFound(const std::string& path)
    : std::runtime_error("Caddyfile not found: " + path), path_(path) {}

CaddyfileNotFound::~CaddyfileNotFound() throw() {}

const std::string& CaddyfileNotFound::path() const {
  return path_;
}

ValidationUnavailable::ValidationUnavailable(const std::string& message)
    : std::runtime_error(message) {}

AdminUnreachable::AdminUnreachable(const std::string& message)
    : ValidationUnavailable(message) {}

AdminError::AdminError(int status, const std::string& message)
    : std::runtime_error(format(status, message)),
      status_(status),
      message_(message) {}

AdminError::~AdminError() throw() {}

int AdminError::status() const {
  return status_;
}

const std::string& AdminError::message() const {
  return message_;
}

std::string AdminError::format(int status, const std::string& message) {
  std::ostringstream oss;
  oss << "caddy admin api error (status " << status << ")";
  if (!message.empty()) {
    oss << ": " << message;
  }
  return oss.str();
}

ProcessError::ProcessError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ProcessError::Kind ProcessError::kind() const {
  return kind_;
}
