#include "ValidationResult.hpp"

#include <sstream>

ValidationError::ValidationError() : line(0), message() {}

ValidationError::ValidationError(int l, const std::string& msg)
    : line(l), message(msg) {}

bool operator==(const ValidationError& a, const ValidationError& b) {
  return a.line == b.line && a.message == b.message;
}

ValidationResult::ValidationResult() : state_(UNCHECKED), errors_() {}

ValidationResult::ValidationResult(const ValidationResult& other)
    : state_(other.state_), errors_(other.errors_) {}

ValidationResult& ValidationResult::operator=(const ValidationResult& other) {
  if (this != &other) {
    state_ = other.state_;
    errors_ = other.errors_;
  }
  return *this;
}

ValidationResult::~ValidationResult() {}

ValidationResult ValidationResult::valid() {
  ValidationResult res;
  res.state_ = VALID;
  return res;
}

ValidationResult ValidationResult::invalid(const ValidationErrorList& errors) {
  ValidationResult res;
  res.state_ = INVALID;
  res.errors_ = errors;
  if (res.errors_.empty()) {
    res.errors_.push_back(ValidationError(0, "validation failed"));
  }
  return res;
}

ValidationResult::State ValidationResult::state() const {
  return state_;
}

bool ValidationResult::isValid() const {
  return state_ == VALID;
}

bool ValidationResult::isChecked() const {
  return state_ != UNCHECKED;
}

const ValidationErrorList& ValidationResult::errors() const {
  return errors_;
}

std::string ValidationResult::toString() const {
  if (state_ == VALID) {
    return "Configuration is valid";
  }
  if (state_ == UNCHECKED) {
    return "Configuration has not been validated";
  }
  std::ostringstream oss;
  oss << "Configuration is invalid:\n";
  for (ValidationErrorList::const_iterator it = errors_.begin();
       it != errors_.end(); ++it) {
    if (it->line > 0) {
      oss << "  Line " << it->line << ": " << it->message << "\n";
    } else {
      oss << "  " << it->message << "\n";
    }
  }
  return oss.str();
}

std::string ValidationResult::firstError() const {
  if (state_ != INVALID || errors_.empty()) {
    return "";
  }
  return errors_[0].message;
}
