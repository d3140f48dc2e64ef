#pragma once

#include <string>
#include <vector>

// One decoded diagnostic. line is 0 when the authority gave no line number.
struct ValidationError {
  ValidationError();
  ValidationError(int l, const std::string& msg);

  int line;
  std::string message;
};

bool operator==(const ValidationError& a, const ValidationError& b);

typedef std::vector<ValidationError> ValidationErrorList;

// Outcome of asking a validating authority about a Caddyfile.
// Starts UNCHECKED and moves once to VALID or INVALID; an INVALID result
// always carries at least one error.
class ValidationResult {
 public:
  enum State { UNCHECKED, VALID, INVALID };

  ValidationResult();
  ValidationResult(const ValidationResult& other);
  ValidationResult& operator=(const ValidationResult& other);
  ~ValidationResult();

  static ValidationResult valid();
  // An empty list is replaced by a single generic "validation failed" error.
  static ValidationResult invalid(const ValidationErrorList& errors);

  State state() const;
  bool isValid() const;
  bool isChecked() const;
  const ValidationErrorList& errors() const;

  // "Configuration is valid", or "Configuration is invalid:\n" followed by
  // one indented line per error.
  std::string toString() const;

  // The first error message; empty when valid.
  std::string firstError() const;

 private:
  State state_;
  ValidationErrorList errors_;
};
