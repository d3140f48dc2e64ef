#pragma once

#include <string>

#include "ValidationResult.hpp"

class CancelToken;

// A validating authority. Both calls block until the authority answers, the
// validator's timeout expires or `cancel` (may be NULL) fires.
//
// An answer is returned as VALID or INVALID. Not getting an answer at all
// throws ValidationUnavailable.
class IValidator {
 public:
  virtual ~IValidator() {}

  virtual ValidationResult validateContent(const std::string& content,
                                           const CancelToken* cancel) = 0;

  virtual ValidationResult validateFile(const std::string& path,
                                        const CancelToken* cancel) = 0;

  // Short label for logs and CLI output, e.g. "caddy binary".
  virtual std::string name() const = 0;
};
