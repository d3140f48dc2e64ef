#pragma once

#include <string>

#include "AdminClient.hpp"
#include "DiagnosticDecoder.hpp"
#include "IValidator.hpp"

// Validates through the admin API's /adapt endpoint. A 2xx answer is
// valid; an error answer is decoded from its message. An unreachable API
// throws AdminUnreachable.
class AdminValidator : public IValidator {
 public:
  explicit AdminValidator(const AdminClient& client);
  virtual ~AdminValidator();

  virtual ValidationResult validateContent(const std::string& content,
                                           const CancelToken* cancel);
  // Reads the file locally and submits its content.
  virtual ValidationResult validateFile(const std::string& path,
                                        const CancelToken* cancel);
  virtual std::string name() const;

 private:
  AdminClient client_;
  DiagnosticDecoder decoder_;
};
