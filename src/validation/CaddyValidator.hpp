#pragma once

#include <string>
#include <vector>

#include "DiagnosticDecoder.hpp"
#include "IValidator.hpp"

// Validates by running the caddy binary:
//   content: caddy adapt --config - --adapter caddyfile --validate  (stdin)
//   file:    caddy validate --config <path>
// Exit status 0 means valid; anything else is decoded from stderr.
class CaddyValidator : public IValidator {
 public:
  CaddyValidator();
  CaddyValidator(const std::string& binary, int timeout_ms);
  virtual ~CaddyValidator();

  virtual ValidationResult validateContent(const std::string& content,
                                           const CancelToken* cancel);
  virtual ValidationResult validateFile(const std::string& path,
                                        const CancelToken* cancel);
  virtual std::string name() const;

  const std::string& binary() const;
  int timeoutMs() const;

 private:
  ValidationResult run(const std::vector<std::string>& argv,
                       const std::string& input, const CancelToken* cancel);

  std::string binary_;
  int timeout_ms_;
  DiagnosticDecoder decoder_;
};
