#pragma once

#include <string>

#include "ValidationResult.hpp"

// Turns the free-text diagnostics of a validating authority into
// ValidationErrors. Each non-blank trimmed line is tried against these
// shapes, first match wins (all case-insensitive):
//
//   Caddyfile:12 - Error: unrecognized directive   -> {12, "Error: ..."}
//   line 12: unexpected token                      -> {12, "unexpected ..."}
//   Error: bad port at Caddyfile:12                -> {12, "bad port"}
//   any line mentioning error, invalid, unknown,
//   unrecognized or expected                       -> {0, line}
//
// Other lines are dropped.
class DiagnosticDecoder {
 public:
  DiagnosticDecoder();
  explicit DiagnosticDecoder(const std::string& source_name);

  ValidationErrorList decode(const std::string& output) const;

  // Returns false if the line matches none of the shapes above.
  bool decodeLine(const std::string& line, ValidationError& out) const;

  // INVALID result for a failed check: the decoded errors of `diagnostics`,
  // or a single generic error built from the first non-empty of
  // `diagnostics`, `fallback_text` and `status_text`.
  ValidationResult failure(const std::string& diagnostics,
                           const std::string& fallback_text,
                           const std::string& status_text) const;

  const std::string& sourceName() const;

 private:
  bool matchSourceMarker(const std::string& line, ValidationError& out) const;
  static bool matchLinePrefix(const std::string& line, ValidationError& out);
  static bool matchErrorAt(const std::string& line, ValidationError& out);
  static bool mentionsError(const std::string& line);

  std::string source_name_;
};
