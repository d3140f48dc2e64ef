#pragma once

#include <ostream>
#include <string>

#include "Document.hpp"
#include "Options.hpp"
#include "ValidationResult.hpp"

class AdminClient;
class CancelToken;

// Runs the command named in Options and maps failures to exit codes:
//
//   EXIT_OK                   success
//   EXIT_USAGE                bad usage or any other error
//   EXIT_INVALID              the validating authority rejected the Caddyfile
//   EXIT_UNAVAILABLE          validator or admin API could not be reached
//   EXIT_RELOAD_REJECTED      the admin API refused a request
//   EXIT_CADDYFILE_NOT_FOUND  the Caddyfile does not exist
//
// Command output goes to `out`; diagnostics go through the logger.
class CommandRunner {
 public:
  CommandRunner(const Options& opts, std::ostream& out,
                const CancelToken* cancel);

  int run();

 private:
  int dispatch();

  int fmt();
  int sites();
  int snippets();
  int validate();
  int apply();
  int config();
  int ca();
  int status();

  // Parses the Caddyfile. Refuses documents with input the parser had to
  // skip when `for_write` is set, since writing them back would drop it.
  Caddyfile load(std::string& canonical, bool for_write) const;
  ValidationResult check(const std::string& content) const;
  AdminClient adminClient(int timeout_sec) const;
  int report(const ValidationResult& result);

  Options opts_;
  std::ostream& out_;
  const CancelToken* cancel_;
};
