#pragma once

#include <string>
#include <vector>

// Settings of one caddyshack run. Defaults come from constants.hpp, then
// CADDYSHACK_* environment variables, then command-line flags.
struct Options {
  Options();

  std::string command;
  std::vector<std::string> args;  // positional arguments after the command

  std::string caddyfile;
  std::string admin_url;
  std::string caddy_bin;
  int timeout_sec;  // validation and admin calls; reload uses its own
  bool use_api;     // validate through the admin API instead of the binary
  bool write;       // fmt: rewrite the file in place
  bool show_help;
  int log_level;    // Logger::LogLevel value
};

// Applies CADDYSHACK_CADDYFILE, CADDYSHACK_CADDY_API, CADDYSHACK_CADDY_BIN,
// CADDYSHACK_TIMEOUT and CADDYSHACK_LOG_LEVEL. Throws ConfigError on an
// invalid value.
void applyEnvironment(Options& opts);

// Fills `opts` from the environment and then from argv:
//
//   caddyshack [-l:N] [--caddyfile=PATH] [--admin=URL] [--caddy-bin=PATH]
//              [--timeout=SECONDS] [--api] [--write] <command> [args...]
//
// Throws ConfigError on unknown flags or invalid values.
void processArgs(int argc, char** argv, Options& opts);

std::string usage();
