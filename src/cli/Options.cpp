#include "Options.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "Errors.hpp"
#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace {

int parseTimeout(const std::string& value, const std::string& source) {
  int seconds;
  if (!parse_uint(value, seconds) || seconds == 0) {
    throw ConfigError(source + ": timeout must be a positive number of "
                      "seconds: '" + value + "'");
  }
  return seconds;
}

int parseLogLevelName(const std::string& value) {
  Logger::LogLevel level;
  if (!Logger::parseLevel(trim_copy(value), level)) {
    throw ConfigError("CADDYSHACK_LOG_LEVEL must be debug, info, error or "
                      "0-2: '" + value + "'");
  }
  return level;
}

std::string requireValue(const std::string& arg, const std::string& flag) {
  std::string value = arg.substr(flag.size());
  if (value.empty()) {
    throw ConfigError("missing value for " + flag.substr(0, flag.size() - 1));
  }
  return value;
}

}  // namespace

Options::Options()
    : command(),
      args(),
      caddyfile(DEFAULT_CADDYFILE_PATH),
      admin_url(DEFAULT_ADMIN_URL),
      caddy_bin(DEFAULT_CADDY_BINARY),
      timeout_sec(DEFAULT_VALIDATE_TIMEOUT_SEC),
      use_api(false),
      write(false),
      show_help(false),
      log_level(Logger::level()) {}

void applyEnvironment(Options& opts) {
  const char* value = std::getenv("CADDYSHACK_CADDYFILE");
  if (value != NULL && *value != '\0') {
    opts.caddyfile = value;
  }
  value = std::getenv("CADDYSHACK_CADDY_API");
  if (value != NULL && *value != '\0') {
    opts.admin_url = value;
  }
  value = std::getenv("CADDYSHACK_CADDY_BIN");
  if (value != NULL && *value != '\0') {
    opts.caddy_bin = value;
  }
  value = std::getenv("CADDYSHACK_TIMEOUT");
  if (value != NULL && *value != '\0') {
    opts.timeout_sec = parseTimeout(value, "CADDYSHACK_TIMEOUT");
  }
  value = std::getenv("CADDYSHACK_LOG_LEVEL");
  if (value != NULL && *value != '\0') {
    opts.log_level = parseLogLevelName(value);
  }
}

void processArgs(int argc, char** argv, Options& opts) {
  applyEnvironment(opts);

  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (starts_with(arg, "-l:")) {
      try {
        opts.log_level = parseLogLevelFlag(arg);
      } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
      }
    } else if (starts_with(arg, "--caddyfile=")) {
      opts.caddyfile = requireValue(arg, "--caddyfile=");
    } else if (starts_with(arg, "--admin=")) {
      opts.admin_url = requireValue(arg, "--admin=");
    } else if (starts_with(arg, "--caddy-bin=")) {
      opts.caddy_bin = requireValue(arg, "--caddy-bin=");
    } else if (starts_with(arg, "--timeout=")) {
      opts.timeout_sec =
          parseTimeout(requireValue(arg, "--timeout="), "--timeout");
    } else if (arg == "--api") {
      opts.use_api = true;
    } else if (arg == "--write" || arg == "-w") {
      opts.write = true;
    } else if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw ConfigError("unknown option: " + arg);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.args.push_back(arg);
    }
  }
}

std::string usage() {
  std::ostringstream oss;
  oss << "usage: caddyshack [options] <command> [args]\n"
      << "\n"
      << "commands:\n"
      << "  fmt [--write]   print the Caddyfile in canonical form, or rewrite "
         "it\n"
      << "  sites           list site addresses and their imports\n"
      << "  snippets        list snippet names\n"
      << "  validate        check the Caddyfile with caddy\n"
      << "  apply           format, validate, write and reload the Caddyfile\n"
      << "  config          show the running configuration\n"
      << "  ca [id]         show a certificate authority (default \""
      << DEFAULT_CA_ID << "\")\n"
      << "  status          show whether caddy is running\n"
      << "\n"
      << "options:\n"
      << "  --caddyfile=PATH   Caddyfile location (" << DEFAULT_CADDYFILE_PATH
      << ")\n"
      << "  --admin=URL        admin API (" << DEFAULT_ADMIN_URL << ")\n"
      << "  --caddy-bin=PATH   caddy binary (" << DEFAULT_CADDY_BINARY << ")\n"
      << "  --timeout=SECONDS  validation and admin timeout ("
      << DEFAULT_VALIDATE_TIMEOUT_SEC << ")\n"
      << "  --api              validate through the admin API\n"
      << "  -l:N               log level: 0 debug, 1 info, 2 error\n";
  return oss.str();
}
