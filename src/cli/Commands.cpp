#include "Commands.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

#include "AdminClient.hpp"
#include "AdminValidator.hpp"
#include "CaddyValidator.hpp"
#include "ConfigFile.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Parser.hpp"
#include "Writer.hpp"
#include "constants.hpp"
#include "utils.hpp"

CommandRunner::CommandRunner(const Options& opts, std::ostream& out,
                             const CancelToken* cancel)
    : opts_(opts), out_(out), cancel_(cancel) {}

int CommandRunner::run() {
  try {
    return dispatch();
  } catch (const CaddyfileNotFound& e) {
    LOG(ERROR) << e.what();
    return EXIT_CADDYFILE_NOT_FOUND;
  } catch (const ConfigError& e) {
    LOG(ERROR) << e.what();
    return EXIT_USAGE;
  } catch (const ValidationUnavailable& e) {
    LOG(ERROR) << e.what();
    return EXIT_UNAVAILABLE;
  } catch (const AdminError& e) {
    LOG(ERROR) << e.what();
    return EXIT_RELOAD_REJECTED;
  } catch (const std::exception& e) {
    LOG(ERROR) << opts_.command << ": " << e.what();
    return EXIT_USAGE;
  }
}

int CommandRunner::dispatch() {
  const std::string& cmd = opts_.command;
  LOG(DEBUG) << "CommandRunner: " << cmd << " (Caddyfile " << opts_.caddyfile
             << ")";
  if (cmd == "fmt") {
    return fmt();
  }
  if (cmd == "sites") {
    return sites();
  }
  if (cmd == "snippets") {
    return snippets();
  }
  if (cmd == "validate") {
    return validate();
  }
  if (cmd == "apply") {
    return apply();
  }
  if (cmd == "config") {
    return config();
  }
  if (cmd == "ca") {
    return ca();
  }
  if (cmd == "status") {
    return status();
  }
  throw ConfigError("unknown command: '" + cmd + "'");
}

Caddyfile CommandRunner::load(std::string& canonical, bool for_write) const {
  std::string content = ConfigFile(opts_.caddyfile).read();

  SkippedRangeList skipped;
  Caddyfile doc = Parser(content).parseAll(&skipped);
  for (SkippedRangeList::const_iterator it = skipped.begin();
       it != skipped.end(); ++it) {
    LOG(INFO) << opts_.caddyfile << ":" << it->line << ": skipped ("
              << it->reason << "): " << it->text;
  }
  if (for_write && !skipped.empty()) {
    std::ostringstream oss;
    oss << "refusing to rewrite " << opts_.caddyfile << ": " << skipped.size()
        << " unparsed range(s), first at line " << skipped[0].line << " ("
        << skipped[0].reason << ")";
    throw ConfigError(oss.str());
  }

  canonical = Writer().writeCaddyfile(doc);
  return doc;
}

AdminClient CommandRunner::adminClient(int timeout_sec) const {
  return AdminClient(opts_.admin_url, timeout_sec * 1000);
}

ValidationResult CommandRunner::check(const std::string& content) const {
  if (opts_.use_api) {
    AdminValidator validator(adminClient(opts_.timeout_sec));
    LOG(DEBUG) << "CommandRunner: validating with " << validator.name();
    return validator.validateContent(content, cancel_);
  }
  CaddyValidator validator(opts_.caddy_bin, opts_.timeout_sec * 1000);
  LOG(DEBUG) << "CommandRunner: validating with " << validator.name();
  return validator.validateContent(content, cancel_);
}

int CommandRunner::report(const ValidationResult& result) {
  out_ << result.toString();
  if (result.isValid()) {
    out_ << "\n";
    return EXIT_OK;
  }
  return EXIT_INVALID;
}

int CommandRunner::fmt() {
  std::string text;
  Caddyfile doc = load(text, opts_.write);
  if (!opts_.write) {
    out_ << text;
    return EXIT_OK;
  }
  requireUnique(doc);
  ConfigFile(opts_.caddyfile).write(text);
  out_ << "Formatted " << opts_.caddyfile << "\n";
  return EXIT_OK;
}

int CommandRunner::sites() {
  std::string text;
  Caddyfile doc = load(text, false);
  for (std::vector<Site>::const_iterator it = doc.sites.begin();
       it != doc.sites.end(); ++it) {
    out_ << join(it->addresses, " ") << "\n";
    if (!it->imports.empty()) {
      out_ << "  imports: " << join(it->imports, ", ") << "\n";
    }
  }
  return EXIT_OK;
}

int CommandRunner::snippets() {
  std::string text;
  Caddyfile doc = load(text, false);
  for (std::vector<Snippet>::const_iterator it = doc.snippets.begin();
       it != doc.snippets.end(); ++it) {
    out_ << it->name << "\n";
  }
  return EXIT_OK;
}

int CommandRunner::validate() {
  ConfigFile file(opts_.caddyfile);
  if (!file.exists()) {
    throw CaddyfileNotFound(opts_.caddyfile);
  }
  if (opts_.use_api) {
    AdminValidator validator(adminClient(opts_.timeout_sec));
    return report(validator.validateFile(file.path(), cancel_));
  }
  CaddyValidator validator(opts_.caddy_bin, opts_.timeout_sec * 1000);
  return report(validator.validateFile(file.path(), cancel_));
}

int CommandRunner::apply() {
  std::string text;
  Caddyfile doc = load(text, true);
  requireUnique(doc);

  ValidationResult result = check(text);
  if (!result.isValid()) {
    LOG(ERROR) << "apply: not writing " << opts_.caddyfile << ": "
               << result.firstError();
    return report(result);
  }

  ConfigFile(opts_.caddyfile).write(text);
  adminClient(DEFAULT_RELOAD_TIMEOUT_SEC).load(text, cancel_);
  out_ << "Configuration applied\n";
  return EXIT_OK;
}

int CommandRunner::config() {
  std::string raw = adminClient(opts_.timeout_sec).getConfig(cancel_);
  nlohmann::json j = nlohmann::json::parse(
      raw, nlohmann::json::parser_callback_t(), false);
  if (j.is_discarded()) {
    out_ << raw;
    if (raw.empty() || raw[raw.size() - 1] != '\n') {
      out_ << "\n";
    }
  } else {
    out_ << j.dump(2) << "\n";
  }
  return EXIT_OK;
}

int CommandRunner::ca() {
  std::string id = opts_.args.empty() ? DEFAULT_CA_ID : opts_.args[0];
  CAInfo info = adminClient(opts_.timeout_sec).getPKICAInfo(id, cancel_);
  if (!info.provisioned) {
    out_ << "CA '" << id << "' is not provisioned\n";
    return EXIT_OK;
  }
  out_ << "id: " << info.id << "\n"
       << "name: " << info.name << "\n"
       << "root common name: " << info.root_common_name << "\n"
       << "intermediate common name: " << info.intermediate_common_name
       << "\n";
  return EXIT_OK;
}

int CommandRunner::status() {
  CaddyStatus st = adminClient(opts_.timeout_sec).getStatus(cancel_);
  if (!st.running) {
    out_ << "Caddy is not running\n";
    return EXIT_UNAVAILABLE;
  }
  out_ << "Caddy is running";
  if (!st.version.empty()) {
    out_ << " (" << st.version << ")";
  }
  out_ << "\n";
  return EXIT_OK;
}
