#include "DirectiveTable.hpp"

namespace {

const char* kSiteDirectives[] = {
    "abort",        "basicauth",     "basic_auth",
    "bind",         "copy_response", "copy_response_headers",
    "encode",       "error",         "file_server",
    "forward_auth", "handle",        "handle_errors",
    "handle_path",  "header",        "import",
    "invoke",       "log",           "map",
    "matcher",      "method",        "metrics",
    "php_fastcgi",  "push",          "redir",
    "request_body", "request_header", "respond",
    "reverse_proxy", "rewrite",      "root",
    "route",        "skip_log",      "templates",
    "tls",          "tracing",       "try_files",
    "uri",          "vars",
    // log sub-options
    "output", "format", "level", "roll_size", "roll_keep", "roll_keep_for",
    "roll_local_time", "roll_disabled"};

const char* kGlobalOptions[] = {
    // global options
    "acme_ca", "acme_ca_root", "acme_dns", "acme_eab", "admin", "auto_https",
    "cert_issuer", "debug", "default_bind", "default_sni", "email",
    "grace_period", "http_port", "https_port", "local_certs", "log",
    "ocsp_stapling",
    "on_demand_tls", "order", "persist_config", "pki", "preferred_chains",
    "servers", "shutdown_delay", "skip_install_trust", "storage",
    "storage_clean_interval",
    // log sub-options
    "output", "format", "level", "include", "exclude", "roll_size",
    "roll_keep", "roll_keep_for", "roll_local_time", "roll_disabled",
    // servers sub-options
    "listener_wrappers", "timeouts", "trusted_proxies", "client_ip_headers",
    "max_header_size", "keepalive_interval", "protocols", "strict_sni_host",
    "read_body", "read_header", "write", "idle"};

DirectiveTable buildSiteDefaults() {
  DirectiveTable table;
  for (size_t i = 0; i < sizeof(kSiteDirectives) / sizeof(kSiteDirectives[0]);
       ++i) {
    table.add(kSiteDirectives[i]);
  }
  return table;
}

DirectiveTable buildGlobalDefaults() {
  DirectiveTable table;
  for (size_t i = 0; i < sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]);
       ++i) {
    table.add(kGlobalOptions[i]);
  }
  return table;
}

}  // namespace

DirectiveTable::DirectiveTable() : names_() {}

DirectiveTable::DirectiveTable(const DirectiveTable& other)
    : names_(other.names_) {}

DirectiveTable& DirectiveTable::operator=(const DirectiveTable& other) {
  if (this != &other) {
    names_ = other.names_;
  }
  return *this;
}

DirectiveTable::~DirectiveTable() {}

const DirectiveTable& DirectiveTable::siteDefaults() {
  static const DirectiveTable instance = buildSiteDefaults();
  return instance;
}

const DirectiveTable& DirectiveTable::globalDefaults() {
  static const DirectiveTable instance = buildGlobalDefaults();
  return instance;
}

void DirectiveTable::add(const std::string& name) {
  if (!name.empty()) {
    names_.insert(name);
  }
}

void DirectiveTable::remove(const std::string& name) {
  names_.erase(name);
}

bool DirectiveTable::contains(const std::string& name) const {
  return names_.find(name) != names_.end();
}

size_t DirectiveTable::size() const {
  return names_.size();
}

bool DirectiveTable::isDirectiveName(const std::string& token) const {
  return contains(token) || (!token.empty() && token[0] == '@');
}
