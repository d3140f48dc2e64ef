#include "Document.hpp"

#include <map>
#include <sstream>

#include "Errors.hpp"
#include "Logger.hpp"
#include "utils.hpp"

OptionalString::OptionalString() : set_(false), value_() {}

OptionalString::OptionalString(const std::string& value)
    : set_(true), value_(value) {}

bool OptionalString::isSet() const {
  return set_;
}

const std::string& OptionalString::value() const {
  return value_;
}

void OptionalString::set(const std::string& value) {
  set_ = true;
  value_ = value;
}

void OptionalString::reset() {
  set_ = false;
  value_.clear();
}

OptionalString& OptionalString::operator=(const std::string& value) {
  set(value);
  return *this;
}

bool OptionalString::operator==(const OptionalString& other) const {
  return set_ == other.set_ && value_ == other.value_;
}

bool OptionalString::operator!=(const OptionalString& other) const {
  return !(*this == other);
}

bool LogConfig::empty() const {
  return !output.isSet() && !format.isSet() && !level.isSet() &&
         !roll_size.isSet() && !roll_keep.isSet();
}

bool operator==(const LogConfig& lhs, const LogConfig& rhs) {
  return lhs.output == rhs.output && lhs.format == rhs.format &&
         lhs.level == rhs.level && lhs.roll_size == rhs.roll_size &&
         lhs.roll_keep == rhs.roll_keep;
}

OrderHint::OrderHint() : directive(), anchor() {}

OrderHint::OrderHint(const std::string& d, const std::string& a)
    : directive(d), anchor(a) {}

bool operator==(const OrderHint& lhs, const OrderHint& rhs) {
  return lhs.directive == rhs.directive && lhs.anchor == rhs.anchor;
}

// ----------------------------- GlobalOptions -----------------------------

GlobalOptions::GlobalOptions()
    : email(),
      acme_ca(),
      admin(),
      debug(false),
      order_before(),
      order_after(),
      has_log(false),
      log(),
      servers(),
      other(),
      comments() {}

GlobalOptions::GlobalOptions(const GlobalOptions& other_opts)
    : email(other_opts.email),
      acme_ca(other_opts.acme_ca),
      admin(other_opts.admin),
      debug(other_opts.debug),
      order_before(other_opts.order_before),
      order_after(other_opts.order_after),
      has_log(other_opts.has_log),
      log(other_opts.log),
      servers(other_opts.servers),
      other(other_opts.other),
      comments(other_opts.comments) {}

GlobalOptions& GlobalOptions::operator=(const GlobalOptions& other_opts) {
  if (this != &other_opts) {
    email = other_opts.email;
    acme_ca = other_opts.acme_ca;
    admin = other_opts.admin;
    debug = other_opts.debug;
    order_before = other_opts.order_before;
    order_after = other_opts.order_after;
    has_log = other_opts.has_log;
    log = other_opts.log;
    servers = other_opts.servers;
    other = other_opts.other;
    comments = other_opts.comments;
  }
  return *this;
}

GlobalOptions::~GlobalOptions() {}

bool GlobalOptions::empty() const {
  return email.empty() && acme_ca.empty() && admin.empty() && !debug &&
         order_before.empty() && order_after.empty() &&
         (!has_log || log.empty()) && servers.empty() && other.empty();
}

// -------------------------------- Snippet --------------------------------

Snippet::Snippet() : name(), directives(), comments() {}

Snippet::Snippet(const std::string& n) : name(n), directives(), comments() {}

Snippet::Snippet(const Snippet& other)
    : name(other.name),
      directives(other.directives),
      comments(other.comments) {}

Snippet& Snippet::operator=(const Snippet& other) {
  if (this != &other) {
    name = other.name;
    directives = other.directives;
    comments = other.comments;
  }
  return *this;
}

Snippet::~Snippet() {}

// --------------------------------- Site ----------------------------------

Site::Site() : addresses(), directives(), imports(), raw_block(), comments() {}

Site::Site(const Site& other)
    : addresses(other.addresses),
      directives(other.directives),
      imports(other.imports),
      raw_block(other.raw_block),
      comments(other.comments) {}

Site& Site::operator=(const Site& other) {
  if (this != &other) {
    addresses = other.addresses;
    directives = other.directives;
    imports = other.imports;
    raw_block = other.raw_block;
    comments = other.comments;
  }
  return *this;
}

Site::~Site() {}

// ------------------------------- Caddyfile -------------------------------

Caddyfile::Caddyfile()
    : has_global_options(false), global_options(), snippets(), sites() {}

Caddyfile::Caddyfile(const Caddyfile& other)
    : has_global_options(other.has_global_options),
      global_options(other.global_options),
      snippets(other.snippets),
      sites(other.sites) {}

Caddyfile& Caddyfile::operator=(const Caddyfile& other) {
  if (this != &other) {
    has_global_options = other.has_global_options;
    global_options = other.global_options;
    snippets = other.snippets;
    sites = other.sites;
  }
  return *this;
}

Caddyfile::~Caddyfile() {}

bool Caddyfile::empty() const {
  return !has_global_options && snippets.empty() && sites.empty();
}

SkippedRange::SkippedRange() : begin(0), end(0), line(0), reason(), text() {}

SkippedRange::SkippedRange(size_t b, size_t e, int l, const std::string& r,
                           const std::string& t)
    : begin(b), end(e), line(l), reason(r), text(t) {}

bool Duplicates::empty() const {
  return snippets.empty() && addresses.empty();
}

// -------------------------------- Helpers --------------------------------

std::string normalizeAddress(const std::string& address) {
  const char* prefixes[] = {"http://", "https://", "http:/", "https:/"};
  std::string result = address;
  for (size_t i = 0; i < sizeof(prefixes) / sizeof(prefixes[0]); ++i) {
    if (starts_with(result, prefixes[i])) {
      result = result.substr(std::string(prefixes[i]).size());
    }
  }
  return result;
}

const Site* findSite(const Caddyfile& doc, const std::string& address) {
  const std::string wanted = normalizeAddress(address);
  for (std::vector<Site>::const_iterator it = doc.sites.begin();
       it != doc.sites.end(); ++it) {
    for (size_t i = 0; i < it->addresses.size(); ++i) {
      if (normalizeAddress(it->addresses[i]) == wanted) {
        return &(*it);
      }
    }
  }
  return NULL;
}

Site* findSite(Caddyfile& doc, const std::string& address) {
  return const_cast<Site*>(
      findSite(static_cast<const Caddyfile&>(doc), address));
}

const Snippet* findSnippet(const Caddyfile& doc, const std::string& name) {
  for (std::vector<Snippet>::const_iterator it = doc.snippets.begin();
       it != doc.snippets.end(); ++it) {
    if (it->name == name) {
      return &(*it);
    }
  }
  return NULL;
}

Snippet* findSnippet(Caddyfile& doc, const std::string& name) {
  return const_cast<Snippet*>(
      findSnippet(static_cast<const Caddyfile&>(doc), name));
}

namespace {

// Records each key the second time it is seen, so every duplicate is
// listed once in first-duplicate order.
void countOccurrence(std::map<std::string, int>& seen, const std::string& key,
                     std::vector<std::string>& duplicates) {
  int& count = seen[key];
  ++count;
  if (count == 2) {
    duplicates.push_back(key);
  }
}

}  // namespace

Duplicates findDuplicates(const Caddyfile& doc) {
  Duplicates result;

  std::map<std::string, int> snippet_names;
  for (size_t i = 0; i < doc.snippets.size(); ++i) {
    countOccurrence(snippet_names, doc.snippets[i].name, result.snippets);
  }

  std::map<std::string, int> addresses;
  for (size_t i = 0; i < doc.sites.size(); ++i) {
    const std::vector<std::string>& site_addresses = doc.sites[i].addresses;
    for (size_t j = 0; j < site_addresses.size(); ++j) {
      countOccurrence(addresses, normalizeAddress(site_addresses[j]),
                      result.addresses);
    }
  }
  return result;
}

void requireUnique(const Caddyfile& doc) {
  Duplicates duplicates = findDuplicates(doc);
  if (duplicates.empty()) {
    return;
  }

  std::ostringstream oss;
  if (!duplicates.snippets.empty()) {
    oss << "duplicate snippet name(s): " << join(duplicates.snippets, ", ");
  }
  if (!duplicates.addresses.empty()) {
    if (!duplicates.snippets.empty()) {
      oss << "; ";
    }
    oss << "duplicate site address(es): " << join(duplicates.addresses, ", ");
  }
  LOG(ERROR) << oss.str();
  throw ConfigError(oss.str());
}
