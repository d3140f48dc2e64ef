#pragma once

#include <string>
#include <vector>

#include "DirectiveNode.hpp"

// A string value that may be absent. Absent is distinct from "".
class OptionalString {
 public:
  OptionalString();
  explicit OptionalString(const std::string& value);

  bool isSet() const;
  const std::string& value() const;
  void set(const std::string& value);
  void reset();

  OptionalString& operator=(const std::string& value);
  bool operator==(const OptionalString& other) const;
  bool operator!=(const OptionalString& other) const;

 private:
  bool set_;
  std::string value_;
};

struct LogConfig {
  OptionalString output;
  OptionalString format;
  OptionalString level;
  OptionalString roll_size;
  OptionalString roll_keep;

  bool empty() const;
};

bool operator==(const LogConfig& lhs, const LogConfig& rhs);

// `order <directive> before|after <anchor>`
struct OrderHint {
  OrderHint();
  OrderHint(const std::string& directive, const std::string& anchor);

  std::string directive;
  std::string anchor;
};

bool operator==(const OrderHint& lhs, const OrderHint& rhs);

class GlobalOptions {
 public:
  GlobalOptions();
  GlobalOptions(const GlobalOptions& other);
  GlobalOptions& operator=(const GlobalOptions& other);
  ~GlobalOptions();

  // True when nothing would be written inside the braces.
  bool empty() const;

  std::string email;
  std::string acme_ca;
  std::string admin;
  bool debug;
  std::vector<OrderHint> order_before;
  std::vector<OrderHint> order_after;
  bool has_log;
  LogConfig log;
  DirectiveList servers;
  // Global directives without a dedicated field, kept for the round trip.
  DirectiveList other;
  std::vector<std::string> comments;
};

class Snippet {
 public:
  Snippet();
  explicit Snippet(const std::string& name);
  Snippet(const Snippet& other);
  Snippet& operator=(const Snippet& other);
  ~Snippet();

  std::string name;
  DirectiveList directives;
  std::vector<std::string> comments;
};

class Site {
 public:
  Site();
  Site(const Site& other);
  Site& operator=(const Site& other);
  ~Site();

  std::vector<std::string> addresses;
  DirectiveList directives;
  // Snippet names pulled in with `import` directly inside the site block.
  std::vector<std::string> imports;
  // Block interior tokens joined by single spaces.
  std::string raw_block;
  std::vector<std::string> comments;
};

// The whole document: optional global options, then snippets, then sites.
class Caddyfile {
 public:
  Caddyfile();
  Caddyfile(const Caddyfile& other);
  Caddyfile& operator=(const Caddyfile& other);
  ~Caddyfile();

  bool empty() const;

  bool has_global_options;
  GlobalOptions global_options;
  std::vector<Snippet> snippets;
  std::vector<Site> sites;
};

// Input the parser could not place in any construct, or a block it could
// not complete. Token indices are half-open: [begin, end).
struct SkippedRange {
  SkippedRange();
  SkippedRange(size_t begin, size_t end, int line, const std::string& reason,
               const std::string& text);

  size_t begin;
  size_t end;
  int line;
  std::string reason;
  std::string text;
};

typedef std::vector<SkippedRange> SkippedRangeList;

// Duplicate snippet names and (normalized) site addresses, each listed once.
struct Duplicates {
  std::vector<std::string> snippets;
  std::vector<std::string> addresses;

  bool empty() const;
};

// Strip a leading http:// or https:// (also the mangled http:/ and https:/
// forms left behind by URL path parsing).
std::string normalizeAddress(const std::string& address);

// First site that has an address equal to `address` after normalization of
// both sides. NULL if none.
const Site* findSite(const Caddyfile& doc, const std::string& address);
Site* findSite(Caddyfile& doc, const std::string& address);

const Snippet* findSnippet(const Caddyfile& doc, const std::string& name);
Snippet* findSnippet(Caddyfile& doc, const std::string& name);

Duplicates findDuplicates(const Caddyfile& doc);

// Throws ConfigError naming every duplicate.
void requireUnique(const Caddyfile& doc);
