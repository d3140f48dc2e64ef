#pragma once

#include <set>
#include <string>

// The set of directive names the parser treats as "known". It drives two
// heuristics of the grammar:
//   - a known name is never a site address, even if it contains a dot;
//   - inside a block, a known name (or an @matcher) after at least one
//     argument starts a new directive.
// A custom directive that is not in the table and contains a dot will be
// classified as a site address at top level. Add it to the table to avoid
// that.
class DirectiveTable {
 public:
  DirectiveTable();
  DirectiveTable(const DirectiveTable& other);
  DirectiveTable& operator=(const DirectiveTable& other);
  ~DirectiveTable();

  // Caddy's HTTP handler directives.
  static const DirectiveTable& siteDefaults();
  // Global option names and the sub-options of the `log` and `servers`
  // global blocks. Site directive names are left out: they show up as
  // arguments there (`order rate_limit before basicauth`).
  static const DirectiveTable& globalDefaults();

  void add(const std::string& name);
  void remove(const std::string& name);
  bool contains(const std::string& name) const;
  size_t size() const;

  // contains(token) or token is an @matcher.
  bool isDirectiveName(const std::string& token) const;

 private:
  std::set<std::string> names_;
};
