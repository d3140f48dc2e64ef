#pragma once

#include <string>
#include <vector>

#include "Document.hpp"

// Generates canonical Caddyfile text from the model. Output order is global
// options, snippets, sites, with one blank line between blocks. Comments
// are not written back.
class Writer {
 public:
  Writer();
  explicit Writer(const std::string& indent);

  std::string writeCaddyfile(const Caddyfile& doc) const;
  std::string writeGlobalOptions(const GlobalOptions& options) const;
  std::string writeSnippet(const Snippet& snippet) const;
  std::string writeSnippets(const std::vector<Snippet>& snippets) const;
  std::string writeSite(const Site& site) const;
  std::string writeSites(const std::vector<Site>& sites) const;
  std::string writeDirective(const DirectiveNode& directive, int depth) const;

  // Wraps `s` in double quotes, escaping embedded ones, when it contains a
  // space, tab, brace or double quote. Already quoted strings are returned
  // unchanged.
  static std::string quoteIfNeeded(const std::string& s);

 private:
  std::string indent(int depth) const;
  void writeDirective(std::string& out, const DirectiveNode& directive,
                      int depth) const;
  void writeLogConfig(std::string& out, const LogConfig& log) const;

  std::string indent_;
};
