#pragma once

#include <string>
#include <vector>

#include "Classifier.hpp"
#include "DirectiveTable.hpp"
#include "Document.hpp"
#include "Token.hpp"

// Builds the Caddyfile model from text. Each parse* call is an independent
// scan of the whole document that keeps the blocks of its own kind and jumps
// over the others:
//
//   Parser parser(content);
//   std::vector<Site> sites = parser.parseSites();
//
// Parsing never fails. Input that fits no construct is skipped and reported
// through skippedRanges() (or the out-parameter of parseAll()).
class Parser {
 public:
  explicit Parser(const std::string& content);
  Parser(const std::string& content, const DirectiveTable& site_table,
         const DirectiveTable& global_table);

  // Fills `out` from the first global options block. Returns false and
  // leaves `out` untouched when the document has none.
  bool parseGlobalOptions(GlobalOptions& out) const;
  std::vector<Snippet> parseSnippets() const;
  std::vector<Site> parseSites() const;

  // All three scans. Skipped input is logged at DEBUG and stored in
  // `skipped` when it is not NULL.
  Caddyfile parseAll(SkippedRangeList* skipped = NULL) const;

  SkippedRangeList skippedRanges() const;

  const TokenList& tokens() const;

 private:
  BlockSpanList outline(SkippedRangeList* skipped) const;
  void interpretGlobalOptions(const DirectiveList& directives,
                              GlobalOptions& out) const;
  bool interpretLog(const DirectiveNode& directive, LogConfig& out) const;

  TokenList tokens_;
  DirectiveTable site_table_;
  DirectiveTable global_table_;
};

// Parser(content).parseAll()
Caddyfile parseCaddyfile(const std::string& content);
