#pragma once

#include <string>
#include <vector>

#include "BlockParser.hpp"
#include "DirectiveTable.hpp"
#include "Document.hpp"
#include "Token.hpp"

enum BlockKind { BLOCK_GLOBAL_OPTIONS, BLOCK_SNIPPET, BLOCK_SITE };

// One top-level block found by Classifier::outline().
struct BlockSpan {
  BlockSpan();

  BlockKind kind;
  size_t header;  // first header token; the '{' itself for global options
  size_t open;    // index of the opening '{'
  TokenRange body;
  // Site addresses, or the snippet name without parentheses.
  std::vector<std::string> labels;
  // Comment tokens directly preceding the block at top level.
  std::vector<std::string> comments;

  // One past the closing '}' (end of input when unterminated).
  size_t end() const;
};

typedef std::vector<BlockSpan> BlockSpanList;

// Decides what each top-level position starts: global options, a snippet,
// a site, or nothing we recognise.
//
// The scan is a single forward pass with one bit of state: whether a site
// address or snippet name has been seen since the start of the document or
// the end of the previous top-level block. A lone '{' while that bit is
// clear opens global options:
//
//   {                  <- global options
//     email a@b.com
//   }
//   example.com {      <- site
//   ...
//
// Everything that fits no construct is recorded as a SkippedRange.
class Classifier {
 public:
  explicit Classifier(const DirectiveTable& table);

  // Not a known directive, not `(x)` or `@x`, and looks like an address:
  // contains a dot, starts with ':' or http(s)://, or is localhost[:port].
  bool isSiteAddress(const std::string& token) const;
  static bool isSnippetName(const std::string& token);
  static std::string snippetName(const std::string& token);

  BlockSpanList outline(const TokenList& tokens,
                        SkippedRangeList* skipped) const;

 private:
  const DirectiveTable& table_;
};
