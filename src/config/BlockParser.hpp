#pragma once

#include <string>
#include <vector>

#include "DirectiveNode.hpp"
#include "DirectiveTable.hpp"
#include "Token.hpp"

// Interior of a brace-delimited block: tokens [begin, end). When the block
// is terminated, tokens[end] is its closing '}'.
struct TokenRange {
  TokenRange();
  TokenRange(size_t begin, size_t end, bool terminated);

  size_t begin;
  size_t end;
  bool terminated;

  // Index of the first token after the block.
  size_t next() const;
};

// Turns the tokens of a block into a directive tree:
//
//   handle /api/* {          DirectiveNode(handle, [/api/*])
//     reverse_proxy a:80  ->   '- DirectiveNode(reverse_proxy, [a:80])
//   }
//
// Caddyfile statements end at a newline, which the token stream only
// carries as line numbers. A directive therefore runs until a brace, a
// comment, or a known directive name (see DirectiveTable) that either
// follows an argument or starts a later line than the directive.
// `foo bar` where `bar` happens to be a known directive name parses as two
// directives; that ambiguity is part of the grammar as we recover it.
class BlockParser {
 public:
  explicit BlockParser(const DirectiveTable& table);

  // `begin` is the index just after a '{'. The range stops at `limit`
  // (default: end of input) when the block is not closed before it.
  static TokenRange enclosedRange(const TokenList& tokens, size_t begin,
                                  size_t limit);
  static TokenRange enclosedRange(const TokenList& tokens, size_t begin);

  // Parses tokens [begin, end). Arguments of `import` directives found
  // directly in this range are appended to `imports` when it is not NULL.
  DirectiveList parseDirectives(const TokenList& tokens, size_t begin,
                                size_t end,
                                std::vector<std::string>* imports) const;

 private:
  const DirectiveTable& table_;
};
