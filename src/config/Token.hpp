#pragma once

#include <string>
#include <vector>

enum TokenType {
  T_WORD,     // bare word: directive name, argument, address
  T_LBRACE,   // '{'
  T_RBRACE,   // '}'
  T_QUOTED,   // "..." or '...', quotes kept in the text
  T_COMMENT   // '#' up to end of line
};

// One lexical unit. `text` is never empty; `line` is 1-based and refers to
// the first character of the token.
struct Token {
  Token();
  Token(TokenType type, const std::string& text, int line);

  TokenType type;
  std::string text;
  int line;

  bool isBrace() const;
  bool isComment() const;
};

typedef std::vector<Token> TokenList;

// For debug output.
std::string tokenTypeToString(TokenType type);
