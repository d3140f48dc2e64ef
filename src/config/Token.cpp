#include "Token.hpp"

Token::Token() : type(T_WORD), text(), line(0) {}

Token::Token(TokenType t, const std::string& s, int l)
    : type(t), text(s), line(l) {}

bool Token::isBrace() const {
  return type == T_LBRACE || type == T_RBRACE;
}

bool Token::isComment() const {
  return type == T_COMMENT;
}

std::string tokenTypeToString(TokenType type) {
  switch (type) {
    case T_WORD:
      return "WORD";
    case T_LBRACE:
      return "LBRACE";
    case T_RBRACE:
      return "RBRACE";
    case T_QUOTED:
      return "QUOTED";
    case T_COMMENT:
      return "COMMENT";
    default:
      return "UNKNOWN";
  }
}
