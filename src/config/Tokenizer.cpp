#include "Tokenizer.hpp"

#include <cctype>

Tokenizer::Tokenizer(const std::string& content) : content_(content) {}

namespace {

void flushWord(TokenList& tokens, std::string& current, int line) {
  if (!current.empty()) {
    tokens.push_back(Token(T_WORD, current, line));
    current.clear();
  }
}

}  // namespace

TokenList Tokenizer::tokenize() const {
  TokenList tokens;
  std::string current;
  int line = 1;
  int current_line = 1;

  size_t i = 0;
  while (i < content_.size()) {
    char c = content_[i];

    if ((c == '"' || c == '\'') && current.empty()) {
      // Quoted span: verbatim up to the matching quote, `\"` does not close.
      int start_line = line;
      std::string quoted(1, c);
      ++i;
      while (i < content_.size()) {
        char q = content_[i];
        quoted.push_back(q);
        if (q == '\n') {
          ++line;
        }
        ++i;
        if (q == '\\' && i < content_.size() && content_[i] == c) {
          quoted.push_back(content_[i]);
          ++i;
          continue;
        }
        if (q == c) {
          break;
        }
      }
      tokens.push_back(Token(T_QUOTED, quoted, start_line));
      continue;
    }

    if (c == '#') {
      flushWord(tokens, current, current_line);
      size_t end = content_.find('\n', i);
      if (end == std::string::npos) {
        end = content_.size();
      }
      std::string comment = content_.substr(i, end - i);
      if (!comment.empty() && comment[comment.size() - 1] == '\r') {
        comment.erase(comment.size() - 1);
      }
      tokens.push_back(Token(T_COMMENT, comment, line));
      i = end;
      continue;
    }

    if (c == '{' || c == '}') {
      flushWord(tokens, current, current_line);
      tokens.push_back(Token(c == '{' ? T_LBRACE : T_RBRACE, std::string(1, c),
                             line));
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      flushWord(tokens, current, current_line);
      if (c == '\n') {
        ++line;
      }
    } else {
      if (current.empty()) {
        current_line = line;
      }
      current.push_back(c);
    }
    ++i;
  }
  flushWord(tokens, current, current_line);

  return tokens;
}

TokenList tokenize(const std::string& content) {
  return Tokenizer(content).tokenize();
}
