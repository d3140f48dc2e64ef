#pragma once

#include <string>

#include "Token.hpp"

// The Tokenizer splits Caddyfile text into tokens:
//   example.com {\n\treverse_proxy "a b"\n}  ->
//   [example.com] [{] [reverse_proxy] ["a b"] [}]
// Braces outside quotes are always tokens of their own; comments are kept
// as T_COMMENT tokens so callers can decide to skip or attach them.
// Tokenizing never fails: an unterminated quote runs to end of input.
class Tokenizer {
 public:
  explicit Tokenizer(const std::string& content);

  TokenList tokenize() const;

 private:
  std::string content_;
};

// Convenience wrapper.
TokenList tokenize(const std::string& content);
