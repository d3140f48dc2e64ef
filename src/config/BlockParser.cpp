#include "BlockParser.hpp"

TokenRange::TokenRange() : begin(0), end(0), terminated(false) {}

TokenRange::TokenRange(size_t b, size_t e, bool t)
    : begin(b), end(e), terminated(t) {}

size_t TokenRange::next() const {
  return terminated ? end + 1 : end;
}

BlockParser::BlockParser(const DirectiveTable& table) : table_(table) {}

TokenRange BlockParser::enclosedRange(const TokenList& tokens, size_t begin,
                                      size_t limit) {
  if (limit > tokens.size()) {
    limit = tokens.size();
  }
  int depth = 1;
  for (size_t i = begin; i < limit; ++i) {
    if (tokens[i].type == T_LBRACE) {
      ++depth;
    } else if (tokens[i].type == T_RBRACE) {
      --depth;
      if (depth == 0) {
        return TokenRange(begin, i, true);
      }
    }
  }
  return TokenRange(begin, limit < begin ? begin : limit, false);
}

TokenRange BlockParser::enclosedRange(const TokenList& tokens, size_t begin) {
  return enclosedRange(tokens, begin, tokens.size());
}

DirectiveList BlockParser::parseDirectives(
    const TokenList& tokens, size_t begin, size_t end,
    std::vector<std::string>* imports) const {
  DirectiveList directives;
  if (end > tokens.size()) {
    end = tokens.size();
  }

  size_t i = begin;
  while (i < end) {
    const Token& token = tokens[i];
    // Stray braces and comments between statements.
    if (token.isBrace() || token.isComment()) {
      ++i;
      continue;
    }

    DirectiveNode directive;
    directive.name = token.text;
    directive.raw_line = token.text;
    const int name_line = token.line;
    ++i;

    // A known name ends the statement once it has an argument, or when it
    // starts a later line.
    while (i < end) {
      const Token& arg = tokens[i];
      if (arg.isBrace() || arg.isComment()) {
        break;
      }
      if (table_.isDirectiveName(arg.text) &&
          (!directive.args.empty() || arg.line > name_line)) {
        break;
      }
      directive.args.push_back(arg.text);
      directive.raw_line += " " + arg.text;
      ++i;
    }

    if (i < end && tokens[i].type == T_LBRACE) {
      TokenRange nested = enclosedRange(tokens, i + 1, end);
      directive.has_block = true;
      directive.block =
          parseDirectives(tokens, nested.begin, nested.end, NULL);
      i = nested.next();
    }

    if (imports != NULL && directive.name == "import" &&
        !directive.args.empty()) {
      imports->push_back(directive.args[0]);
    }
    directives.push_back(directive);
  }
  return directives;
}
