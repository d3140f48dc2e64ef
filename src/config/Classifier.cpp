#include "Classifier.hpp"

#include "utils.hpp"

BlockSpan::BlockSpan()
    : kind(BLOCK_SITE), header(0), open(0), body(), labels(), comments() {}

size_t BlockSpan::end() const {
  return body.next();
}

Classifier::Classifier(const DirectiveTable& table) : table_(table) {}

bool Classifier::isSiteAddress(const std::string& token) const {
  if (token.empty() || token == "{" || token == "}") {
    return false;
  }
  if (token[0] == '#' || token[0] == '(' || token[0] == '@') {
    return false;
  }
  if (table_.contains(token)) {
    return false;
  }
  return token.find('.') != std::string::npos || token[0] == ':' ||
         starts_with(token, "http://") || starts_with(token, "https://") ||
         token == "localhost" || starts_with(token, "localhost:");
}

bool Classifier::isSnippetName(const std::string& token) {
  return token.size() > 2 && token[0] == '(' &&
         token[token.size() - 1] == ')';
}

std::string Classifier::snippetName(const std::string& token) {
  if (!isSnippetName(token)) {
    return "";
  }
  return token.substr(1, token.size() - 2);
}

namespace {

std::string joinTokens(const TokenList& tokens, size_t begin, size_t end) {
  std::string text;
  for (size_t i = begin; i < end && i < tokens.size(); ++i) {
    if (!text.empty()) {
      text += " ";
    }
    text += tokens[i].text;
  }
  return text;
}

// Adjacent ranges with the same reason are merged.
void recordSkipped(SkippedRangeList* skipped, const TokenList& tokens,
                   size_t begin, size_t end, const std::string& reason) {
  if (skipped == NULL || begin >= end) {
    return;
  }
  if (!skipped->empty()) {
    SkippedRange& last = skipped->back();
    if (last.end == begin && last.reason == reason) {
      last.end = end;
      last.text = joinTokens(tokens, last.begin, last.end);
      return;
    }
  }
  skipped->push_back(SkippedRange(begin, end, tokens[begin].line, reason,
                                  joinTokens(tokens, begin, end)));
}

size_t skipComments(const TokenList& tokens, size_t i) {
  while (i < tokens.size() && tokens[i].isComment()) {
    ++i;
  }
  return i;
}

}  // namespace

BlockSpanList Classifier::outline(const TokenList& tokens,
                                  SkippedRangeList* skipped) const {
  BlockSpanList spans;
  std::vector<std::string> pending_comments;
  bool seen_marker = false;

  size_t i = 0;
  while (i < tokens.size()) {
    const Token& token = tokens[i];

    if (token.isComment()) {
      pending_comments.push_back(token.text);
      ++i;
      continue;
    }

    if (token.type == T_RBRACE) {
      recordSkipped(skipped, tokens, i, i + 1, "stray closing brace");
      seen_marker = false;
      ++i;
      continue;
    }

    if (token.type == T_LBRACE) {
      TokenRange body = BlockParser::enclosedRange(tokens, i + 1);
      if (seen_marker) {
        recordSkipped(skipped, tokens, i, body.next(),
                      "block without a site address or snippet name");
      } else {
        BlockSpan span;
        span.kind = BLOCK_GLOBAL_OPTIONS;
        span.header = i;
        span.open = i;
        span.body = body;
        span.comments.swap(pending_comments);
        spans.push_back(span);
      }
      seen_marker = false;
      i = body.next();
      continue;
    }

    if (isSnippetName(token.text)) {
      seen_marker = true;
      size_t open = skipComments(tokens, i + 1);
      if (open >= tokens.size() || tokens[open].type != T_LBRACE) {
        recordSkipped(skipped, tokens, i, i + 1, "snippet name without a block");
        ++i;
        continue;
      }
      BlockSpan span;
      span.kind = BLOCK_SNIPPET;
      span.header = i;
      span.open = open;
      span.body = BlockParser::enclosedRange(tokens, open + 1);
      span.labels.push_back(snippetName(token.text));
      span.comments.swap(pending_comments);
      spans.push_back(span);
      seen_marker = false;
      i = span.end();
      continue;
    }

    if (isSiteAddress(token.text)) {
      seen_marker = true;
      std::vector<std::string> addresses;
      size_t j = i;
      while (j < tokens.size()) {
        if (tokens[j].isComment()) {
          ++j;
          continue;
        }
        if (!isSiteAddress(tokens[j].text)) {
          break;
        }
        addresses.push_back(tokens[j].text);
        ++j;
      }
      if (j >= tokens.size() || tokens[j].type != T_LBRACE) {
        recordSkipped(skipped, tokens, i, j, "site address without a block");
        i = j;
        continue;
      }
      BlockSpan span;
      span.kind = BLOCK_SITE;
      span.header = i;
      span.open = j;
      span.body = BlockParser::enclosedRange(tokens, j + 1);
      span.labels = addresses;
      span.comments.swap(pending_comments);
      spans.push_back(span);
      seen_marker = false;
      i = span.end();
      continue;
    }

    // A malformed snippet header still keeps the next block from being
    // read as global options.
    if (token.text[0] == '(') {
      seen_marker = true;
    }
    recordSkipped(skipped, tokens, i, i + 1, "unexpected token at top level");
    ++i;
  }

  for (size_t k = 0; k < spans.size(); ++k) {
    if (!spans[k].body.terminated) {
      recordSkipped(skipped, tokens, spans[k].open, spans[k].end(),
                    "unterminated block");
    }
  }
  return spans;
}
