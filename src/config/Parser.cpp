#include "Parser.hpp"

#include <algorithm>

#include "BlockParser.hpp"
#include "Logger.hpp"
#include "Tokenizer.hpp"
#include "utils.hpp"

namespace {

std::string joinRange(const TokenList& tokens, const TokenRange& range) {
  std::string text;
  for (size_t i = range.begin; i < range.end && i < tokens.size(); ++i) {
    if (i != range.begin) {
      text += " ";
    }
    text += tokens[i].text;
  }
  return text;
}

bool skippedBefore(const SkippedRange& lhs, const SkippedRange& rhs) {
  return lhs.begin < rhs.begin;
}

bool isPlain(const DirectiveNode& d, size_t arg_count) {
  return d.args.size() == arg_count && !d.hasBlock();
}

}  // namespace

Parser::Parser(const std::string& content)
    : tokens_(tokenize(content)),
      site_table_(DirectiveTable::siteDefaults()),
      global_table_(DirectiveTable::globalDefaults()) {}

Parser::Parser(const std::string& content, const DirectiveTable& site_table,
               const DirectiveTable& global_table)
    : tokens_(tokenize(content)),
      site_table_(site_table),
      global_table_(global_table) {}

const TokenList& Parser::tokens() const {
  return tokens_;
}

BlockSpanList Parser::outline(SkippedRangeList* skipped) const {
  Classifier classifier(site_table_);
  return classifier.outline(tokens_, skipped);
}

bool Parser::parseGlobalOptions(GlobalOptions& out) const {
  BlockSpanList spans = outline(NULL);
  for (BlockSpanList::const_iterator it = spans.begin(); it != spans.end();
       ++it) {
    if (it->kind != BLOCK_GLOBAL_OPTIONS) {
      continue;
    }
    BlockParser block_parser(global_table_);
    DirectiveList directives = block_parser.parseDirectives(
        tokens_, it->body.begin, it->body.end, NULL);

    GlobalOptions options;
    options.comments = it->comments;
    interpretGlobalOptions(directives, options);
    out = options;
    return true;
  }
  return false;
}

std::vector<Snippet> Parser::parseSnippets() const {
  std::vector<Snippet> snippets;
  BlockSpanList spans = outline(NULL);
  BlockParser block_parser(site_table_);

  for (BlockSpanList::const_iterator it = spans.begin(); it != spans.end();
       ++it) {
    if (it->kind != BLOCK_SNIPPET) {
      continue;
    }
    Snippet snippet(it->labels[0]);
    snippet.directives = block_parser.parseDirectives(
        tokens_, it->body.begin, it->body.end, NULL);
    snippet.comments = it->comments;
    snippets.push_back(snippet);
  }
  return snippets;
}

std::vector<Site> Parser::parseSites() const {
  std::vector<Site> sites;
  BlockSpanList spans = outline(NULL);
  BlockParser block_parser(site_table_);

  for (BlockSpanList::const_iterator it = spans.begin(); it != spans.end();
       ++it) {
    if (it->kind != BLOCK_SITE) {
      continue;
    }
    Site site;
    site.addresses = it->labels;
    site.raw_block = joinRange(tokens_, it->body);
    site.directives = block_parser.parseDirectives(
        tokens_, it->body.begin, it->body.end, &site.imports);
    site.comments = it->comments;
    sites.push_back(site);
  }
  return sites;
}

SkippedRangeList Parser::skippedRanges() const {
  SkippedRangeList skipped;
  BlockSpanList spans = outline(&skipped);

  bool first_global = true;
  for (BlockSpanList::const_iterator it = spans.begin(); it != spans.end();
       ++it) {
    if (it->kind != BLOCK_GLOBAL_OPTIONS) {
      continue;
    }
    if (first_global) {
      first_global = false;
      continue;
    }
    skipped.push_back(SkippedRange(
        it->header, it->end(), tokens_[it->header].line,
        "additional global options block",
        joinRange(tokens_, TokenRange(it->header, it->end(), false))));
  }
  std::stable_sort(skipped.begin(), skipped.end(), skippedBefore);
  return skipped;
}

Caddyfile Parser::parseAll(SkippedRangeList* skipped) const {
  Caddyfile doc;
  doc.has_global_options = parseGlobalOptions(doc.global_options);
  doc.snippets = parseSnippets();
  doc.sites = parseSites();

  SkippedRangeList ranges = skippedRanges();
  for (SkippedRangeList::const_iterator it = ranges.begin();
       it != ranges.end(); ++it) {
    LOG(DEBUG) << "Skipped input at line " << it->line << " (" << it->reason
               << "): " << it->text;
  }
  LOG(DEBUG) << "Parsed Caddyfile: "
             << (doc.has_global_options ? "global options, " : "")
             << doc.snippets.size() << " snippet(s), " << doc.sites.size()
             << " site(s)";

  if (skipped != NULL) {
    *skipped = ranges;
  }
  return doc;
}

void Parser::interpretGlobalOptions(const DirectiveList& directives,
                                    GlobalOptions& out) const {
  for (DirectiveList::const_iterator it = directives.begin();
       it != directives.end(); ++it) {
    const DirectiveNode& d = *it;

    if (d.name == "email" && isPlain(d, 1) && out.email.empty()) {
      out.email = d.args[0];
    } else if (d.name == "acme_ca" && isPlain(d, 1) && out.acme_ca.empty()) {
      out.acme_ca = d.args[0];
    } else if (d.name == "admin" && !d.args.empty() && !d.hasBlock() &&
               out.admin.empty()) {
      out.admin = join(d.args, " ");
    } else if (d.name == "debug" && isPlain(d, 0)) {
      out.debug = true;
    } else if (d.name == "order" && isPlain(d, 3) && d.args[1] == "before") {
      out.order_before.push_back(OrderHint(d.args[0], d.args[2]));
    } else if (d.name == "order" && isPlain(d, 3) && d.args[1] == "after") {
      out.order_after.push_back(OrderHint(d.args[0], d.args[2]));
    } else if (d.name == "log" && !out.has_log &&
               interpretLog(d, out.log)) {
      out.has_log = true;
    } else if (d.name == "servers" && d.args.empty() && !d.block.empty() &&
               out.servers.empty()) {
      out.servers = d.block;
    } else {
      out.other.push_back(d);
    }
  }
}

// Maps a `log { ... }` global block onto LogConfig. Returns false, leaving
// `out` untouched, when the block holds anything LogConfig cannot express;
// the caller then keeps the directive verbatim.
bool Parser::interpretLog(const DirectiveNode& directive,
                          LogConfig& out) const {
  if (!directive.args.empty() || !directive.hasBlock()) {
    return false;
  }

  LogConfig log;
  for (DirectiveList::const_iterator it = directive.block.begin();
       it != directive.block.end(); ++it) {
    const DirectiveNode& child = *it;
    if (child.args.empty()) {
      return false;
    }
    if (child.name == "output" && !log.output.isSet()) {
      log.output = join(child.args, " ");
      for (DirectiveList::const_iterator sub = child.block.begin();
           sub != child.block.end(); ++sub) {
        if (sub->args.empty() || sub->hasBlock()) {
          return false;
        }
        if (sub->name == "roll_size" && !log.roll_size.isSet()) {
          log.roll_size = join(sub->args, " ");
        } else if (sub->name == "roll_keep" && !log.roll_keep.isSet()) {
          log.roll_keep = join(sub->args, " ");
        } else {
          return false;
        }
      }
      continue;
    }
    if (child.hasBlock()) {
      return false;
    }
    if (child.name == "format" && !log.format.isSet()) {
      log.format = join(child.args, " ");
    } else if (child.name == "level" && !log.level.isSet()) {
      log.level = join(child.args, " ");
    } else if (child.name == "roll_size" && !log.roll_size.isSet()) {
      log.roll_size = join(child.args, " ");
    } else if (child.name == "roll_keep" && !log.roll_keep.isSet()) {
      log.roll_keep = join(child.args, " ");
    } else {
      return false;
    }
  }
  out = log;
  return true;
}

Caddyfile parseCaddyfile(const std::string& content) {
  return Parser(content).parseAll();
}
