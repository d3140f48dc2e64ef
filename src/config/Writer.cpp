#include "Writer.hpp"

#include "Tokenizer.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace {

bool isClosedQuote(const std::string& text) {
  if (text.size() < 2 || text[text.size() - 1] != text[0]) {
    return false;
  }
  return text.size() == 2 || text[text.size() - 2] != '\\';
}

std::string wrapQuoted(const std::string& s) {
  std::string quoted = "\"";
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '"') {
      quoted += "\\\"";
    } else {
      quoted += s[i];
    }
  }
  quoted += "\"";
  return quoted;
}

// Option values may span several tokens, as in `output file /var/log/a.log`.
// They are written as is when they read back as plain words and closed
// quotes, and wrapped as one string otherwise.
std::string writeValue(const std::string& value) {
  TokenList tokens = tokenize(value);
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].type == T_WORD) {
      continue;
    }
    if (tokens[i].type == T_QUOTED && isClosedQuote(tokens[i].text)) {
      continue;
    }
    return wrapQuoted(value);
  }
  return value;
}

std::string orderLine(const OrderHint& hint, const std::string& position) {
  return "order " + Writer::quoteIfNeeded(hint.directive) + " " + position +
         " " + Writer::quoteIfNeeded(hint.anchor) + "\n";
}

}  // namespace

Writer::Writer() : indent_(DEFAULT_INDENT) {}

Writer::Writer(const std::string& indent) : indent_(indent) {}

std::string Writer::indent(int depth) const {
  std::string result;
  for (int i = 0; i < depth; ++i) {
    result += indent_;
  }
  return result;
}

std::string Writer::quoteIfNeeded(const std::string& s) {
  if (s.size() >= 2) {
    char first = s[0];
    char last = s[s.size() - 1];
    if ((first == '"' || first == '\'') && first == last) {
      return s;
    }
  }

  if (s.find_first_of(" \t{}\"") == std::string::npos) {
    return s;
  }
  return wrapQuoted(s);
}

void Writer::writeDirective(std::string& out, const DirectiveNode& directive,
                            int depth) const {
  std::string pad = indent(depth);
  out += pad;
  out += quoteIfNeeded(directive.name);
  for (size_t i = 0; i < directive.args.size(); ++i) {
    out += " ";
    out += quoteIfNeeded(directive.args[i]);
  }
  if (directive.hasBlock()) {
    out += " {\n";
    for (size_t i = 0; i < directive.block.size(); ++i) {
      writeDirective(out, directive.block[i], depth + 1);
    }
    out += pad;
    out += "}";
  }
  out += "\n";
}

std::string Writer::writeDirective(const DirectiveNode& directive,
                                   int depth) const {
  std::string out;
  writeDirective(out, directive, depth);
  return out;
}

void Writer::writeLogConfig(std::string& out, const LogConfig& log) const {
  std::string pad1 = indent(1);
  std::string pad2 = indent(2);
  std::string pad3 = indent(3);

  out += pad1 + "log {\n";

  bool nested_roll = log.output.isSet();
  if (log.output.isSet()) {
    out += pad2 + "output " + writeValue(log.output.value());
    if (log.roll_size.isSet() || log.roll_keep.isSet()) {
      out += " {\n";
      if (log.roll_size.isSet()) {
        out += pad3 + "roll_size " + writeValue(log.roll_size.value()) +
               "\n";
      }
      if (log.roll_keep.isSet()) {
        out += pad3 + "roll_keep " + writeValue(log.roll_keep.value()) +
               "\n";
      }
      out += pad2 + "}";
    }
    out += "\n";
  }
  if (log.format.isSet()) {
    out += pad2 + "format " + writeValue(log.format.value()) + "\n";
  }
  if (log.level.isSet()) {
    out += pad2 + "level " + writeValue(log.level.value()) + "\n";
  }
  // Without an output there is nothing to nest the roll settings under.
  if (!nested_roll) {
    if (log.roll_size.isSet()) {
      out += pad2 + "roll_size " + writeValue(log.roll_size.value()) + "\n";
    }
    if (log.roll_keep.isSet()) {
      out += pad2 + "roll_keep " + writeValue(log.roll_keep.value()) + "\n";
    }
  }

  out += pad1 + "}\n";
}

std::string Writer::writeGlobalOptions(const GlobalOptions& options) const {
  std::string pad = indent(1);
  std::string out = "{\n";

  if (!options.email.empty()) {
    out += pad + "email " + writeValue(options.email) + "\n";
  }
  if (!options.acme_ca.empty()) {
    out += pad + "acme_ca " + writeValue(options.acme_ca) + "\n";
  }
  if (!options.admin.empty()) {
    out += pad + "admin " + writeValue(options.admin) + "\n";
  }
  if (options.debug) {
    out += pad + "debug\n";
  }
  for (size_t i = 0; i < options.order_before.size(); ++i) {
    out += pad + orderLine(options.order_before[i], "before");
  }
  for (size_t i = 0; i < options.order_after.size(); ++i) {
    out += pad + orderLine(options.order_after[i], "after");
  }
  if (options.has_log) {
    writeLogConfig(out, options.log);
  }
  if (!options.servers.empty()) {
    out += pad + "servers {\n";
    for (size_t i = 0; i < options.servers.size(); ++i) {
      writeDirective(out, options.servers[i], 2);
    }
    out += pad + "}\n";
  }
  for (size_t i = 0; i < options.other.size(); ++i) {
    writeDirective(out, options.other[i], 1);
  }

  out += "}\n";
  return out;
}

std::string Writer::writeSnippet(const Snippet& snippet) const {
  std::string out = quoteIfNeeded("(" + snippet.name + ")") + " {\n";
  for (size_t i = 0; i < snippet.directives.size(); ++i) {
    writeDirective(out, snippet.directives[i], 1);
  }
  out += "}\n";
  return out;
}

std::string Writer::writeSnippets(const std::vector<Snippet>& snippets) const {
  std::string out;
  for (size_t i = 0; i < snippets.size(); ++i) {
    if (i > 0) {
      out += "\n";
    }
    out += writeSnippet(snippets[i]);
  }
  return out;
}

// A site without addresses has no header to write and yields "".
std::string Writer::writeSite(const Site& site) const {
  if (site.addresses.empty()) {
    return "";
  }
  std::string out;
  for (size_t i = 0; i < site.addresses.size(); ++i) {
    if (i > 0) {
      out += " ";
    }
    out += quoteIfNeeded(site.addresses[i]);
  }
  out += " {\n";
  for (size_t i = 0; i < site.directives.size(); ++i) {
    writeDirective(out, site.directives[i], 1);
  }
  out += "}\n";
  return out;
}

std::string Writer::writeSites(const std::vector<Site>& sites) const {
  std::string out;
  for (size_t i = 0; i < sites.size(); ++i) {
    std::string site = writeSite(sites[i]);
    if (site.empty()) {
      continue;
    }
    if (!out.empty()) {
      out += "\n";
    }
    out += site;
  }
  return out;
}

std::string Writer::writeCaddyfile(const Caddyfile& doc) const {
  std::vector<std::string> groups;
  if (doc.has_global_options) {
    groups.push_back(writeGlobalOptions(doc.global_options));
  }
  if (!doc.snippets.empty()) {
    groups.push_back(writeSnippets(doc.snippets));
  }
  std::string sites = writeSites(doc.sites);
  if (!sites.empty()) {
    groups.push_back(sites);
  }
  return join(groups, "\n");
}
