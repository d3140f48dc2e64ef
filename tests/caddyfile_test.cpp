#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "ConfigFile.hpp"
#include "DiagnosticDecoder.hpp"
#include "Document.hpp"
#include "Parser.hpp"
#include "Writer.hpp"

#ifndef CADDYSHACK_TEST_DATA_DIR
#define CADDYSHACK_TEST_DATA_DIR "tests/data"
#endif

namespace {

std::string dataFile(const std::string& name) {
  return ConfigFile(std::string(CADDYSHACK_TEST_DATA_DIR) + "/" + name).read();
}

void expectSameDirectives(const DirectiveList& lhs, const DirectiveList& rhs) {
  ASSERT_EQ(lhs.size(), rhs.size());
  for (size_t i = 0; i < lhs.size(); ++i) {
    EXPECT_TRUE(lhs[i] == rhs[i]) << lhs[i].name << " vs " << rhs[i].name;
  }
}

// Structural equality of two parses, ignoring comments and raw text.
void expectEquivalent(const Caddyfile& lhs, const Caddyfile& rhs) {
  EXPECT_EQ(lhs.has_global_options, rhs.has_global_options);
  Writer writer;
  EXPECT_EQ(writer.writeGlobalOptions(lhs.global_options),
            writer.writeGlobalOptions(rhs.global_options));

  ASSERT_EQ(lhs.snippets.size(), rhs.snippets.size());
  for (size_t i = 0; i < lhs.snippets.size(); ++i) {
    EXPECT_EQ(lhs.snippets[i].name, rhs.snippets[i].name);
    expectSameDirectives(lhs.snippets[i].directives,
                         rhs.snippets[i].directives);
  }

  ASSERT_EQ(lhs.sites.size(), rhs.sites.size());
  for (size_t i = 0; i < lhs.sites.size(); ++i) {
    EXPECT_EQ(lhs.sites[i].addresses, rhs.sites[i].addresses);
    EXPECT_EQ(lhs.sites[i].imports, rhs.sites[i].imports);
    expectSameDirectives(lhs.sites[i].directives, rhs.sites[i].directives);
  }
}

}  // namespace

// ==================== SCENARIOS ====================

TEST(CaddyfileScenario, SingleReverseProxySite) {
  Caddyfile doc =
      parseCaddyfile("example.com {\n\treverse_proxy localhost:8080\n}\n");
  ASSERT_EQ(doc.sites.size(), 1u);
  const Site& site = doc.sites[0];
  ASSERT_EQ(site.addresses.size(), 1u);
  EXPECT_EQ(site.addresses[0], "example.com");
  ASSERT_EQ(site.directives.size(), 1u);
  EXPECT_EQ(site.directives[0].name, "reverse_proxy");
  ASSERT_EQ(site.directives[0].args.size(), 1u);
  EXPECT_EQ(site.directives[0].args[0], "localhost:8080");
  EXPECT_TRUE(site.imports.empty());
}

TEST(CaddyfileScenario, SnippetImportedBySite) {
  Caddyfile doc = parseCaddyfile(
      "(common) {\n\tencode gzip\n}\n\nexample.com {\n\timport common\n}\n");
  ASSERT_EQ(doc.snippets.size(), 1u);
  EXPECT_EQ(doc.snippets[0].name, "common");
  ASSERT_EQ(doc.sites.size(), 1u);
  ASSERT_EQ(doc.sites[0].imports.size(), 1u);
  EXPECT_EQ(doc.sites[0].imports[0], "common");
}

TEST(CaddyfileScenario, GlobalOptionsWrittenInFieldOrder) {
  Caddyfile doc = parseCaddyfile("{\n\tdebug\n\temail a@b.com\n}\n");
  ASSERT_TRUE(doc.has_global_options);
  EXPECT_EQ(doc.global_options.email, "a@b.com");
  EXPECT_TRUE(doc.global_options.debug);

  std::string text = Writer().writeCaddyfile(doc);
  std::string::size_type email = text.find("email a@b.com");
  std::string::size_type debug = text.find("debug");
  ASSERT_NE(email, std::string::npos);
  ASSERT_NE(debug, std::string::npos);
  EXPECT_LT(email, debug);
}

TEST(CaddyfileScenario, WhitespaceArgumentIsQuotedAndSurvivesReparse) {
  Caddyfile doc = parseCaddyfile(":80 {\n\trespond ok\n}\n");
  ASSERT_EQ(doc.sites.size(), 1u);
  doc.sites[0].directives[0].args[0] = "Hello World";

  std::string text = Writer().writeCaddyfile(doc);
  EXPECT_NE(text.find("respond \"Hello World\""), std::string::npos);

  Caddyfile reparsed = parseCaddyfile(text);
  ASSERT_EQ(reparsed.sites.size(), 1u);
  ASSERT_EQ(reparsed.sites[0].directives[0].args.size(), 1u);
  EXPECT_EQ(reparsed.sites[0].directives[0].args[0], "\"Hello World\"");
}

TEST(CaddyfileScenario, DiagnosticLineDecoded) {
  ValidationErrorList errors =
      DiagnosticDecoder().decode("Caddyfile:10 - Error: unrecognized directive");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].line, 10);
  EXPECT_EQ(errors[0].message, "Error: unrecognized directive");
}

// ==================== ROUND TRIP ====================

TEST(CaddyfileRoundTrip, FullDocumentParsesCompletely) {
  SkippedRangeList skipped;
  Caddyfile doc = Parser(dataFile("full.Caddyfile")).parseAll(&skipped);
  EXPECT_TRUE(skipped.empty());

  EXPECT_TRUE(doc.has_global_options);
  EXPECT_EQ(doc.global_options.admin, "localhost:2019");
  ASSERT_EQ(doc.global_options.order_before.size(), 1u);
  EXPECT_EQ(doc.global_options.log.output.value(), "stderr");

  ASSERT_EQ(doc.snippets.size(), 2u);
  ASSERT_EQ(doc.sites.size(), 3u);
  EXPECT_EQ(doc.sites[0].imports.size(), 2u);
  EXPECT_EQ(doc.sites[1].comments.size(), 1u);

  const Site* api = findSite(doc, "https://api.example.com");
  ASSERT_TRUE(api != NULL);
  ASSERT_EQ(api->directives.size(), 3u);
  const DirectiveNode& handle = api->directives[1];
  EXPECT_EQ(handle.name, "handle");
  ASSERT_EQ(handle.block.size(), 1u);
  ASSERT_EQ(handle.block[0].block.size(), 1u);
  EXPECT_EQ(handle.block[0].block[0].name, "header_up");
}

TEST(CaddyfileRoundTrip, WritesCanonicalText) {
  Caddyfile doc = parseCaddyfile(dataFile("full.Caddyfile"));
  EXPECT_EQ(Writer().writeCaddyfile(doc),
            dataFile("full.canonical.Caddyfile"));
}

TEST(CaddyfileRoundTrip, ReparseIsEquivalent) {
  Caddyfile first = parseCaddyfile(dataFile("full.Caddyfile"));
  Caddyfile second = parseCaddyfile(Writer().writeCaddyfile(first));
  expectEquivalent(first, second);
}

TEST(CaddyfileRoundTrip, CanonicalTextIsAFixedPoint) {
  std::string canonical = dataFile("full.canonical.Caddyfile");
  EXPECT_EQ(Writer().writeCaddyfile(parseCaddyfile(canonical)), canonical);
}

// ==================== ORDERING ====================

TEST(CaddyfileOrdering, SourceOrderIsKept) {
  Caddyfile doc = parseCaddyfile(
      "c.com {\n}\n(z) {\n\tlog\n}\nb.com {\n}\n(a) {\n\tlog\n}\na.com {\n}\n");
  ASSERT_EQ(doc.snippets.size(), 2u);
  EXPECT_EQ(doc.snippets[0].name, "z");
  EXPECT_EQ(doc.snippets[1].name, "a");
  ASSERT_EQ(doc.sites.size(), 3u);
  EXPECT_EQ(doc.sites[0].addresses[0], "c.com");
  EXPECT_EQ(doc.sites[1].addresses[0], "b.com");
  EXPECT_EQ(doc.sites[2].addresses[0], "a.com");
}

TEST(CaddyfileOrdering, GlobalThenSnippetsThenSites) {
  std::string text = Writer().writeCaddyfile(
      parseCaddyfile("{\n\tdebug\n}\na.com {\n}\n(s) {\n\tlog\n}\n"));
  std::string::size_type global = text.find("{\n\tdebug");
  std::string::size_type snippet = text.find("(s) {");
  std::string::size_type site = text.find("a.com {");
  ASSERT_NE(global, std::string::npos);
  ASSERT_NE(snippet, std::string::npos);
  ASSERT_NE(site, std::string::npos);
  EXPECT_LT(global, snippet);
  EXPECT_LT(snippet, site);
}

// ==================== QUOTING ====================

TEST(CaddyfileQuoting, RewritingQuotedOutputChangesNothing) {
  Caddyfile doc = parseCaddyfile(":80 {\n\trespond ok\n}\n");
  doc.sites[0].directives[0].args[0] = "say \"hi\" twice";
  std::string once = Writer().writeCaddyfile(doc);
  std::string twice = Writer().writeCaddyfile(parseCaddyfile(once));
  EXPECT_EQ(twice, once);
}
