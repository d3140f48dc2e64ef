#include "CaddyValidator.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "CancelToken.hpp"
#include "Errors.hpp"
#include "OneShotServer.hpp"

// Fake caddy binaries: shell scripts that behave like `caddy adapt` and
// `caddy validate`.

TEST(CaddyValidatorTest, Defaults) {
  CaddyValidator validator;
  EXPECT_EQ(validator.binary(), "caddy");
  EXPECT_EQ(validator.timeoutMs(), 30000);
}

TEST(CaddyValidatorTest, ZeroExitIsValid) {
  TempScript caddy("cat > /dev/null; echo '{\"apps\":{}}'; exit 0");
  CaddyValidator validator(caddy.path(), 5000);
  ValidationResult res = validator.validateContent("a.com {\n}\n", NULL);
  EXPECT_TRUE(res.isValid());
}

TEST(CaddyValidatorTest, PassesAdaptArgumentsAndStdin) {
  TempScript caddy(
      "[ \"$*\" = \"adapt --config - --adapter caddyfile --validate\" ] || "
      "exit 9\n"
      "grep -q 'reverse_proxy' || exit 8\n"
      "exit 0");
  CaddyValidator validator(caddy.path(), 5000);
  ValidationResult res = validator.validateContent(
      "a.com {\n\treverse_proxy localhost:8080\n}\n", NULL);
  EXPECT_TRUE(res.isValid()) << res.toString();
}

TEST(CaddyValidatorTest, ValidateFileArguments) {
  TempScript caddy(
      "[ \"$1\" = validate ] && [ \"$2\" = --config ] && "
      "[ \"$3\" = /etc/caddy/Caddyfile ] || exit 9\n"
      "exit 0");
  CaddyValidator validator(caddy.path(), 5000);
  EXPECT_TRUE(validator.validateFile("/etc/caddy/Caddyfile", NULL).isValid());
}

TEST(CaddyValidatorTest, DiagnosticsDecodedFromStderr) {
  TempScript caddy(
      "cat > /dev/null\n"
      "echo 'Caddyfile:10 - Error: unrecognized directive' >&2\n"
      "exit 1");
  CaddyValidator validator(caddy.path(), 5000);
  ValidationResult res = validator.validateContent("a.com {\n}\n", NULL);
  EXPECT_EQ(res.state(), ValidationResult::INVALID);
  ASSERT_EQ(res.errors().size(), 1u);
  EXPECT_EQ(res.errors()[0].line, 10);
  EXPECT_EQ(res.errors()[0].message, "Error: unrecognized directive");
}

TEST(CaddyValidatorTest, NonZeroExitWithoutDiagnosticsIsInvalid) {
  TempScript caddy("cat > /dev/null; exit 4");
  CaddyValidator validator(caddy.path(), 5000);
  ValidationResult res = validator.validateContent("a.com {\n}\n", NULL);
  EXPECT_FALSE(res.isValid());
  EXPECT_EQ(res.firstError(), "exit status 4");
}

TEST(CaddyValidatorTest, UnparseableStdoutUsedAsMessage) {
  TempScript caddy("cat > /dev/null; echo 'no good'; exit 1");
  CaddyValidator validator(caddy.path(), 5000);
  ValidationResult res = validator.validateContent("x", NULL);
  EXPECT_FALSE(res.isValid());
  EXPECT_EQ(res.firstError(), "no good");
}

TEST(CaddyValidatorTest, MissingBinaryIsUnavailable) {
  CaddyValidator validator("/nonexistent/caddy", 5000);
  EXPECT_THROW(validator.validateContent("a.com {\n}\n", NULL),
               ValidationUnavailable);
}

TEST(CaddyValidatorTest, TimeoutIsUnavailable) {
  TempScript caddy("sleep 10");
  CaddyValidator validator(caddy.path(), 200);
  EXPECT_THROW(validator.validateFile("/tmp/none", NULL),
               ValidationUnavailable);
}

TEST(CaddyValidatorTest, CancelledIsUnavailable) {
  TempScript caddy("exit 0");
  CaddyValidator validator(caddy.path(), 5000);
  CancelToken token;
  token.cancel();
  EXPECT_THROW(validator.validateContent("a.com {\n}\n", &token),
               ValidationUnavailable);
}
