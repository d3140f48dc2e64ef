#include "DiagnosticDecoder.hpp"

#include <gtest/gtest.h>

// ==================== LINE SHAPES ====================

TEST(DiagnosticDecoderTest, SourceMarkerWithDash) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(
      decoder.decodeLine("Caddyfile:10 - Error: unrecognized directive", err));
  EXPECT_EQ(err.line, 10);
  EXPECT_EQ(err.message, "Error: unrecognized directive");
}

TEST(DiagnosticDecoderTest, SourceMarkerInsideLongerLine) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine(
      "Error: adapting config using caddyfile: Caddyfile:3: unrecognized "
      "directive: foo",
      err));
  EXPECT_EQ(err.line, 3);
  EXPECT_EQ(err.message, "unrecognized directive: foo");
}

TEST(DiagnosticDecoderTest, SourceMarkerIsCaseInsensitive) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine("caddyfile:7:   bad thing  ", err));
  EXPECT_EQ(err.line, 7);
  EXPECT_EQ(err.message, "bad thing");
}

TEST(DiagnosticDecoderTest, CustomSourceName) {
  DiagnosticDecoder decoder("site.conf");
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine("site.conf:4 - wrong argument count", err));
  EXPECT_EQ(err.line, 4);
  EXPECT_EQ(err.message, "wrong argument count");
  EXPECT_EQ(decoder.sourceName(), "site.conf");
}

TEST(DiagnosticDecoderTest, LinePrefix) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine("Line 12: unexpected '}'", err));
  EXPECT_EQ(err.line, 12);
  EXPECT_EQ(err.message, "unexpected '}'");
}

TEST(DiagnosticDecoderTest, ErrorAtSource) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine("Error: bad port at Caddyfile:42", err));
  EXPECT_EQ(err.line, 42);
  EXPECT_EQ(err.message, "bad port");
}

TEST(DiagnosticDecoderTest, ErrorAtOtherSource) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine("error: duplicate site at /tmp/x.conf:8", err));
  EXPECT_EQ(err.line, 8);
  EXPECT_EQ(err.message, "duplicate site");
}

TEST(DiagnosticDecoderTest, KeywordFallbackHasLineZero) {
  DiagnosticDecoder decoder;
  ValidationError err;
  ASSERT_TRUE(decoder.decodeLine("  invalid configuration  ", err));
  EXPECT_EQ(err.line, 0);
  EXPECT_EQ(err.message, "invalid configuration");

  ASSERT_TRUE(decoder.decodeLine("Unknown subdirective", err));
  EXPECT_EQ(err.line, 0);
}

TEST(DiagnosticDecoderTest, UnrelatedLinesDropped) {
  DiagnosticDecoder decoder;
  ValidationError err;
  EXPECT_FALSE(decoder.decodeLine("", err));
  EXPECT_FALSE(decoder.decodeLine("   ", err));
  EXPECT_FALSE(decoder.decodeLine("{\"level\":\"info\",\"msg\":\"using config\"}",
                                  err));
}

TEST(DiagnosticDecoderTest, MarkerWithoutMessageFallsThrough) {
  DiagnosticDecoder decoder;
  ValidationError err;
  // No message after the marker: only the keyword rule applies.
  ASSERT_TRUE(decoder.decodeLine("error in Caddyfile:3 -", err));
  EXPECT_EQ(err.line, 0);
  EXPECT_EQ(err.message, "error in Caddyfile:3 -");
}

// ==================== WHOLE OUTPUT ====================

TEST(DiagnosticDecoderTest, DecodeSkipsNoiseAndKeepsOrder) {
  DiagnosticDecoder decoder;
  ValidationErrorList errors = decoder.decode(
      "2024/01/01 INFO using adjacent Caddyfile\n"
      "\n"
      "Caddyfile:2 - Error: unrecognized directive: fle_server\n"
      "line 5: unexpected EOF\n");
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0], ValidationError(2, "Error: unrecognized directive: "
                                          "fle_server"));
  EXPECT_EQ(errors[1], ValidationError(5, "unexpected EOF"));
}

TEST(DiagnosticDecoderTest, FailureUsesDecodedErrors) {
  DiagnosticDecoder decoder;
  ValidationResult res =
      decoder.failure("Caddyfile:10 - Error: unrecognized directive", "out",
                      "exit status 1");
  EXPECT_EQ(res.state(), ValidationResult::INVALID);
  ASSERT_EQ(res.errors().size(), 1u);
  EXPECT_EQ(res.errors()[0].line, 10);
  EXPECT_EQ(res.errors()[0].message, "Error: unrecognized directive");
}

TEST(DiagnosticDecoderTest, FailureFallsBackToRawText) {
  DiagnosticDecoder decoder;
  ValidationResult res = decoder.failure("  something odd happened \n",
                                         "ignored", "exit status 1");
  ASSERT_EQ(res.errors().size(), 1u);
  EXPECT_EQ(res.errors()[0].line, 0);
  EXPECT_EQ(res.errors()[0].message, "something odd happened");

  res = decoder.failure("", "  from stdout\n", "exit status 1");
  EXPECT_EQ(res.firstError(), "from stdout");

  res = decoder.failure(" \n", "", "exit status 3");
  EXPECT_FALSE(res.isValid());
  EXPECT_EQ(res.firstError(), "exit status 3");
}
