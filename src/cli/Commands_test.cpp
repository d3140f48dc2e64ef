#include "Commands.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "OneShotServer.hpp"
#include "constants.hpp"

namespace {

const char* const kMessy =
    "(common)   {\n"
    "  encode gzip\n"
    "}\n"
    "example.com www.example.com {\n"
    "    import common\n"
    "    file_server\n"
    "}\n";

const char* const kCanonical =
    "(common) {\n"
    "\tencode gzip\n"
    "}\n"
    "\n"
    "example.com www.example.com {\n"
    "\timport common\n"
    "\tfile_server\n"
    "}\n";

// Runs commands against a Caddyfile in a fresh temporary directory.
class CommandsTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    char tmpl[] = "/tmp/caddyshack_cli_XXXXXX";
    char* dir = mkdtemp(tmpl);
    ASSERT_TRUE(dir != NULL);
    dir_ = dir;
    opts_.caddyfile = dir_ + "/Caddyfile";
    opts_.caddy_bin = dir_ + "/no-such-caddy";
    opts_.timeout_sec = 5;
  }

  virtual void TearDown() {
    std::remove(opts_.caddyfile.c_str());
    rmdir(dir_.c_str());
  }

  void writeCaddyfile(const std::string& content) {
    std::ofstream out(opts_.caddyfile.c_str());
    out << content;
  }

  std::string readCaddyfile() const {
    std::ifstream in(opts_.caddyfile.c_str());
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
  }

  int run(const std::string& command) {
    opts_.command = command;
    out_.str("");
    return CommandRunner(opts_, out_, NULL).run();
  }

  std::string output() const { return out_.str(); }

  std::string dir_;
  Options opts_;
  std::ostringstream out_;
};

}  // namespace

// ==================== LOCAL COMMANDS ====================

TEST_F(CommandsTest, FmtPrintsCanonicalText) {
  writeCaddyfile(kMessy);
  EXPECT_EQ(run("fmt"), EXIT_OK);
  EXPECT_EQ(output(), kCanonical);
  EXPECT_EQ(readCaddyfile(), kMessy);
}

TEST_F(CommandsTest, FmtWriteRewritesFile) {
  writeCaddyfile(kMessy);
  opts_.write = true;
  EXPECT_EQ(run("fmt"), EXIT_OK);
  EXPECT_EQ(output(), "Formatted " + opts_.caddyfile + "\n");
  EXPECT_EQ(readCaddyfile(), kCanonical);

  // Formatting canonical text changes nothing.
  EXPECT_EQ(run("fmt"), EXIT_OK);
  EXPECT_EQ(readCaddyfile(), kCanonical);
}

TEST_F(CommandsTest, FmtWriteRefusesSkippedInput) {
  const std::string text = "garbage\nexample.com {\n\tfile_server\n}\n";
  writeCaddyfile(text);
  opts_.write = true;
  EXPECT_EQ(run("fmt"), EXIT_USAGE);
  EXPECT_EQ(readCaddyfile(), text);
}

TEST_F(CommandsTest, FmtWithoutWriteStillPrintsWhatParsed) {
  writeCaddyfile("garbage\nexample.com {\n\tfile_server\n}\n");
  EXPECT_EQ(run("fmt"), EXIT_OK);
  EXPECT_EQ(output(), "example.com {\n\tfile_server\n}\n");
}

TEST_F(CommandsTest, FmtWriteRefusesDuplicates) {
  const std::string text = "a.com {\n}\na.com {\n}\n";
  writeCaddyfile(text);
  opts_.write = true;
  EXPECT_EQ(run("fmt"), EXIT_USAGE);
  EXPECT_EQ(readCaddyfile(), text);
}

TEST_F(CommandsTest, MissingCaddyfile) {
  EXPECT_EQ(run("fmt"), EXIT_CADDYFILE_NOT_FOUND);
  EXPECT_EQ(run("sites"), EXIT_CADDYFILE_NOT_FOUND);
  EXPECT_EQ(run("validate"), EXIT_CADDYFILE_NOT_FOUND);
  EXPECT_EQ(run("apply"), EXIT_CADDYFILE_NOT_FOUND);
}

TEST_F(CommandsTest, Sites) {
  writeCaddyfile(std::string(kMessy) + ":8080 {\n\trespond ok\n}\n");
  EXPECT_EQ(run("sites"), EXIT_OK);
  EXPECT_EQ(output(),
            "example.com www.example.com\n"
            "  imports: common\n"
            ":8080\n");
}

TEST_F(CommandsTest, Snippets) {
  writeCaddyfile(std::string("(logging) {\n\tlog\n}\n") + kMessy);
  EXPECT_EQ(run("snippets"), EXIT_OK);
  EXPECT_EQ(output(), "logging\ncommon\n");
}

TEST_F(CommandsTest, UnknownCommand) {
  writeCaddyfile(kMessy);
  EXPECT_EQ(run("reload"), EXIT_USAGE);
  EXPECT_EQ(output(), "");
}

// ==================== VALIDATION ====================

TEST_F(CommandsTest, ValidateValid) {
  writeCaddyfile(kMessy);
  TempScript caddy("[ \"$1\" = validate ] || exit 9\nexit 0");
  opts_.caddy_bin = caddy.path();
  EXPECT_EQ(run("validate"), EXIT_OK);
  EXPECT_EQ(output(), "Configuration is valid\n");
}

TEST_F(CommandsTest, ValidateInvalid) {
  writeCaddyfile(kMessy);
  TempScript caddy(
      "echo \"Error: adapting config using caddyfile: $3:6 - unknown "
      "directive: file_server2\" >&2\n"
      "exit 1");
  opts_.caddy_bin = caddy.path();
  EXPECT_EQ(run("validate"), EXIT_INVALID);
  EXPECT_EQ(output(),
            "Configuration is invalid:\n"
            "  Line 6: unknown directive: file_server2\n");
}

TEST_F(CommandsTest, ValidateWithoutBinaryIsUnavailable) {
  writeCaddyfile(kMessy);
  EXPECT_EQ(run("validate"), EXIT_UNAVAILABLE);
}

TEST_F(CommandsTest, ValidateThroughAdminApi) {
  writeCaddyfile(kMessy);
  OneShotServer server(OneShotServer::reply(
      400, "{\"error\":\"Caddyfile:2: unrecognized directive: encode2\"}"));
  opts_.use_api = true;
  opts_.admin_url = server.url();
  EXPECT_EQ(run("validate"), EXIT_INVALID);
  EXPECT_EQ(output(),
            "Configuration is invalid:\n"
            "  Line 2: unrecognized directive: encode2\n");
  EXPECT_EQ(server.request().find("POST /adapt HTTP/1.1\r\n"), 0u);
}

// ==================== APPLY ====================

TEST_F(CommandsTest, ApplyWritesAndReloads) {
  writeCaddyfile(kMessy);
  TempScript caddy("cat > /dev/null\nexit 0");
  opts_.caddy_bin = caddy.path();
  OneShotServer server(OneShotServer::reply(200, ""));
  opts_.admin_url = server.url();

  EXPECT_EQ(run("apply"), EXIT_OK);
  EXPECT_EQ(output(), "Configuration applied\n");
  EXPECT_EQ(readCaddyfile(), kCanonical);

  std::string request = server.request();
  EXPECT_EQ(request.find("POST /load HTTP/1.1\r\n"), 0u);
  EXPECT_NE(request.find(std::string("\r\n\r\n") + kCanonical),
            std::string::npos);
}

TEST_F(CommandsTest, ApplyInvalidLeavesFileAlone) {
  writeCaddyfile(kMessy);
  TempScript caddy(
      "cat > /dev/null\n"
      "echo 'Caddyfile:6 - unknown directive' >&2\n"
      "exit 1");
  opts_.caddy_bin = caddy.path();
  EXPECT_EQ(run("apply"), EXIT_INVALID);
  EXPECT_EQ(output(),
            "Configuration is invalid:\n  Line 6: unknown directive\n");
  EXPECT_EQ(readCaddyfile(), kMessy);
}

TEST_F(CommandsTest, ApplyReloadRejected) {
  writeCaddyfile(kMessy);
  TempScript caddy("cat > /dev/null\nexit 0");
  opts_.caddy_bin = caddy.path();
  OneShotServer server(
      OneShotServer::reply(400, "{\"error\":\"loading new config: boom\"}"));
  opts_.admin_url = server.url();

  EXPECT_EQ(run("apply"), EXIT_RELOAD_REJECTED);
  // The validated text is on disk even though the reload failed.
  EXPECT_EQ(readCaddyfile(), kCanonical);
}

TEST_F(CommandsTest, ApplyAdminUnreachable) {
  writeCaddyfile(kMessy);
  TempScript caddy("cat > /dev/null\nexit 0");
  opts_.caddy_bin = caddy.path();
  std::ostringstream url;
  url << "http://127.0.0.1:" << OneShotServer::closedPort();
  opts_.admin_url = url.str();
  EXPECT_EQ(run("apply"), EXIT_UNAVAILABLE);
}

// ==================== ADMIN COMMANDS ====================

TEST_F(CommandsTest, ConfigIsPrettyPrinted) {
  OneShotServer server(OneShotServer::reply(200, "{\"apps\":{}}"));
  opts_.admin_url = server.url();
  EXPECT_EQ(run("config"), EXIT_OK);
  EXPECT_EQ(output(), "{\n  \"apps\": {}\n}\n");
}

TEST_F(CommandsTest, ConfigNonJsonPrintedAsIs) {
  OneShotServer server(OneShotServer::reply(200, "not json"));
  opts_.admin_url = server.url();
  EXPECT_EQ(run("config"), EXIT_OK);
  EXPECT_EQ(output(), "not json\n");
}

TEST_F(CommandsTest, CaDefaultsToLocal) {
  OneShotServer server(OneShotServer::reply(
      200,
      "{\"id\":\"local\",\"name\":\"Caddy Local Authority\","
      "\"root_common_name\":\"Root\","
      "\"intermediate_common_name\":\"Intermediate\"}"));
  opts_.admin_url = server.url();
  EXPECT_EQ(run("ca"), EXIT_OK);
  EXPECT_EQ(output(),
            "id: local\n"
            "name: Caddy Local Authority\n"
            "root common name: Root\n"
            "intermediate common name: Intermediate\n");
  EXPECT_EQ(server.request().find("GET /pki/ca/local HTTP/1.1\r\n"), 0u);
}

TEST_F(CommandsTest, CaNotProvisioned) {
  OneShotServer server(OneShotServer::reply(404, "{\"error\":\"no such CA\"}"));
  opts_.admin_url = server.url();
  opts_.args.push_back("acme");
  EXPECT_EQ(run("ca"), EXIT_OK);
  EXPECT_EQ(output(), "CA 'acme' is not provisioned\n");
  EXPECT_EQ(server.request().find("GET /pki/ca/acme HTTP/1.1\r\n"), 0u);
}

TEST_F(CommandsTest, StatusRunning) {
  OneShotServer server(
      OneShotServer::reply(200, "{}", "Server: Caddy/2.7.6\r\n"));
  opts_.admin_url = server.url();
  EXPECT_EQ(run("status"), EXIT_OK);
  EXPECT_EQ(output(), "Caddy is running (Caddy/2.7.6)\n");
}

TEST_F(CommandsTest, StatusNotRunning) {
  std::ostringstream url;
  url << "http://127.0.0.1:" << OneShotServer::closedPort();
  opts_.admin_url = url.str();
  EXPECT_EQ(run("status"), EXIT_UNAVAILABLE);
  EXPECT_EQ(output(), "Caddy is not running\n");
}

TEST_F(CommandsTest, BadAdminUrlIsUsageError) {
  opts_.admin_url = "https://localhost:2019";
  EXPECT_EQ(run("status"), EXIT_USAGE);
}
