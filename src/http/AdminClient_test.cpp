#include "AdminClient.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "Errors.hpp"
#include "OneShotServer.hpp"

namespace {

std::string unreachableUrl() {
  std::ostringstream url;
  url << "http://127.0.0.1:" << OneShotServer::closedPort();
  return url.str();
}

}  // namespace

// ==================== CONSTRUCTION ====================

TEST(AdminClientTest, Defaults) {
  AdminClient client;
  EXPECT_EQ(client.baseUrl().serialize(), "http://localhost:2019");
  EXPECT_EQ(client.timeoutMs(), 30000);
  client.setTimeoutMs(1000);
  EXPECT_EQ(client.timeoutMs(), 1000);
}

TEST(AdminClientTest, InvalidUrlIsConfigError) {
  EXPECT_THROW(AdminClient("https://localhost:2019", 1000), ConfigError);
  EXPECT_THROW(AdminClient("localhost", 1000), ConfigError);
}

// ==================== ERROR BODIES ====================

TEST(AdminClientTest, ErrorMessageFromJson) {
  EXPECT_EQ(AdminClient::errorMessage("{\"error\":\"loading config: bad\"}"),
            "loading config: bad");
}

TEST(AdminClientTest, ErrorMessageFallsBackToBody) {
  EXPECT_EQ(AdminClient::errorMessage("  plain failure\n"), "plain failure");
  EXPECT_EQ(AdminClient::errorMessage("{\"error\":\"\"}"), "{\"error\":\"\"}");
  EXPECT_EQ(AdminClient::errorMessage("{\"message\":\"x\"}"),
            "{\"message\":\"x\"}");
  EXPECT_EQ(AdminClient::errorMessage("[1,2]"), "[1,2]");
  EXPECT_EQ(AdminClient::errorMessage(""), "");
}

// ==================== OPERATIONS ====================

TEST(AdminClientTest, LoadPostsCaddyfile) {
  OneShotServer server(OneShotServer::reply(200, ""));
  AdminClient client(server.url(), 5000);
  client.load("a.com {\n}\n", NULL);

  std::string request = server.request();
  EXPECT_EQ(request.find("POST /load HTTP/1.1\r\n"), 0u);
  EXPECT_NE(request.find("Content-Type: text/caddyfile\r\n"),
            std::string::npos);
  EXPECT_NE(request.find("Content-Length: 10\r\n"), std::string::npos);
}

TEST(AdminClientTest, LoadRejected) {
  OneShotServer server(
      OneShotServer::reply(400, "{\"error\":\"unrecognized directive: x\"}"));
  AdminClient client(server.url(), 5000);
  try {
    client.load("a.com {\n\tx\n}\n", NULL);
    FAIL() << "expected AdminError";
  } catch (const AdminError& e) {
    EXPECT_EQ(e.status(), 400);
    EXPECT_EQ(e.message(), "unrecognized directive: x");
    EXPECT_EQ(std::string(e.what()),
              "caddy admin api error (status 400): unrecognized directive: x");
  }
}

TEST(AdminClientTest, AdaptReturnsJson) {
  OneShotServer server(OneShotServer::reply(200, "{\"apps\":{}}"));
  AdminClient client(server.url(), 5000);
  EXPECT_EQ(client.adapt("a.com {\n}\n", NULL), "{\"apps\":{}}");
  EXPECT_EQ(server.request().find("POST /adapt HTTP/1.1\r\n"), 0u);
}

TEST(AdminClientTest, GetConfigReturnsOpaqueBytes) {
  OneShotServer server(OneShotServer::reply(200, "{\"apps\":{\"http\":{}}}"));
  AdminClient client(server.url(), 5000);
  EXPECT_EQ(client.getConfig(NULL), "{\"apps\":{\"http\":{}}}");
  std::string request = server.request();
  EXPECT_EQ(request.find("GET /config/ HTTP/1.1\r\n"), 0u);
  EXPECT_NE(request.find("Accept: application/json\r\n"), std::string::npos);
}

TEST(AdminClientTest, GetConfigError) {
  OneShotServer server(OneShotServer::reply(500, "boom"));
  AdminClient client(server.url(), 5000);
  EXPECT_THROW(client.getConfig(NULL), AdminError);
}

TEST(AdminClientTest, StatusRunningWithVersion) {
  OneShotServer server(
      OneShotServer::reply(200, "null", "Server: Caddy/2.7.6\r\n"));
  AdminClient client(server.url(), 5000);
  CaddyStatus status = client.getStatus(NULL);
  EXPECT_TRUE(status.running);
  EXPECT_EQ(status.version, "Caddy/2.7.6");
}

TEST(AdminClientTest, StatusNotRunningWhenUnreachable) {
  AdminClient client(unreachableUrl(), 2000);
  CaddyStatus status = client.getStatus(NULL);
  EXPECT_FALSE(status.running);
  EXPECT_EQ(status.version, "");
}

TEST(AdminClientTest, PingUnreachableThrows) {
  AdminClient client(unreachableUrl(), 2000);
  EXPECT_THROW(client.ping(NULL), AdminUnreachable);
}

TEST(AdminClientTest, PingAnyStatusIsReachable) {
  OneShotServer server(OneShotServer::reply(403, "forbidden"));
  AdminClient client(server.url(), 5000);
  EXPECT_NO_THROW(client.ping(NULL));
}

TEST(AdminClientTest, StopPosts) {
  OneShotServer server(OneShotServer::reply(200, ""));
  AdminClient client(server.url(), 5000);
  client.stop(NULL);
  EXPECT_EQ(server.request().find("POST /stop HTTP/1.1\r\n"), 0u);
}

TEST(AdminClientTest, CAInfoProvisioned) {
  OneShotServer server(OneShotServer::reply(
      200,
      "{\"id\":\"local\",\"name\":\"Caddy Local Authority\","
      "\"root_common_name\":\"Caddy Local Authority - 2024 ECC Root\","
      "\"intermediate_common_name\":\"Caddy Local Authority - ECC "
      "Intermediate\","
      "\"root_certificate\":\"-----BEGIN CERTIFICATE-----\","
      "\"intermediate_certificate\":\"-----BEGIN CERTIFICATE-----\"}"));
  AdminClient client(server.url(), 5000);
  CAInfo info = client.getPKICAInfo("local", NULL);
  EXPECT_TRUE(info.provisioned);
  EXPECT_EQ(info.id, "local");
  EXPECT_EQ(info.name, "Caddy Local Authority");
  EXPECT_EQ(info.root_common_name, "Caddy Local Authority - 2024 ECC Root");
  EXPECT_EQ(info.intermediate_common_name,
            "Caddy Local Authority - ECC Intermediate");
  EXPECT_EQ(info.root_certificate, "-----BEGIN CERTIFICATE-----");
  EXPECT_EQ(server.request().find("GET /pki/ca/local HTTP/1.1\r\n"), 0u);
}

TEST(AdminClientTest, CAInfoNotFoundIsNotProvisioned) {
  OneShotServer server(OneShotServer::reply(404, "{\"error\":\"no CA\"}"));
  AdminClient client(server.url(), 5000);
  CAInfo info = client.getPKICAInfo("local", NULL);
  EXPECT_FALSE(info.provisioned);
  EXPECT_EQ(info.id, "local");
  EXPECT_EQ(info.name, "");
}

TEST(AdminClientTest, CAInfoBadJson) {
  OneShotServer server(OneShotServer::reply(200, "not json"));
  AdminClient client(server.url(), 5000);
  EXPECT_THROW(client.getPKICAInfo("local", NULL), std::runtime_error);
}

TEST(AdminClientTest, CAInfoToJson) {
  CAInfo info;
  info.id = "local";
  info.provisioned = true;
  nlohmann::json j = info;
  EXPECT_EQ(j["id"], "local");
  EXPECT_EQ(j["provisioned"], true);
}
