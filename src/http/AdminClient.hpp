#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "HttpClient.hpp"
#include "Url.hpp"

class CancelToken;

struct CaddyStatus {
  CaddyStatus();

  bool running;
  std::string version;  // Server header, when the admin API sends one
};

// A certificate authority of Caddy's PKI app. provisioned is false when the
// CA does not exist (the admin API answered 404).
struct CAInfo {
  CAInfo();

  std::string id;
  std::string name;
  std::string root_common_name;
  std::string intermediate_common_name;
  std::string root_certificate;
  std::string intermediate_certificate;
  bool provisioned;
};

void from_json(const nlohmann::json& j, CAInfo& info);
void to_json(nlohmann::json& j, const CAInfo& info);

// Client for the Caddy admin API (default http://localhost:2019).
//
// Every call takes an optional cancel token and is bounded by the client's
// timeout. Calls throw AdminUnreachable when no response arrives and
// AdminError when the API answers with a failure status.
class AdminClient {
 public:
  AdminClient();
  // Throws ConfigError if base_url is not an http URL.
  AdminClient(const std::string& base_url, int timeout_ms);
  AdminClient(const AdminClient& other);
  AdminClient& operator=(const AdminClient& other);
  ~AdminClient();

  // POST /load with the Caddyfile; the running server switches to it.
  void load(const std::string& caddyfile, const CancelToken* cancel) const;

  // POST /adapt with the Caddyfile; returns the adapted JSON config.
  std::string adapt(const std::string& caddyfile,
                    const CancelToken* cancel) const;

  // GET /config/; the running config as opaque bytes.
  std::string getConfig(const CancelToken* cancel) const;

  // GET /config/. An unreachable server is reported as not running.
  CaddyStatus getStatus(const CancelToken* cancel) const;

  // Throws AdminUnreachable if the API does not answer at all.
  void ping(const CancelToken* cancel) const;

  // POST /stop
  void stop(const CancelToken* cancel) const;

  // GET /pki/ca/<id>
  CAInfo getPKICAInfo(const std::string& ca_id,
                      const CancelToken* cancel) const;

  // Message of an error response: the "error" field of a JSON object body,
  // else the trimmed body.
  static std::string errorMessage(const std::string& body);

  const http::Url& baseUrl() const;
  int timeoutMs() const;
  void setTimeoutMs(int timeout_ms);

 private:
  Response exchange(const Request& request, const CancelToken* cancel) const;
  Response expectOk(const Request& request, const CancelToken* cancel) const;
  Request caddyfileRequest(const std::string& path,
                           const std::string& caddyfile) const;

  http::Url base_;
  int timeout_ms_;
  HttpClient http_;
};
