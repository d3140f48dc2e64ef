#include "AdminClient.hpp"

#include <stdexcept>

#include "Errors.hpp"
#include "HttpStatus.hpp"
#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

CaddyStatus::CaddyStatus() : running(false), version() {}

CAInfo::CAInfo()
    : id(),
      name(),
      root_common_name(),
      intermediate_common_name(),
      root_certificate(),
      intermediate_certificate(),
      provisioned(false) {}

void from_json(const nlohmann::json& j, CAInfo& info) {
  info.id = j.value("id", std::string());
  info.name = j.value("name", std::string());
  info.root_common_name = j.value("root_common_name", std::string());
  info.intermediate_common_name =
      j.value("intermediate_common_name", std::string());
  info.root_certificate = j.value("root_certificate", std::string());
  info.intermediate_certificate =
      j.value("intermediate_certificate", std::string());
}

void to_json(nlohmann::json& j, const CAInfo& info) {
  j = nlohmann::json{{"id", info.id},
                     {"name", info.name},
                     {"root_common_name", info.root_common_name},
                     {"intermediate_common_name", info.intermediate_common_name},
                     {"root_certificate", info.root_certificate},
                     {"intermediate_certificate", info.intermediate_certificate},
                     {"provisioned", info.provisioned}};
}

namespace {

http::Url parseBaseUrl(const std::string& base_url) {
  http::Url url;
  if (!url.parse(base_url)) {
    LOG(ERROR) << "AdminClient: invalid admin API URL: " << base_url;
    throw ConfigError("invalid admin API URL (expected http://host[:port]): " +
                      base_url);
  }
  return url;
}

}  // namespace

AdminClient::AdminClient()
    : base_(parseBaseUrl(DEFAULT_ADMIN_URL)),
      timeout_ms_(DEFAULT_ADMIN_TIMEOUT_SEC * 1000),
      http_(base_) {}

AdminClient::AdminClient(const std::string& base_url, int timeout_ms)
    : base_(parseBaseUrl(base_url)), timeout_ms_(timeout_ms), http_(base_) {}

AdminClient::AdminClient(const AdminClient& other)
    : base_(other.base_), timeout_ms_(other.timeout_ms_), http_(other.http_) {}

AdminClient& AdminClient::operator=(const AdminClient& other) {
  if (this != &other) {
    base_ = other.base_;
    timeout_ms_ = other.timeout_ms_;
    http_ = other.http_;
  }
  return *this;
}

AdminClient::~AdminClient() {}

const http::Url& AdminClient::baseUrl() const {
  return base_;
}

int AdminClient::timeoutMs() const {
  return timeout_ms_;
}

void AdminClient::setTimeoutMs(int timeout_ms) {
  timeout_ms_ = timeout_ms;
}

std::string AdminClient::errorMessage(const std::string& body) {
  nlohmann::json j = nlohmann::json::parse(
      body, nlohmann::json::parser_callback_t(), false);
  if (!j.is_discarded() && j.is_object()) {
    nlohmann::json::const_iterator it = j.find("error");
    if (it != j.end() && it->is_string()) {
      std::string message = it->get<std::string>();
      if (!message.empty()) {
        return message;
      }
    }
  }
  return trim_copy(body);
}

Response AdminClient::exchange(const Request& request,
                               const CancelToken* cancel) const {
  try {
    return http_.send(request, timeout_ms_, cancel);
  } catch (const AdminUnreachable& e) {
    LOG(ERROR) << "AdminClient: " << request.method << " " << request.target
               << ": " << e.what();
    throw;
  }
}

Response AdminClient::expectOk(const Request& request,
                               const CancelToken* cancel) const {
  Response response = exchange(request, cancel);
  if (response.status != http::S_200_OK) {
    std::string message = errorMessage(response.body);
    LOG(ERROR) << "AdminClient: " << request.method << " " << request.target
               << " -> " << response.status << ": " << message;
    throw AdminError(response.status, message);
  }
  return response;
}

Request AdminClient::caddyfileRequest(const std::string& path,
                                      const std::string& caddyfile) const {
  Request request("POST", path);
  request.setBody(caddyfile, CADDYFILE_CONTENT_TYPE);
  return request;
}

void AdminClient::load(const std::string& caddyfile,
                       const CancelToken* cancel) const {
  expectOk(caddyfileRequest("/load", caddyfile), cancel);
  LOG(INFO) << "AdminClient: configuration loaded into " << base_.serialize();
}

std::string AdminClient::adapt(const std::string& caddyfile,
                               const CancelToken* cancel) const {
  Request request = caddyfileRequest("/adapt", caddyfile);
  Response response = exchange(request, cancel);
  if (!http::isSuccess(response.status)) {
    std::string message = errorMessage(response.body);
    LOG(DEBUG) << "AdminClient: adapt rejected (" << response.status
               << "): " << message;
    throw AdminError(response.status, message);
  }
  return response.body;
}

std::string AdminClient::getConfig(const CancelToken* cancel) const {
  Request request("GET", "/config/");
  request.addHeader("Accept", "application/json");
  return expectOk(request, cancel).body;
}

CaddyStatus AdminClient::getStatus(const CancelToken* cancel) const {
  CaddyStatus status;
  Response response;
  try {
    response = http_.send(Request("GET", "/config/"), timeout_ms_, cancel);
  } catch (const AdminUnreachable& e) {
    LOG(DEBUG) << "AdminClient: caddy is not running: " << e.what();
    return status;
  }
  status.running = true;
  std::string server;
  if (response.getHeader("Server", server)) {
    status.version = server;
  }
  return status;
}

void AdminClient::ping(const CancelToken* cancel) const {
  exchange(Request("GET", "/config/"), cancel);
}

void AdminClient::stop(const CancelToken* cancel) const {
  expectOk(Request("POST", "/stop"), cancel);
  LOG(INFO) << "AdminClient: stop requested";
}

CAInfo AdminClient::getPKICAInfo(const std::string& ca_id,
                                 const CancelToken* cancel) const {
  Request request("GET", "/pki/ca/" + http::Url::encode(ca_id));
  request.addHeader("Accept", "application/json");
  Response response = exchange(request, cancel);

  CAInfo info;
  if (response.status == http::S_404_NOT_FOUND) {
    LOG(DEBUG) << "AdminClient: CA '" << ca_id << "' is not provisioned";
    info.id = ca_id;
    return info;
  }
  if (response.status != http::S_200_OK) {
    std::string message = errorMessage(response.body);
    LOG(ERROR) << "AdminClient: GET " << request.target << " -> "
               << response.status << ": " << message;
    throw AdminError(response.status, message);
  }

  try {
    nlohmann::json::parse(response.body).get_to(info);
  } catch (const nlohmann::json::exception& e) {
    LOG(ERROR) << "AdminClient: cannot parse CA info: " << e.what();
    throw std::runtime_error(std::string("cannot parse CA info: ") +
                             e.what());
  }
  info.provisioned = true;
  return info;
}
