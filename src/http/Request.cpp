#include "Request.hpp"

#include <sstream>

#include "constants.hpp"

Request::Request() : Message(), method("GET"), target("/") {}

Request::Request(const std::string& m, const std::string& t)
    : Message(), method(m), target(t) {}

Request::Request(const Request& other)
    : Message(other), method(other.method), target(other.target) {}

Request& Request::operator=(const Request& other) {
  if (this != &other) {
    Message::operator=(other);
    method = other.method;
    target = other.target;
  }
  return *this;
}

Request::~Request() {}

void Request::setBody(const std::string& data,
                      const std::string& content_type) {
  body = data;
  setHeader("Content-Type", content_type);
  std::ostringstream oss;
  oss << body.size();
  setHeader("Content-Length", oss.str());
}

std::string Request::startLine() const {
  return method + " " + target + " " + HTTP_VERSION;
}

std::string Request::serialize() const {
  std::ostringstream o;
  o << startLine() << CRLF;
  o << serializeHeaders();
  if (!hasHeader("Content-Length") &&
      (!body.empty() || method == "POST" || method == "PUT")) {
    o << "Content-Length: " << body.size() << CRLF;
  }
  o << CRLF;
  o << body;
  return o.str();
}
