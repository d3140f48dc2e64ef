#pragma once

#include <string>

#include "Message.hpp"

// An outgoing HTTP/1.1 request. `target` is the origin-form path.
class Request : public Message {
 public:
  Request();
  Request(const std::string& method, const std::string& target);
  Request(const Request& other);
  Request& operator=(const Request& other);
  virtual ~Request();

  std::string method;
  std::string target;

  // Sets the body together with its Content-Type and Content-Length.
  void setBody(const std::string& data, const std::string& content_type);

  virtual std::string startLine() const;
  // Adds Content-Length when the body is non-empty or the method is POST
  // or PUT and no length was set yet.
  virtual std::string serialize() const;
};
