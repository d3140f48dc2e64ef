#include "Message.hpp"

#include <cctype>
#include <sstream>

#include "constants.hpp"
#include "utils.hpp"

namespace {
bool ci_equal_copy(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::string::size_type i = 0; i < a.size(); ++i) {
    char ca = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
    char cb = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
    if (ca != cb) {
      return false;
    }
  }
  return true;
}
}  // namespace

/* Header */
Header::Header() : name(), value() {}

Header::Header(const std::string& n, const std::string& v)
    : name(n), value(v) {}

Header::Header(const Header& other) : name(other.name), value(other.value) {}

Header& Header::operator=(const Header& other) {
  if (this != &other) {
    name = other.name;
    value = other.value;
  }
  return *this;
}

Header::~Header() {}

/* Message */
Message::Message() : body(), headers_() {}

Message::Message(const Message& other)
    : body(other.body), headers_(other.headers_) {}

Message& Message::operator=(const Message& other) {
  if (this != &other) {
    body = other.body;
    headers_ = other.headers_;
  }
  return *this;
}

Message::~Message() {}

void Message::addHeader(const std::string& name, const std::string& value) {
  headers_.push_back(Header(name, value));
}

void Message::setHeader(const std::string& name, const std::string& value) {
  std::vector<Header>::iterator it = headers_.begin();
  while (it != headers_.end()) {
    if (ci_equal_copy(it->name, name)) {
      it = headers_.erase(it);
    } else {
      ++it;
    }
  }
  headers_.push_back(Header(name, value));
}

bool Message::getHeader(const std::string& name, std::string& out) const {
  for (std::vector<Header>::const_iterator it = headers_.begin();
       it != headers_.end(); ++it) {
    if (ci_equal_copy(it->name, name)) {
      out = it->value;
      return true;
    }
  }
  return false;
}

bool Message::hasHeader(const std::string& name) const {
  std::string ignored;
  return getHeader(name, ignored);
}

std::vector<std::string> Message::getHeaders(const std::string& name) const {
  std::vector<std::string> res;
  for (std::vector<Header>::const_iterator it = headers_.begin();
       it != headers_.end(); ++it) {
    if (ci_equal_copy(it->name, name)) {
      res.push_back(it->value);
    }
  }
  return res;
}

const std::vector<Header>& Message::headers() const {
  return headers_;
}

void Message::clearHeaders() {
  headers_.clear();
}

std::string Message::serializeHeaders() const {
  std::ostringstream o;
  for (std::vector<Header>::const_iterator it = headers_.begin();
       it != headers_.end(); ++it) {
    o << it->name << ": " << it->value << CRLF;
  }
  return o.str();
}

bool Message::parseHeaderLine(const std::string& line, Header& out) {
  std::string::size_type pos = line.find(':');
  if (pos == std::string::npos || pos == 0) {
    return false;
  }
  out.name = trim_copy(line.substr(0, pos));
  out.value = trim_copy(line.substr(pos + 1));
  return !out.name.empty();
}

std::string Message::serialize() const {
  std::ostringstream o;
  o << startLine() << CRLF;
  o << serializeHeaders();
  o << CRLF;
  o << body;
  return o.str();
}
