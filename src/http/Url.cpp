#include "Url.hpp"

#include <cctype>
#include <sstream>

#include "utils.hpp"

namespace http {

Url::Url() : port_(-1), valid_(false) {}

Url::Url(const std::string& url) : port_(-1), valid_(false) {
  parse(url);
}

Url::Url(const Url& other)
    : scheme_(other.scheme_),
      host_(other.host_),
      port_(other.port_),
      path_(other.path_),
      valid_(other.valid_) {}

Url& Url::operator=(const Url& other) {
  if (this != &other) {
    scheme_ = other.scheme_;
    host_ = other.host_;
    port_ = other.port_;
    path_ = other.path_;
    valid_ = other.valid_;
  }
  return *this;
}

Url::~Url() {}

bool Url::parse(const std::string& url) {
  scheme_.clear();
  host_.clear();
  port_ = -1;
  path_.clear();
  valid_ = false;

  std::string remaining = trim_copy(url);
  std::size_t pos = remaining.find("://");
  if (pos == std::string::npos) {
    return false;
  }
  scheme_ = to_lower_copy(remaining.substr(0, pos));
  if (scheme_ != "http") {
    return false;
  }
  remaining = remaining.substr(pos + 3);

  // Drop query and fragment
  pos = remaining.find_first_of("?#");
  if (pos != std::string::npos) {
    remaining = remaining.substr(0, pos);
  }

  std::string authority;
  std::size_t path_start = remaining.find('/');
  if (path_start != std::string::npos) {
    authority = remaining.substr(0, path_start);
    path_ = remaining.substr(path_start);
  } else {
    authority = remaining;
  }
  while (!path_.empty() && path_[path_.size() - 1] == '/') {
    path_.erase(path_.size() - 1);
  }

  std::string port_str;
  if (!authority.empty() && authority[0] == '[') {
    std::size_t close = authority.find(']');
    if (close == std::string::npos) {
      return false;
    }
    host_ = authority.substr(1, close - 1);
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') {
        return false;
      }
      port_str = rest.substr(1);
    }
  } else {
    std::size_t port_pos = authority.rfind(':');
    if (port_pos != std::string::npos) {
      host_ = authority.substr(0, port_pos);
      port_str = authority.substr(port_pos + 1);
    } else {
      host_ = authority;
    }
  }
  if (host_.empty()) {
    return false;
  }

  if (port_str.empty()) {
    port_ = 80;
  } else if (!parse_uint(port_str, port_) || port_ < 1 || port_ > 65535) {
    port_ = -1;
    return false;
  }

  valid_ = true;
  return true;
}

std::string Url::serialize() const {
  std::ostringstream oss;
  oss << scheme_ << "://";
  if (host_.find(':') != std::string::npos) {
    oss << "[" << host_ << "]";
  } else {
    oss << host_;
  }
  oss << ":" << port_ << path_;
  return oss.str();
}

std::string Url::resolve(const std::string& path) const {
  if (path.empty()) {
    return path_.empty() ? "/" : path_;
  }
  if (path[0] != '/') {
    return path_ + "/" + path;
  }
  return path_ + path;
}

std::string Url::hostHeader() const {
  std::string host = host_;
  if (host.find(':') != std::string::npos) {
    host = "[" + host + "]";
  }
  if (port_ == 80) {
    return host;
  }
  std::ostringstream oss;
  oss << host << ":" << port_;
  return oss.str();
}

bool Url::isValid() const {
  return valid_;
}

std::string Url::getScheme() const {
  return scheme_;
}

std::string Url::getHost() const {
  return host_;
}

int Url::getPort() const {
  return port_;
}

std::string Url::getPath() const {
  return path_;
}

char Url::intToHex(int n) {
  if (n >= 0 && n <= 9) {
    return static_cast<char>('0' + n);
  }
  if (n >= 10 && n <= 15) {
    return static_cast<char>('A' + n - 10);
  }
  return '0';
}

std::string Url::encode(const std::string& str) {
  std::string result;
  result.reserve(str.size() * 3);  // Worst case: all characters need encoding

  for (std::size_t i = 0; i < str.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(str[i]);

    // Unreserved characters (RFC 3986)
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      result += static_cast<char>(c);
    } else {
      result += '%';
      result += intToHex((c >> 4) & 0x0F);
      result += intToHex(c & 0x0F);
    }
  }

  return result;
}

}  // namespace http
