#pragma once

#include <string>

namespace http {

/**
 * Base URL of an HTTP endpoint such as the Caddy admin API.
 *
 * Accepts "http://host[:port][/prefix]". The host may be a bracketed IPv6
 * literal. The port defaults to 80. A path prefix is kept (without its
 * trailing '/') and prepended to every request path by resolve().
 * Query strings and fragments are not meaningful for a base URL and are
 * dropped.
 */
class Url {
 public:
  Url();
  explicit Url(const std::string& url);
  Url(const Url& other);
  Url& operator=(const Url& other);
  ~Url();

  /**
   * Parse a base URL.
   * @return false (and isValid() == false) for other schemes, an empty
   *         host or a bad port
   */
  bool parse(const std::string& url);

  /**
   * Serialize back to "http://host:port/prefix".
   */
  std::string serialize() const;

  /**
   * Request target for `path` below this base, e.g. base
   * "http://h:2019/api" and path "/load" give "/api/load".
   */
  std::string resolve(const std::string& path) const;

  /**
   * Value for the Host header: "host" on port 80, "host:port" otherwise.
   */
  std::string hostHeader() const;

  bool isValid() const;

  /**
   * URL-encode a string (percent-encoding), for use as a path segment.
   */
  static std::string encode(const std::string& str);

  std::string getScheme() const;
  std::string getHost() const;
  int getPort() const;
  std::string getPath() const;

 private:
  std::string scheme_;
  std::string host_;
  int port_;
  std::string path_;
  bool valid_;

  static char intToHex(int n);
};

}  // namespace http
