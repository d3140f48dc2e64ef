#pragma once

#include <string>

#include "Request.hpp"
#include "Response.hpp"
#include "Url.hpp"

class CancelToken;

// Minimal HTTP/1.1 client: one request per connection ("Connection:
// close"), plain TCP, http scheme only. Connecting, sending and receiving
// share one deadline and all wait in epoll together with the cancel token.
class HttpClient {
 public:
  explicit HttpClient(const http::Url& base);
  HttpClient(const HttpClient& other);
  HttpClient& operator=(const HttpClient& other);
  ~HttpClient();

  // Sends `request` with its target resolved below the base URL and
  // returns the response, whatever its status. timeout_ms 0 means no
  // deadline; `cancel` may be NULL.
  // Throws AdminUnreachable if no complete response arrives.
  Response send(const Request& request, int timeout_ms,
                const CancelToken* cancel) const;

  const http::Url& baseUrl() const;

 private:
  http::Url base_;
};
