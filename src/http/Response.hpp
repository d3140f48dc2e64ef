#pragma once

#include <string>

#include "Message.hpp"

// An HTTP/1.1 response as received by the client.
class Response : public Message {
 public:
  enum ParseResult { PARSE_INCOMPLETE, PARSE_DONE, PARSE_ERROR };

  Response();
  Response(const Response& other);
  Response& operator=(const Response& other);
  virtual ~Response();

  std::string version;
  int status;
  std::string reason;

  virtual std::string startLine() const;
  bool parseStatusLine(const std::string& line);

  // Parses everything received so far. `eof` is true once the peer closed
  // the connection. The body is framed by chunked transfer encoding,
  // Content-Length, or the end of the connection, in that order.
  // PARSE_INCOMPLETE means more bytes are needed.
  ParseResult parse(const std::string& raw, bool eof);

  static ParseResult decodeChunked(const std::string& data, std::string& out);
};
