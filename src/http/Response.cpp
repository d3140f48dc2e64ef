#include "Response.hpp"

#include <sstream>

#include "HttpStatus.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace {

// Largest chunk accepted from a peer
const std::string::size_type kMaxChunkSize = 1u << 30;

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

bool parseChunkSize(const std::string& line, std::string::size_type& out) {
  std::string digits = trim_copy(line.substr(0, line.find(';')));
  if (digits.empty()) {
    return false;
  }
  out = 0;
  for (std::string::size_type i = 0; i < digits.size(); ++i) {
    int v = hexValue(digits[i]);
    if (v < 0) {
      return false;
    }
    out = out * 16 + static_cast<std::string::size_type>(v);
    if (out > kMaxChunkSize) {
      return false;
    }
  }
  return true;
}

}  // namespace

Response::Response() : Message(), version(HTTP_VERSION), status(0), reason() {}

Response::Response(const Response& other)
    : Message(other),
      version(other.version),
      status(other.status),
      reason(other.reason) {}

Response& Response::operator=(const Response& other) {
  if (this != &other) {
    Message::operator=(other);
    version = other.version;
    status = other.status;
    reason = other.reason;
  }
  return *this;
}

Response::~Response() {}

std::string Response::startLine() const {
  std::ostringstream o;
  o << version << " " << status << " " << reason;
  return o.str();
}

bool Response::parseStatusLine(const std::string& line) {
  std::istringstream in(line);
  int code = 0;
  if (!(in >> version >> code)) {
    return false;
  }
  if (!starts_with(version, "HTTP/") || !http::isValidStatusCode(code)) {
    return false;
  }
  status = code;
  std::getline(in, reason);
  reason = trim_copy(reason);
  return true;
}

Response::ParseResult Response::parse(const std::string& raw, bool eof) {
  clearHeaders();
  body.clear();
  status = 0;
  reason.clear();

  std::string::size_type header_end = raw.find("\r\n\r\n");
  std::string::size_type body_start = header_end + 4;
  if (header_end == std::string::npos) {
    header_end = raw.find("\n\n");
    body_start = header_end + 2;
  }
  if (header_end == std::string::npos) {
    return eof ? PARSE_ERROR : PARSE_INCOMPLETE;
  }

  std::vector<std::string> lines = split_lines(raw.substr(0, header_end));
  if (lines.empty() || !parseStatusLine(lines[0])) {
    return PARSE_ERROR;
  }
  for (std::vector<std::string>::size_type i = 1; i < lines.size(); ++i) {
    Header h;
    if (!parseHeaderLine(lines[i], h)) {
      return PARSE_ERROR;
    }
    headers_.push_back(h);
  }

  if (http::hasNoBody(status)) {
    return PARSE_DONE;
  }

  std::string rest = raw.substr(body_start);
  std::string value;
  if (getHeader("Transfer-Encoding", value) &&
      find_ci(value, "chunked") != std::string::npos) {
    ParseResult res = decodeChunked(rest, body);
    if (res == PARSE_INCOMPLETE && eof) {
      return PARSE_ERROR;
    }
    return res;
  }

  if (getHeader("Content-Length", value)) {
    int length;
    if (!parse_uint(value, length)) {
      return PARSE_ERROR;
    }
    if (rest.size() < static_cast<std::string::size_type>(length)) {
      return eof ? PARSE_ERROR : PARSE_INCOMPLETE;
    }
    body = rest.substr(0, length);
    return PARSE_DONE;
  }

  if (!eof) {
    return PARSE_INCOMPLETE;
  }
  body = rest;
  return PARSE_DONE;
}

Response::ParseResult Response::decodeChunked(const std::string& data,
                                              std::string& out) {
  out.clear();
  std::string::size_type pos = 0;
  while (true) {
    std::string::size_type line_end = data.find(CRLF, pos);
    if (line_end == std::string::npos) {
      return PARSE_INCOMPLETE;
    }
    std::string::size_type size;
    if (!parseChunkSize(data.substr(pos, line_end - pos), size)) {
      return PARSE_ERROR;
    }
    pos = line_end + 2;

    if (size == 0) {
      // Optional trailers, then an empty line
      if (data.compare(pos, 2, CRLF) == 0) {
        return PARSE_DONE;
      }
      return data.find("\r\n\r\n", pos) == std::string::npos ? PARSE_INCOMPLETE
                                                              : PARSE_DONE;
    }

    if (data.size() < pos + size + 2) {
      return PARSE_INCOMPLETE;
    }
    if (data.compare(pos + size, 2, CRLF) != 0) {
      return PARSE_ERROR;
    }
    out.append(data, pos, size);
    pos += size + 2;
  }
}
