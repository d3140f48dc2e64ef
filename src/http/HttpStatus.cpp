#include "HttpStatus.hpp"

#include <sstream>

namespace http {

std::string reasonPhrase(int status) {
  switch (status) {
    case S_100_CONTINUE:
      return "Continue";
    case S_200_OK:
      return "OK";
    case S_201_CREATED:
      return "Created";
    case S_204_NO_CONTENT:
      return "No Content";
    case S_304_NOT_MODIFIED:
      return "Not Modified";
    case S_400_BAD_REQUEST:
      return "Bad Request";
    case S_401_UNAUTHORIZED:
      return "Unauthorized";
    case S_403_FORBIDDEN:
      return "Forbidden";
    case S_404_NOT_FOUND:
      return "Not Found";
    case S_405_METHOD_NOT_ALLOWED:
      return "Method Not Allowed";
    case S_409_CONFLICT:
      return "Conflict";
    case S_412_PRECONDITION_FAILED:
      return "Precondition Failed";
    case S_413_PAYLOAD_TOO_LARGE:
      return "Payload Too Large";
    case S_415_UNSUPPORTED_MEDIA_TYPE:
      return "Unsupported Media Type";
    case S_500_INTERNAL_SERVER_ERROR:
      return "Internal Server Error";
    case S_502_BAD_GATEWAY:
      return "Bad Gateway";
    case S_503_SERVICE_UNAVAILABLE:
      return "Service Unavailable";
    case S_504_GATEWAY_TIMEOUT:
      return "Gateway Timeout";
    default:
      return "Unknown";
  }
}

std::string statusWithReason(int status) {
  std::ostringstream oss;
  oss << status << " " << reasonPhrase(status);
  return oss.str();
}

bool isInformational(int status) {
  return status >= 100 && status < 200;
}

bool isSuccess(int status) {
  return status >= 200 && status < 300;
}

bool isClientError(int status) {
  return status >= 400 && status < 500;
}

bool isServerError(int status) {
  return status >= 500 && status < 600;
}

bool hasNoBody(int status) {
  return isInformational(status) || status == S_204_NO_CONTENT ||
         status == S_304_NOT_MODIFIED;
}

bool isValidStatusCode(int status) {
  return status >= 100 && status <= 599;
}

}  // namespace http
