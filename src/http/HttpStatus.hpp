#pragma once

#include <string>

namespace http {

// Status codes the admin API is known to answer with. Responses may carry
// any other code; the helpers below take plain ints for that reason.
enum Status {
  S_0_UNKNOWN = 0,
  S_100_CONTINUE = 100,
  // 2xx Success
  S_200_OK = 200,
  S_201_CREATED = 201,
  S_204_NO_CONTENT = 204,
  // 3xx Redirection
  S_304_NOT_MODIFIED = 304,
  // 4xx Client Errors
  S_400_BAD_REQUEST = 400,
  S_401_UNAUTHORIZED = 401,
  S_403_FORBIDDEN = 403,
  S_404_NOT_FOUND = 404,
  S_405_METHOD_NOT_ALLOWED = 405,
  S_409_CONFLICT = 409,
  S_412_PRECONDITION_FAILED = 412,
  S_413_PAYLOAD_TOO_LARGE = 413,
  S_415_UNSUPPORTED_MEDIA_TYPE = 415,
  // 5xx Server Errors
  S_500_INTERNAL_SERVER_ERROR = 500,
  S_502_BAD_GATEWAY = 502,
  S_503_SERVICE_UNAVAILABLE = 503,
  S_504_GATEWAY_TIMEOUT = 504
};

// "Unknown" for codes not listed in Status.
std::string reasonPhrase(int status);

// e.g. "404 Not Found"
std::string statusWithReason(int status);

// Classification helpers
bool isInformational(int status);
bool isSuccess(int status);
bool isClientError(int status);
bool isServerError(int status);

// A response to this status never carries a body.
bool hasNoBody(int status);

// Check if status code (int) is within valid HTTP status code range
bool isValidStatusCode(int status);

}  // namespace http
