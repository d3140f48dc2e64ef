#include "utils.hpp"

#include <fcntl.h>
#include <time.h>

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

int set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return -1;
  }
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int set_cloexec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  if (flags < 0) {
    return -1;
  }
  return fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Trim whitespace from both ends of a string and return the trimmed copy.
std::string trim_copy(const std::string& s) {
  std::string::size_type begin = 0;
  while (begin < s.size() &&
         std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  std::string::size_type end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

std::string to_lower_copy(const std::string& s) {
  std::string res = s;
  for (std::string::size_type i = 0; i < res.size(); ++i) {
    res[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res[i])));
  }
  return res;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string::size_type find_ci(const std::string& haystack,
                               const std::string& needle,
                               std::string::size_type from) {
  return to_lower_copy(haystack).find(to_lower_copy(needle), from);
}

std::string join(const std::vector<std::string>& parts,
                 const std::string& separator) {
  std::string res;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) {
      res += separator;
    }
    res += parts[i];
  }
  return res;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::string::size_type start = 0;
  while (start <= text.size()) {
    std::string::size_type nl = text.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

bool parse_uint(const std::string& s, int& out) {
  if (s.empty()) {
    return false;
  }
  long value = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    value = value * 10 + (s[i] - '0');
    if (value > INT_MAX) {
      return false;
    }
  }
  out = static_cast<int>(value);
  return true;
}

long long monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<long long>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

bool deadline_expired(long long deadline) {
  return deadline != 0 && monotonic_ms() >= deadline;
}

int remaining_ms(long long deadline, int cap) {
  if (deadline == 0) {
    return cap;
  }
  long long left = deadline - monotonic_ms();
  if (left < 0) {
    left = 0;
  }
  if (cap >= 0 && left > cap) {
    left = cap;
  }
  return left > INT_MAX ? INT_MAX : static_cast<int>(left);
}

int parseLogLevelFlag(const std::string& arg) {
  // expected form: -l:N where N is 0, 1 or 2
  if (arg.size() != 4 || arg.compare(0, 3, "-l:") != 0) {
    throw std::invalid_argument("Invalid log level flag: " + arg);
  }
  char level = arg[3];
  if (level < '0' || level > '2') {
    throw std::invalid_argument("Log level must be 0 (DEBUG), 1 (INFO) or 2 "
                                "(ERROR): " + arg);
  }
  return level - '0';
}
