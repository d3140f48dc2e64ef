#include "DiagnosticDecoder.hpp"

#include <cctype>

#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string::size_type skipSpaces(const std::string& s,
                                  std::string::size_type i) {
  while (i < s.size() && isSpace(s[i])) {
    ++i;
  }
  return i;
}

std::string::size_type skipDigits(const std::string& s,
                                  std::string::size_type i) {
  while (i < s.size() && isDigit(s[i])) {
    ++i;
  }
  return i;
}

}  // namespace

DiagnosticDecoder::DiagnosticDecoder()
    : source_name_(CADDYFILE_SOURCE_NAME) {}

DiagnosticDecoder::DiagnosticDecoder(const std::string& source_name)
    : source_name_(source_name) {}

const std::string& DiagnosticDecoder::sourceName() const {
  return source_name_;
}

ValidationErrorList DiagnosticDecoder::decode(const std::string& output) const {
  ValidationErrorList errors;
  std::vector<std::string> lines = split_lines(output);
  for (std::vector<std::string>::const_iterator it = lines.begin();
       it != lines.end(); ++it) {
    std::string line = trim_copy(*it);
    if (line.empty()) {
      continue;
    }
    ValidationError err;
    if (decodeLine(line, err)) {
      errors.push_back(err);
    }
  }
  LOG(DEBUG) << "DiagnosticDecoder: " << errors.size() << " error(s) from "
             << lines.size() << " line(s)";
  return errors;
}

bool DiagnosticDecoder::decodeLine(const std::string& raw,
                                   ValidationError& out) const {
  std::string line = trim_copy(raw);
  if (line.empty()) {
    return false;
  }
  if (matchSourceMarker(line, out) || matchLinePrefix(line, out) ||
      matchErrorAt(line, out)) {
    return true;
  }
  if (mentionsError(line)) {
    out = ValidationError(0, line);
    return true;
  }
  return false;
}

// "<source>:NN" then optional spaces, '-' or ':', optional spaces, message.
bool DiagnosticDecoder::matchSourceMarker(const std::string& line,
                                          ValidationError& out) const {
  if (source_name_.empty()) {
    return false;
  }
  const std::string marker = source_name_ + ":";
  std::string::size_type pos = 0;
  while ((pos = find_ci(line, marker, pos)) != std::string::npos) {
    std::string::size_type digits = pos + marker.size();
    std::string::size_type i = skipDigits(line, digits);
    if (i > digits) {
      i = skipSpaces(line, i);
      if (i < line.size() && (line[i] == '-' || line[i] == ':')) {
        std::string message = trim_copy(line.substr(i + 1));
        int number;
        if (!message.empty() &&
            parse_uint(line.substr(digits, skipDigits(line, digits) - digits),
                       number)) {
          out = ValidationError(number, message);
          return true;
        }
      }
    }
    ++pos;
  }
  return false;
}

// "line NN: message"
bool DiagnosticDecoder::matchLinePrefix(const std::string& line,
                                        ValidationError& out) {
  std::string::size_type pos = 0;
  while ((pos = find_ci(line, "line", pos)) != std::string::npos) {
    std::string::size_type digits = skipSpaces(line, pos + 4);
    if (digits > pos + 4) {
      std::string::size_type i = skipDigits(line, digits);
      if (i > digits && i < line.size() && line[i] == ':') {
        std::string message = trim_copy(line.substr(i + 1));
        int number;
        if (!message.empty() &&
            parse_uint(line.substr(digits, i - digits), number)) {
          out = ValidationError(number, message);
          return true;
        }
      }
    }
    ++pos;
  }
  return false;
}

// "error: message at <anything>:NN", message as short as possible.
bool DiagnosticDecoder::matchErrorAt(const std::string& line,
                                     ValidationError& out) {
  std::string::size_type pos = 0;
  while ((pos = find_ci(line, "error:", pos)) != std::string::npos) {
    std::string::size_type msg_begin = skipSpaces(line, pos + 6);
    for (std::string::size_type end = msg_begin + 1; end < line.size();
         ++end) {
      if (!isSpace(line[end])) {
        continue;
      }
      std::string::size_type at = skipSpaces(line, end);
      if (at + 2 >= line.size() || to_lower_copy(line.substr(at, 2)) != "at" ||
          !isSpace(line[at + 2])) {
        continue;
      }
      for (std::string::size_type colon = line.find(':', at + 3);
           colon != std::string::npos; colon = line.find(':', colon + 1)) {
        std::string::size_type digits_end = skipDigits(line, colon + 1);
        if (digits_end == colon + 1) {
          continue;
        }
        std::string message = trim_copy(line.substr(msg_begin, end - msg_begin));
        int number;
        if (message.empty() ||
            !parse_uint(line.substr(colon + 1, digits_end - colon - 1),
                        number)) {
          break;
        }
        out = ValidationError(number, message);
        return true;
      }
    }
    ++pos;
  }
  return false;
}

bool DiagnosticDecoder::mentionsError(const std::string& line) {
  static const char* const kWords[] = {"error", "invalid", "unknown",
                                       "unrecognized", "expected"};
  for (size_t i = 0; i < sizeof(kWords) / sizeof(kWords[0]); ++i) {
    if (find_ci(line, kWords[i]) != std::string::npos) {
      return true;
    }
  }
  return false;
}

ValidationResult DiagnosticDecoder::failure(
    const std::string& diagnostics, const std::string& fallback_text,
    const std::string& status_text) const {
  ValidationErrorList errors = decode(diagnostics);
  if (errors.empty()) {
    std::string message = trim_copy(diagnostics);
    if (message.empty()) {
      message = trim_copy(fallback_text);
    }
    if (message.empty()) {
      message = status_text;
    }
    errors.push_back(ValidationError(0, message));
  }
  return ValidationResult::invalid(errors);
}
