#include "AdminValidator.hpp"

#include <sstream>

#include "ConfigFile.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

AdminValidator::AdminValidator(const AdminClient& client)
    : client_(client), decoder_() {}

AdminValidator::~AdminValidator() {}

std::string AdminValidator::name() const {
  return "admin API (" + client_.baseUrl().serialize() + ")";
}

ValidationResult AdminValidator::validateContent(const std::string& content,
                                                 const CancelToken* cancel) {
  try {
    client_.adapt(content, cancel);
  } catch (const AdminError& e) {
    std::ostringstream status;
    status << "HTTP status " << e.status();
    ValidationResult result = decoder_.failure(e.message(), "", status.str());
    LOG(INFO) << "AdminValidator: configuration is invalid (" << status.str()
              << ", " << result.errors().size() << " error(s))";
    return result;
  }
  LOG(INFO) << "AdminValidator: configuration is valid";
  return ValidationResult::valid();
}

ValidationResult AdminValidator::validateFile(const std::string& path,
                                              const CancelToken* cancel) {
  return validateContent(ConfigFile(path).read(), cancel);
}
