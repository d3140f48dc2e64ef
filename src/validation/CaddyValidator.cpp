#include "CaddyValidator.hpp"

#include <sstream>

#include "Errors.hpp"
#include "Logger.hpp"
#include "Subprocess.hpp"
#include "constants.hpp"

CaddyValidator::CaddyValidator()
    : binary_(DEFAULT_CADDY_BINARY),
      timeout_ms_(DEFAULT_VALIDATE_TIMEOUT_SEC * 1000),
      decoder_() {}

CaddyValidator::CaddyValidator(const std::string& binary, int timeout_ms)
    : binary_(binary), timeout_ms_(timeout_ms), decoder_() {}

CaddyValidator::~CaddyValidator() {}

std::string CaddyValidator::name() const {
  return "caddy binary (" + binary_ + ")";
}

const std::string& CaddyValidator::binary() const {
  return binary_;
}

int CaddyValidator::timeoutMs() const {
  return timeout_ms_;
}

ValidationResult CaddyValidator::validateContent(const std::string& content,
                                                 const CancelToken* cancel) {
  std::vector<std::string> argv;
  argv.push_back(binary_);
  argv.push_back("adapt");
  argv.push_back("--config");
  argv.push_back("-");
  argv.push_back("--adapter");
  argv.push_back("caddyfile");
  argv.push_back("--validate");
  return run(argv, content, cancel);
}

ValidationResult CaddyValidator::validateFile(const std::string& path,
                                              const CancelToken* cancel) {
  std::vector<std::string> argv;
  argv.push_back(binary_);
  argv.push_back("validate");
  argv.push_back("--config");
  argv.push_back(path);
  return run(argv, "", cancel);
}

ValidationResult CaddyValidator::run(const std::vector<std::string>& argv,
                                     const std::string& input,
                                     const CancelToken* cancel) {
  ProcessResult res;
  try {
    res = Subprocess(argv).run(input, timeout_ms_, cancel);
  } catch (const ProcessError& e) {
    LOG(ERROR) << "CaddyValidator: cannot validate: " << e.what();
    throw ValidationUnavailable(std::string("cannot run validator: ") +
                                e.what());
  }

  if (res.exit_status == 0) {
    LOG(INFO) << "CaddyValidator: configuration is valid";
    return ValidationResult::valid();
  }

  std::ostringstream status;
  status << "exit status " << res.exit_status;
  ValidationResult result = decoder_.failure(res.err, res.out, status.str());
  LOG(INFO) << "CaddyValidator: configuration is invalid (" << status.str()
            << ", " << result.errors().size() << " error(s))";
  return result;
}
