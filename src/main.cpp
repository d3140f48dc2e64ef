#include <cstdlib>
#include <iostream>
#include <string>

#include "CancelToken.hpp"
#include "Commands.hpp"
#include "Logger.hpp"
#include "Options.hpp"
#include "constants.hpp"
#include "signals.hpp"

int main(int argc, char** argv) {
  // run `./caddyshack -l:N <command>` to choose the log level
  // 0 = DEBUG, 1 = INFO, 2 = ERROR

  Options opts;
  try {
    processArgs(argc, argv, opts);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error processing command-line arguments: " << e.what();
    std::cerr << usage();
    return EXIT_USAGE;
  }

  Logger::setLevel(static_cast<Logger::LogLevel>(opts.log_level));

  if (opts.show_help) {
    std::cout << usage();
    return EXIT_OK;
  }
  if (opts.command.empty()) {
    std::cerr << usage();
    return EXIT_USAGE;
  }

  try {
    CancelToken token;
    setup_signal_handlers(&token);
    int status = CommandRunner(opts, std::cout, &token).run();
    restore_signal_handlers();
    std::cout.flush();
    return status;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error while running '" << opts.command << "': " << e.what();
    restore_signal_handlers();
    return EXIT_USAGE;
  }
}
