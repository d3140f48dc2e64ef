#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

class CancelToken;

struct ProcessResult {
  ProcessResult();

  int exit_status;  // exit code, or 128 + signal number
  std::string out;
  std::string err;
};

// Runs a child process to completion, feeding `input` on its stdin and
// collecting stdout and stderr separately. All waiting happens in one epoll
// loop over the child's pipes and the cancel token, bounded by a deadline.
// On timeout or cancellation the child is killed with SIGKILL and reaped
// before run() throws.
//
//   std::vector<std::string> argv;
//   argv.push_back("caddy");
//   argv.push_back("version");
//   ProcessResult res = Subprocess(argv).run("", 5000, NULL);
class Subprocess {
 public:
  explicit Subprocess(const std::vector<std::string>& argv);
  ~Subprocess();

  // Throws ProcessError: NOT_FOUND when the executable is missing,
  // SPAWN_FAILED, TIMED_OUT, CANCELLED or IO_FAILED otherwise.
  ProcessResult run(const std::string& input, int timeout_ms,
                    const CancelToken* cancel);

 private:
  Subprocess(const Subprocess& other);
  Subprocess& operator=(const Subprocess& other);

  void spawn();
  void pump(const std::string& input, long long deadline,
            const CancelToken* cancel, ProcessResult& result);
  int reap(long long deadline, const CancelToken* cancel);
  void killChild();
  void cleanupProcess();

  std::vector<std::string> argv_;
  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  int epoll_fd_;
};
