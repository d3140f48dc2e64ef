#include "Subprocess.hpp"

#include <fcntl.h>
#include <pthread.h>
#include <sys/epoll.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include "CancelToken.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace {

void closeFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void closePipe(int fds[2]) {
  closeFd(fds[0]);
  closeFd(fds[1]);
}

int decodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Writing to a child that exited without reading its stdin raises SIGPIPE.
// Keep it blocked on this thread while the pipes are in use and discard any
// instance raised meanwhile, so the caller sees EPIPE instead of dying.
class SigpipeBlock {
 public:
  SigpipeBlock() : was_pending_(false) {
    sigemptyset(&set_);
    sigaddset(&set_, SIGPIPE);
    sigset_t pending;
    sigemptyset(&pending);
    if (sigpending(&pending) == 0) {
      was_pending_ = sigismember(&pending, SIGPIPE) == 1;
    }
    if (pthread_sigmask(SIG_BLOCK, &set_, &old_) != 0) {
      LOG(ERROR) << "Subprocess: cannot block SIGPIPE";
    }
  }

  ~SigpipeBlock() {
    if (!was_pending_) {
      struct timespec zero;
      zero.tv_sec = 0;
      zero.tv_nsec = 0;
      while (sigtimedwait(&set_, NULL, &zero) == SIGPIPE) {
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_, NULL);
  }

 private:
  sigset_t set_;
  sigset_t old_;
  bool was_pending_;
};

}  // namespace

ProcessResult::ProcessResult() : exit_status(-1), out(), err() {}

Subprocess::Subprocess(const std::vector<std::string>& argv)
    : argv_(argv),
      pid_(-1),
      stdin_fd_(-1),
      stdout_fd_(-1),
      stderr_fd_(-1),
      epoll_fd_(-1) {}

Subprocess::~Subprocess() {
  cleanupProcess();
}

void Subprocess::cleanupProcess() {
  closeFd(stdin_fd_);
  closeFd(stdout_fd_);
  closeFd(stderr_fd_);
  closeFd(epoll_fd_);
  if (pid_ > 0) {
    killChild();
  }
}

void Subprocess::killChild() {
  if (pid_ <= 0) {
    return;
  }
  if (kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
    LOG_PERROR(ERROR, "Subprocess: kill");
  }
  int status;
  while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  pid_ = -1;
}

void Subprocess::spawn() {
  if (argv_.empty()) {
    throw ProcessError(ProcessError::SPAWN_FAILED, "empty command line");
  }

  // Built before fork(): the child only calls async-signal-safe functions.
  std::vector<char*> args;
  for (size_t i = 0; i < argv_.size(); ++i) {
    args.push_back(const_cast<char*>(argv_[i].c_str()));
  }
  args.push_back(NULL);

  int to_child[2] = {-1, -1};
  int from_child[2] = {-1, -1};
  int err_child[2] = {-1, -1};
  int exec_status[2] = {-1, -1};
  if (pipe2(to_child, O_CLOEXEC) < 0 || pipe2(from_child, O_CLOEXEC) < 0 ||
      pipe2(err_child, O_CLOEXEC) < 0 || pipe2(exec_status, O_CLOEXEC) < 0) {
    int saved = errno;
    LOG_PERROR(ERROR, "Subprocess: pipe2");
    closePipe(to_child);
    closePipe(from_child);
    closePipe(err_child);
    closePipe(exec_status);
    throw ProcessError(ProcessError::SPAWN_FAILED,
                       std::string("pipe failed: ") + std::strerror(saved));
  }

  pid_ = fork();
  if (pid_ == -1) {
    int saved = errno;
    LOG_PERROR(ERROR, "Subprocess: fork");
    closePipe(to_child);
    closePipe(from_child);
    closePipe(err_child);
    closePipe(exec_status);
    throw ProcessError(ProcessError::SPAWN_FAILED,
                       std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid_ == 0) {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, NULL);
    signal(SIGPIPE, SIG_DFL);

    dup2(to_child[0], STDIN_FILENO);
    dup2(from_child[1], STDOUT_FILENO);
    dup2(err_child[1], STDERR_FILENO);

    execvp(args[0], &args[0]);

    // Only reached when exec failed: report errno to the parent.
    int code = errno;
    ssize_t n = write(exec_status[1], &code, sizeof(code));
    (void)n;
    _exit(EXIT_NOT_FOUND);
  }

  closeFd(to_child[0]);
  closeFd(from_child[1]);
  closeFd(err_child[1]);
  closeFd(exec_status[1]);
  stdin_fd_ = to_child[1];
  stdout_fd_ = from_child[0];
  stderr_fd_ = err_child[0];

  // EOF here means exec succeeded and closed the CLOEXEC write end.
  int code = 0;
  ssize_t n;
  do {
    n = read(exec_status[0], &code, sizeof(code));
  } while (n < 0 && errno == EINTR);
  closeFd(exec_status[0]);

  if (n == static_cast<ssize_t>(sizeof(code))) {
    int status;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
    cleanupProcess();
    std::string msg =
        "cannot execute " + argv_[0] + ": " + std::strerror(code);
    LOG(ERROR) << "Subprocess: " << msg;
    throw ProcessError(code == ENOENT ? ProcessError::NOT_FOUND
                                      : ProcessError::SPAWN_FAILED,
                       msg);
  }
  LOG(DEBUG) << "Subprocess: started " << argv_[0] << " (pid " << pid_
             << ")";
}

namespace {

// Reads everything currently available. Closes `fd` on EOF.
void drain(int& fd, std::string& out) {
  char buffer[READ_BUF_SIZE];
  while (fd >= 0) {
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, n);
    } else if (n == 0) {
      closeFd(fd);
    } else if (errno == EINTR) {
      continue;
    } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    } else {
      std::string msg = std::string("read failed: ") + std::strerror(errno);
      LOG(ERROR) << "Subprocess: " << msg;
      throw ProcessError(ProcessError::IO_FAILED, msg);
    }
  }
}

void watch(int epoll_fd, int fd, unsigned int events) {
  struct epoll_event event = {};
  event.events = events;
  event.data.fd = fd;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &event) < 0) {
    LOG_PERROR(ERROR, "Subprocess: epoll_ctl ADD");
    throw ProcessError(ProcessError::IO_FAILED, "epoll_ctl failed");
  }
}

}  // namespace

void Subprocess::pump(const std::string& input, long long deadline,
                      const CancelToken* cancel, ProcessResult& result) {
  epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd_ < 0) {
    LOG_PERROR(ERROR, "Subprocess: epoll_create1");
    throw ProcessError(ProcessError::IO_FAILED, "epoll_create1 failed");
  }
  if (set_nonblocking(stdin_fd_) < 0 || set_nonblocking(stdout_fd_) < 0 ||
      set_nonblocking(stderr_fd_) < 0) {
    LOG_PERROR(ERROR, "Subprocess: set_nonblocking");
    throw ProcessError(ProcessError::IO_FAILED, "fcntl failed");
  }

  watch(epoll_fd_, stdout_fd_, EPOLLIN);
  watch(epoll_fd_, stderr_fd_, EPOLLIN);
  if (input.empty()) {
    closeFd(stdin_fd_);
  } else {
    watch(epoll_fd_, stdin_fd_, EPOLLOUT);
  }
  if (cancel != NULL) {
    watch(epoll_fd_, cancel->fd(), EPOLLIN);
  }

  SigpipeBlock sigpipe_block;
  size_t written = 0;
  while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
    if (cancel != NULL && cancel->cancelled()) {
      killChild();
      throw ProcessError(ProcessError::CANCELLED, argv_[0] + " cancelled");
    }
    if (deadline_expired(deadline)) {
      killChild();
      throw ProcessError(ProcessError::TIMED_OUT, argv_[0] + " timed out");
    }

    struct epoll_event events[MAX_EVENTS];
    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS,
                       remaining_ms(deadline, -1));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_PERROR(ERROR, "Subprocess: epoll_wait");
      throw ProcessError(ProcessError::IO_FAILED, "epoll_wait failed");
    }

    for (int i = 0; i < n; ++i) {
      int fd = events[i].data.fd;
      if (fd < 0) {
        continue;
      }
      if (fd == stdin_fd_) {
        ssize_t w =
            write(stdin_fd_, input.data() + written, input.size() - written);
        if (w > 0) {
          written += static_cast<size_t>(w);
        } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
          // EPIPE: the child stopped reading; its output still matters.
          LOG(DEBUG) << "Subprocess: stdin closed early: "
                     << std::strerror(errno);
          written = input.size();
        }
        if (written == input.size()) {
          closeFd(stdin_fd_);
        }
      } else if (fd == stdout_fd_) {
        drain(stdout_fd_, result.out);
      } else if (fd == stderr_fd_) {
        drain(stderr_fd_, result.err);
      }
    }
  }
  closeFd(stdin_fd_);
}

int Subprocess::reap(long long deadline, const CancelToken* cancel) {
  while (true) {
    int status;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      pid_ = -1;
      return decodeStatus(status);
    }
    if (r < 0 && errno != EINTR) {
      LOG_PERROR(ERROR, "Subprocess: waitpid");
      pid_ = -1;
      throw ProcessError(ProcessError::IO_FAILED, "waitpid failed");
    }
    if (cancel != NULL && cancel->cancelled()) {
      killChild();
      throw ProcessError(ProcessError::CANCELLED, argv_[0] + " cancelled");
    }
    if (deadline_expired(deadline)) {
      killChild();
      throw ProcessError(ProcessError::TIMED_OUT, argv_[0] + " timed out");
    }
    // Only the cancel token is left in the set; this doubles as a short
    // sleep between polls.
    struct epoll_event events[MAX_EVENTS];
    if (epoll_wait(epoll_fd_, events, MAX_EVENTS, remaining_ms(deadline, 10)) <
            0 &&
        errno != EINTR) {
      LOG_PERROR(ERROR, "Subprocess: epoll_wait");
      throw ProcessError(ProcessError::IO_FAILED, "epoll_wait failed");
    }
  }
}

ProcessResult Subprocess::run(const std::string& input, int timeout_ms,
                              const CancelToken* cancel) {
  if (cancel != NULL && cancel->cancelled()) {
    throw ProcessError(ProcessError::CANCELLED, argv_[0] + " cancelled");
  }
  LOG(DEBUG) << "Subprocess: running " << join(argv_, " ");

  long long deadline = timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0;
  ProcessResult result;
  spawn();
  pump(input, deadline, cancel, result);
  result.exit_status = reap(deadline, cancel);
  cleanupProcess();

  LOG(DEBUG) << "Subprocess: " << argv_[0] << " exited with status "
             << result.exit_status;
  return result;
}
