#include "CancelToken.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <stdexcept>

#include "Logger.hpp"

CancelToken::CancelToken() : read_fd_(-1), write_fd_(-1), cancelled_(0) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
    LOG_PERROR(ERROR, "CancelToken: pipe2");
    throw std::runtime_error("Failed to create cancel token");
  }
  read_fd_ = fds[0];
  write_fd_ = fds[1];
}

CancelToken::~CancelToken() {
  close(read_fd_);
  close(write_fd_);
}

void CancelToken::cancel() {
  cancelled_ = 1;
  // EAGAIN means the pipe already holds a wake-up byte.
  ssize_t n = write(write_fd_, "x", 1);
  (void)n;
}

bool CancelToken::cancelled() const {
  return cancelled_ != 0;
}

int CancelToken::fd() const {
  return read_fd_;
}
