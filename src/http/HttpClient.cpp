#include "HttpClient.hpp"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "CancelToken.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

namespace {

// One request/response exchange on a fresh connection. Owns the socket and
// the epoll instance; both are closed when the exchange goes out of scope.
class Exchange {
 public:
  Exchange(const http::Url& base, int timeout_ms, const CancelToken* cancel)
      : base_(base),
        timeout_ms_(timeout_ms),
        deadline_(timeout_ms > 0 ? monotonic_ms() + timeout_ms : 0),
        cancel_(cancel),
        sock_(-1),
        epoll_fd_(-1),
        registered_(false) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
      fail(std::string("epoll_create1 failed: ") + std::strerror(errno));
    }
    if (cancel_ != NULL) {
      struct epoll_event event = {};
      event.events = EPOLLIN;
      event.data.fd = cancel_->fd();
      if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, cancel_->fd(), &event) < 0) {
        int saved = errno;
        close(epoll_fd_);
        epoll_fd_ = -1;
        fail(std::string("epoll_ctl failed: ") + std::strerror(saved));
      }
    }
  }

  ~Exchange() {
    closeSocket();
    if (epoll_fd_ >= 0) {
      close(epoll_fd_);
    }
  }

  void connect() {
    std::ostringstream port;
    port << base_.getPort();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* addrs = NULL;
    int rc = getaddrinfo(base_.getHost().c_str(), port.str().c_str(), &hints,
                         &addrs);
    if (rc != 0) {
      fail("cannot resolve " + base_.getHost() + ": " + gai_strerror(rc));
    }

    int last_error = ECONNREFUSED;
    bool connected = false;
    try {
      for (struct addrinfo* ai = addrs; ai != NULL && !connected;
           ai = ai->ai_next) {
        connected = tryConnect(ai, last_error);
      }
    } catch (const AdminUnreachable&) {
      freeaddrinfo(addrs);
      throw;
    }
    freeaddrinfo(addrs);

    if (!connected) {
      fail(std::string("cannot connect: ") + std::strerror(last_error));
    }
  }

  void sendAll(const std::string& data) {
    std::string::size_type off = 0;
    while (off < data.size()) {
      ssize_t n = ::send(sock_, data.data() + off, data.size() - off,
                         MSG_NOSIGNAL);
      if (n > 0) {
        off += static_cast<std::string::size_type>(n);
      } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        wait(EPOLLOUT);
      } else if (n < 0 && errno == EINTR) {
        continue;
      } else {
        fail(std::string("send failed: ") + std::strerror(errno));
      }
    }
  }

  Response receive() {
    std::string raw;
    Response response;
    char buffer[READ_BUF_SIZE];
    while (true) {
      ssize_t n = recv(sock_, buffer, sizeof(buffer), 0);
      if (n > 0) {
        raw.append(buffer, n);
        Response::ParseResult res = response.parse(raw, false);
        if (res == Response::PARSE_DONE) {
          return response;
        }
        if (res == Response::PARSE_ERROR) {
          fail("malformed response");
        }
      } else if (n == 0) {
        if (response.parse(raw, true) == Response::PARSE_DONE) {
          return response;
        }
        fail(raw.empty() ? "connection closed without a response"
                         : "connection closed before the response was "
                           "complete");
      } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
        wait(EPOLLIN);
      } else if (errno != EINTR) {
        fail(std::string("recv failed: ") + std::strerror(errno));
      }
    }
  }

 private:
  Exchange(const Exchange& other);
  Exchange& operator=(const Exchange& other);

  bool tryConnect(struct addrinfo* ai, int& last_error) {
    closeSocket();
    sock_ = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                   ai->ai_protocol);
    if (sock_ < 0) {
      last_error = errno;
      return false;
    }
    if (::connect(sock_, ai->ai_addr, ai->ai_addrlen) == 0) {
      return true;
    }
    if (errno != EINPROGRESS) {
      last_error = errno;
      closeSocket();
      return false;
    }
    wait(EPOLLOUT);
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      so_error = errno;
    }
    if (so_error != 0) {
      last_error = so_error;
      closeSocket();
      return false;
    }
    return true;
  }

  // Blocks until the socket is ready for `events`, the deadline passes or
  // the token is cancelled.
  void wait(unsigned int events) {
    struct epoll_event event = {};
    event.events = events;
    event.data.fd = sock_;
    int op = registered_ ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
    if (epoll_ctl(epoll_fd_, op, sock_, &event) < 0) {
      fail(std::string("epoll_ctl failed: ") + std::strerror(errno));
    }
    registered_ = true;

    while (true) {
      if (cancel_ != NULL && cancel_->cancelled()) {
        fail("request cancelled");
      }
      if (deadline_expired(deadline_)) {
        std::ostringstream oss;
        oss << "request timed out after " << timeout_ms_ << " ms";
        fail(oss.str());
      }
      struct epoll_event ready[MAX_EVENTS];
      int n = epoll_wait(epoll_fd_, ready, MAX_EVENTS,
                         remaining_ms(deadline_, -1));
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        fail(std::string("epoll_wait failed: ") + std::strerror(errno));
      }
      for (int i = 0; i < n; ++i) {
        if (ready[i].data.fd == sock_) {
          return;
        }
      }
    }
  }

  void closeSocket() {
    if (sock_ >= 0) {
      close(sock_);
      sock_ = -1;
    }
    registered_ = false;
  }

  void fail(const std::string& what) {
    std::string msg = "caddy admin api at " + base_.serialize() + ": " + what;
    LOG(DEBUG) << "HttpClient: " << msg;
    throw AdminUnreachable(msg);
  }

  http::Url base_;
  int timeout_ms_;
  long long deadline_;
  const CancelToken* cancel_;
  int sock_;
  int epoll_fd_;
  bool registered_;
};

}  // namespace

HttpClient::HttpClient(const http::Url& base) : base_(base) {}

HttpClient::HttpClient(const HttpClient& other) : base_(other.base_) {}

HttpClient& HttpClient::operator=(const HttpClient& other) {
  if (this != &other) {
    base_ = other.base_;
  }
  return *this;
}

HttpClient::~HttpClient() {}

const http::Url& HttpClient::baseUrl() const {
  return base_;
}

Response HttpClient::send(const Request& request, int timeout_ms,
                          const CancelToken* cancel) const {
  Request req(request);
  req.target = base_.resolve(request.target);
  req.setHeader("Host", base_.hostHeader());
  req.setHeader("Connection", "close");

  if (cancel != NULL && cancel->cancelled()) {
    throw AdminUnreachable("caddy admin api at " + base_.serialize() +
                           ": request cancelled");
  }

  Exchange exchange(base_, timeout_ms, cancel);
  exchange.connect();
  exchange.sendAll(req.serialize());
  Response response = exchange.receive();

  LOG(DEBUG) << "HttpClient: " << req.method << " " << req.target << " -> "
             << response.status;
  return response;
}
