#include "signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include "CancelToken.hpp"
#include "Logger.hpp"

/*
 * Termination signals are turned into a cancel request: the handler only
 * sets a flag and writes to the token's pipe, so a validation or reload
 * waiting in epoll wakes up, kills its child or closes its socket, and the
 * command unwinds normally.
 */

static volatile sig_atomic_t g_stop_requested = 0;
static CancelToken* volatile g_token = NULL;

static void handle_signal(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    g_stop_requested = 1;
    CancelToken* token = g_token;
    if (token != NULL) {
      token->cancel();
    }
  }
}

static void install(int sig, void (*handler)(int), const char* name) {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handler;
  sa.sa_flags = 0;
  sigemptyset(&sa.sa_mask);
  if (sigaction(sig, &sa, NULL) < 0) {
    LOG_PERROR(ERROR, std::string("signals: sigaction(") + name + ")");
  }
}

void setup_signal_handlers(CancelToken* token) {
  g_token = token;
  g_stop_requested = 0;

  install(SIGINT, handle_signal, "SIGINT");
  install(SIGTERM, handle_signal, "SIGTERM");
  install(SIGPIPE, SIG_IGN, "SIGPIPE");

  LOG(DEBUG) << "signals: handlers installed (SIGINT,SIGTERM,SIGPIPE)";
}

void restore_signal_handlers() {
  install(SIGINT, SIG_DFL, "SIGINT");
  install(SIGTERM, SIG_DFL, "SIGTERM");
  install(SIGPIPE, SIG_DFL, "SIGPIPE");
  g_token = NULL;
}

bool stop_requested() {
  return g_stop_requested != 0;
}
