#pragma once

#include <csignal>

class CancelToken;

// Install SIGINT/SIGTERM handlers that cancel `token` (which may be NULL),
// and ignore SIGPIPE. The token must outlive the handlers.
void setup_signal_handlers(CancelToken* token);

// Put SIGINT, SIGTERM and SIGPIPE back to their default dispositions and
// forget the token.
void restore_signal_handlers();

// Returns true if a termination signal was received (SIGINT or SIGTERM).
bool stop_requested();
