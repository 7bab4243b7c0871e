#pragma once

#include <chrono>

namespace berth {

// Installs SIGINT/SIGTERM handlers. The first signal requests a graceful stop; a
// second one exits immediately with 128 + signal.
void termination_handler_install();

bool termination_requested();

// Readable once termination has been requested; for poll() alongside other fds.
int termination_fd();

// Blocks until termination is requested or `timeout` elapses. True if requested.
bool termination_wait(std::chrono::milliseconds timeout);

// Marks termination as requested without a signal (the runner's "quit").
void termination_request();

}  // namespace berth
