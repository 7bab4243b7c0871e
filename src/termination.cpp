#include "termination.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <mutex>
#include <system_error>
#include <tuple>

namespace {

std::atomic_int g_signals{ 0 };
int g_pipe[2]{ -1, -1 };
std::once_flag g_pipe_once;

void make_pipe() {
  std::call_once(g_pipe_once, [] {
    if (::pipe(g_pipe) != 0) {
      throw std::system_error(errno, std::generic_category(), "termination pipe");
    }
    for (int const fd : g_pipe) {
      ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
      ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
  });
}

void notify() {
  char const byte{ 1 };
  std::ignore = ::write(g_pipe[1], &byte, 1);
}

void signal_handler(int sig) {
  if (g_signals.fetch_add(1) > 0) { _exit(128 + sig); }
  notify();
}

}  // namespace

namespace berth {

void termination_handler_install() {
  make_pipe();

  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool termination_requested() { return g_signals.load() > 0; }

int termination_fd() {
  make_pipe();
  return g_pipe[0];
}

bool termination_wait(std::chrono::milliseconds timeout) {
  if (termination_requested()) { return true; }
  pollfd pfd{ .fd = termination_fd(), .events = POLLIN, .revents = 0 };
  int const rc{ ::poll(&pfd, 1, static_cast<int>(timeout.count())) };
  if (rc < 0 && errno != EINTR) {
    throw std::system_error(errno, std::generic_category(), "poll");
  }
  return termination_requested();
}

void termination_request() {
  make_pipe();
  g_signals.fetch_add(1);
  notify();
}

}  // namespace berth
