#include "termination.h"

#include <doctest/doctest.h>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <string>

using namespace std::chrono_literals;

// Termination state is process-wide and one-way, so a single case covers it.
TEST_CASE("termination_request wakes waiters and stays requested") {
  CHECK_FALSE(berth::termination_requested());
  CHECK_FALSE(berth::termination_wait(10ms));

  int const fd{ berth::termination_fd() };
  REQUIRE(fd >= 0);
  CHECK(berth::termination_fd() == fd);

  berth::termination_request();
  CHECK(berth::termination_requested());
  CHECK(berth::termination_wait(0ms));

  pollfd pfd{ .fd = fd, .events = POLLIN, .revents = 0 };
  CHECK(::poll(&pfd, 1, 0) == 1);
}

// Runs in a child so the exit does not take the test runner with it.
TEST_CASE("second signal exits with 128 + signal and writes nothing") {
  int out[2];
  REQUIRE(::pipe(out) == 0);

  pid_t const pid{ ::fork() };
  REQUIRE(pid >= 0);
  if (pid == 0) {
    ::dup2(out[1], STDOUT_FILENO);
    ::dup2(out[1], STDERR_FILENO);
    ::close(out[0]);
    ::close(out[1]);
    berth::termination_handler_install();
    std::raise(SIGINT);
    std::raise(SIGINT);
    _exit(0);
  }

  ::close(out[1]);
  std::string output;
  char buf[256];
  for (ssize_t n; (n = ::read(out[0], buf, sizeof buf)) > 0;) { output.append(buf, n); }
  ::close(out[0]);

  int status{ 0 };
  REQUIRE(::waitpid(pid, &status, 0) == pid);
  REQUIRE(WIFEXITED(status));
  CHECK(WEXITSTATUS(status) == 128 + SIGINT);
  CHECK(output.empty());
}
