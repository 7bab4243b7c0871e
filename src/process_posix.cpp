#include "process.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace berth {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  fd_cleanup &operator=(fd_cleanup &&other) noexcept {
    if (this == &other) { return *this; }
    if (fd_ != -1) { close_with_retry(); }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
  }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

struct pipe_state {
  fd_cleanup read_fd;
  process_stream stream;
  std::string pending;
  bool closed;
};

void emit_line(process_run_cfg const &cfg, process_stream stream, std::string_view line) {
  if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }

  if (stream == process_stream::std_out) {
    if (cfg.on_stdout_line) { cfg.on_stdout_line(line); }
  } else {
    if (cfg.on_stderr_line) { cfg.on_stderr_line(line); }
  }
  if (cfg.on_output_line) { cfg.on_output_line(stream, line); }
}

void stream_pipes(std::array<pipe_state, 2> &pipes, process_run_cfg const &cfg) {
  std::array<pollfd, 2> poll_fds{};
  std::string chunk(4096, '\0');
  size_t closed_count{ 0 };

  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].read_fd.get();
    poll_fds[i].events = POLLIN;
  }

  while (closed_count < pipes.size()) {
    int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), -1) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      if (pipes[i].closed) { continue; }

      short const revents{ poll_fds[i].revents };
      if (revents == 0) { continue; }
      if (revents & (POLLERR | POLLNVAL)) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{
        ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size())
      };

      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        if (!pipes[i].pending.empty()) {
          emit_line(cfg, pipes[i].stream, pipes[i].pending);
          pipes[i].pending.clear();
        }

        pipes[i].closed = true;
        ++closed_count;
        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        poll_fds[i].revents = 0;
        continue;
      }

      pipes[i].pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = pipes[i].pending.find('\n')) != std::string::npos) {
        emit_line(cfg, pipes[i].stream, std::string_view{ pipes[i].pending }.substr(0, newline));
        pipes[i].pending.erase(0, newline + 1);
      }
    }
  }
}

process_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }

  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

// Only async-signal-safe calls between fork and execve.
[[noreturn]] void exec_child_process(int stdout_write,
                                     int stderr_write,
                                     char const *cwd,
                                     char const *program,
                                     char *const *argv,
                                     char *const *envp) {
  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) { _exit(kChildErrorExit); }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write, STDOUT_FILENO },
    std::pair{ stderr_write, STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) { _exit(kChildErrorExit); }
  }

  if (cwd && ::chdir(cwd) == -1) {
    static constexpr char kMsg[]{ "berth: chdir failed\n" };
    static_cast<void>(::write(STDERR_FILENO, kMsg, sizeof kMsg - 1));
    _exit(kChildErrorExit);
  }

  ::execve(program, argv, envp);

  static constexpr char kMsg[]{ "berth: execve failed\n" };
  static_cast<void>(::write(STDERR_FILENO, kMsg, sizeof kMsg - 1));
  _exit(kChildErrorExit);
}

bool is_executable_file(std::filesystem::path const &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

}  // namespace

process_env_t process_getenv() {
  process_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    env[std::string{ kv.substr(0, sep) }] = std::string{ kv.substr(sep + 1) };
  }

  return env;
}

std::optional<std::filesystem::path> process_find_executable(std::string_view name,
                                                             process_env_t const &env) {
  if (name.empty()) { return std::nullopt; }

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path const p{ name };
    if (is_executable_file(p)) { return p; }
    return std::nullopt;
  }

  auto const it{ env.find("PATH") };
  std::string_view path{ it == env.end() ? std::string_view{ "/usr/local/bin:/usr/bin:/bin" }
                                         : std::string_view{ it->second } };

  while (true) {
    size_t const sep{ path.find(':') };
    std::string_view const dir{ path.substr(0, sep) };
    std::filesystem::path const candidate{ std::filesystem::path{ dir.empty() ? "." : dir } /
                                           name };
    if (is_executable_file(candidate)) { return candidate; }
    if (sep == std::string_view::npos) { break; }
    path.remove_prefix(sep + 1);
  }

  return std::nullopt;
}

process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: argv must be non-empty"); }

  process_env_t const env{ cfg.env ? *cfg.env : process_getenv() };

  auto const program{ process_find_executable(argv[0], env) };
  if (!program) {
    throw std::system_error(ENOENT,
                            std::generic_category(),
                            "process_run: executable not found: " + argv[0]);
  }

  // Everything the child touches is prepared before fork.
  std::string const program_str{ program->string() };
  std::string const cwd_str{ cfg.cwd ? cfg.cwd->string() : std::string{} };

  std::vector<char *> argv_ptrs;
  argv_ptrs.reserve(argv.size() + 1);
  for (auto const &arg : argv) { argv_ptrs.push_back(const_cast<char *>(arg.c_str())); }
  argv_ptrs.push_back(nullptr);

  std::vector<std::string> env_strings;
  std::vector<char *> envp;
  env_strings.reserve(env.size());
  envp.reserve(env.size() + 1);
  for (auto const &[key, value] : env) { env_strings.push_back(key + "=" + value); }
  for (auto &entry : env_strings) { envp.push_back(entry.data()); }
  envp.push_back(nullptr);

  // O_CLOEXEC keeps concurrently spawned children from inheriting each other's pipes.
  int stdout_pipefd[2];
  if (::pipe2(stdout_pipefd, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe2(stderr_pipefd, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {
    exec_child_process(stdout_write_end.get(),
                       stderr_write_end.get(),
                       cfg.cwd ? cwd_str.c_str() : nullptr,
                       program_str.c_str(),
                       argv_ptrs.data(),
                       envp.data());
  }

  stdout_write_end.release();
  stderr_write_end.release();

  process_result result;
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), process_stream::std_out, {}, false },
      pipe_state{ std::move(stderr_read_end), process_stream::std_err, {}, false },
    };

    stream_pipes(pipes, cfg);
    result = wait_for_child(child);
  } catch (...) {
    ::kill(child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  return result;
}

std::string process_render_argv(std::vector<std::string> const &argv) {
  std::string out;
  for (auto const &arg : argv) {
    if (!out.empty()) { out.push_back(' '); }
    bool const needs_quotes{ arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos };
    if (needs_quotes) {
      out.push_back('"');
      out.append(arg);
      out.push_back('"');
    } else {
      out.append(arg);
    }
  }
  return out;
}

}  // namespace berth
