#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace berth {

using process_env_t = std::unordered_map<std::string, std::string>;

struct process_result {
  int exit_code;
  std::optional<int> signal;
};

enum class process_stream { std_out, std_err };

struct process_run_cfg {
  std::function<void(std::string_view)> on_stdout_line;
  std::function<void(std::string_view)> on_stderr_line;
  std::function<void(process_stream, std::string_view)> on_output_line;
  std::optional<std::filesystem::path> cwd;
  std::optional<process_env_t> env;  // nullopt inherits the host environment
};

process_env_t process_getenv();

// Resolves a bare program name against PATH. Names containing '/' are returned as-is
// when they exist. Returns nullopt when nothing executable matches.
std::optional<std::filesystem::path> process_find_executable(std::string_view name,
                                                             process_env_t const &env);

// Runs argv[0] (resolved through PATH) with stdin on /dev/null and stdout/stderr
// streamed line by line to the callbacks. Blocks until the child exits. Throws
// std::system_error when the child cannot be spawned.
process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg);

// "cmake --build dir" style rendering for logs and diagnostics.
std::string process_render_argv(std::vector<std::string> const &argv);

}  // namespace berth
