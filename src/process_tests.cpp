#include "process.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct collected {
  berth::process_result result;
  std::vector<std::string> out;
  std::vector<std::string> err;
};

collected run_sh(std::string const &script,
                 std::optional<fs::path> cwd = std::nullopt,
                 std::optional<berth::process_env_t> env = std::nullopt) {
  collected c{};
  berth::process_run_cfg cfg{
    .on_stdout_line = [&](std::string_view line) { c.out.emplace_back(line); },
    .on_stderr_line = [&](std::string_view line) { c.err.emplace_back(line); },
    .on_output_line = {},
    .cwd = std::move(cwd),
    .env = std::move(env),
  };
  c.result = berth::process_run({ "sh", "-c", script }, cfg);
  return c;
}

}  // namespace

TEST_CASE("process_run separates stdout and stderr") {
  auto const c{ run_sh("echo first; echo oops >&2; printf 'second\\n'") };
  CHECK(c.result.exit_code == 0);
  CHECK_FALSE(c.result.signal.has_value());
  REQUIRE(c.out.size() == 2);
  CHECK(c.out[0] == "first");
  CHECK(c.out[1] == "second");
  REQUIRE(c.err.size() == 1);
  CHECK(c.err[0] == "oops");
}

TEST_CASE("process_run surfaces non-zero exit codes") {
  auto const c{ run_sh("exit 7") };
  CHECK(c.result.exit_code == 7);
  CHECK_FALSE(c.result.signal.has_value());
}

TEST_CASE("process_run reports death by signal") {
  auto const c{ run_sh("kill -9 $$") };
  REQUIRE(c.result.signal.has_value());
  CHECK(*c.result.signal == 9);
  CHECK(c.result.exit_code == 128 + 9);
}

TEST_CASE("process_run delivers trailing partial lines") {
  auto const c{ run_sh("printf 'without-newline'") };
  REQUIRE(c.out.size() == 1);
  CHECK(c.out[0] == "without-newline");
}

TEST_CASE("process_run honors cwd") {
  auto const tmp{ fs::canonical(fs::temp_directory_path()) };
  auto const c{ run_sh("pwd -P", tmp) };
  REQUIRE(c.out.size() == 1);
  CHECK(fs::path{ c.out[0] } == tmp);
}

TEST_CASE("process_run uses explicit environment") {
  auto env{ berth::process_getenv() };
  env["BERTH_PROCESS_TEST"] = "ok";
  auto const c{ run_sh("printf '%s\\n' \"$BERTH_PROCESS_TEST\"", std::nullopt, env) };
  REQUIRE(c.out.size() == 1);
  CHECK(c.out[0] == "ok");
}

TEST_CASE("process_run stdin is empty") {
  auto const c{ run_sh("cat; echo done") };
  REQUIRE(c.out.size() == 1);
  CHECK(c.out[0] == "done");
}

TEST_CASE("process_run throws for unknown executables") {
  berth::process_run_cfg cfg{};
  CHECK_THROWS_AS(berth::process_run({ "berth-definitely-not-a-program" }, cfg),
                  std::system_error);
  CHECK_THROWS_AS(berth::process_run({}, cfg), std::invalid_argument);
}

TEST_CASE("process_run propagates callback exceptions") {
  berth::process_run_cfg cfg{
    .on_stdout_line = [](std::string_view) { throw std::runtime_error("callback"); },
  };
  CHECK_THROWS_WITH(berth::process_run({ "sh", "-c", "echo hi; sleep 5" }, cfg),
                    "callback");
}

TEST_CASE("process_find_executable searches PATH") {
  berth::process_env_t env{ { "PATH", "/nonexistent:/bin:/usr/bin" } };
  auto const sh{ berth::process_find_executable("sh", env) };
  REQUIRE(sh.has_value());
  CHECK(sh->filename() == "sh");

  CHECK_FALSE(berth::process_find_executable("berth-not-here", env).has_value());
  CHECK_FALSE(berth::process_find_executable("", env).has_value());
  CHECK(berth::process_find_executable("/bin/sh", env) == fs::path{ "/bin/sh" });
}

TEST_CASE("process_render_argv quotes arguments with spaces") {
  CHECK(berth::process_render_argv({ "cmake", "-S", "/src dir", "" }) ==
        "cmake -S \"/src dir\" \"\"");
}
