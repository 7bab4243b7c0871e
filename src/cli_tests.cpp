#include "cli.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

berth::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return berth::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "berth" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("build") != std::string::npos);
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "berth", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<berth::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "berth", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<berth::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("subcommand") {
    auto const parsed{ parse({ "berth", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<berth::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_build") {
  auto const parsed{
    parse({ "berth", "--state-root", "/tmp/st", "build", "svc", "--profile", "Debug" })
  };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<berth::cmd_build::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg);
  CHECK(cfg->source_root == "svc");
  CHECK(cfg->profile == "Debug");
  CHECK_FALSE(cfg->target.has_value());
  CHECK(parsed.state_root == std::filesystem::path{ "/tmp/st" });

  SUBCASE("source is required") {
    auto const missing{ parse({ "berth", "build" }) };
    CHECK_FALSE(missing.cmd_cfg.has_value());
    CHECK_FALSE(missing.cli_output.empty());
  }
}

TEST_CASE("cli_parse: cmd_run") {
  auto const parsed{ parse({ "berth", "run", "a", "--grace-ms", "100" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<berth::cmd_run::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg);
  CHECK(cfg->sources.size() == 1);
  CHECK(cfg->grace_ms == 100);
  CHECK(cfg->address == "127.0.0.1:8000");
  CHECK_FALSE(cfg->watch);
}

TEST_CASE("cli_parse: logging options") {
  SUBCASE("default is info, undecorated") {
    auto const parsed{ parse({ "berth", "version" }) };
    CHECK(parsed.verbosity == berth::tui::level::TUI_INFO);
    CHECK_FALSE(parsed.decorated_logging);
  }

  SUBCASE("--verbose") {
    auto const parsed{ parse({ "berth", "--verbose", "version" }) };
    CHECK(parsed.verbosity == berth::tui::level::TUI_DEBUG);
    CHECK(parsed.decorated_logging);
  }

  SUBCASE("--trace outputs") {
    auto const parsed{ parse({ "berth", "--trace", "stderr,file:/tmp/t.jsonl", "version" }) };
    CHECK(parsed.verbosity == berth::tui::level::TUI_TRACE);
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[0].type == berth::tui::trace_output_type::std_err);
    CHECK(parsed.trace_outputs[1].type == berth::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path{ "/tmp/t.jsonl" });
  }

  SUBCASE("invalid trace spec") {
    auto const parsed{ parse({ "berth", "--trace", "syslog", "version" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: syslog");
  }
}
