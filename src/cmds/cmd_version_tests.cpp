#include "cmds/cmd_version.h"

#include <doctest/doctest.h>

#include <CLI/CLI.hpp>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  CHECK(std::is_same_v<berth::cmd_version::cfg::cmd_t, berth::cmd_version>);
}

TEST_CASE("cmd_version registers a version subcommand") {
  CLI::App app{ "test" };
  bool selected{ false };
  berth::cmd_version::register_cli(app, [&](berth::cmd_version::cfg) { selected = true; });

  char const *argv[]{ "berth", "version" };
  app.parse(2, const_cast<char **>(argv));
  CHECK(selected);

  auto cmd{ berth::cmd::create(berth::cmd_version::cfg{}, std::nullopt) };
  CHECK(cmd->execute());
}
