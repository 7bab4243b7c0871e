#include "cmd_build.h"

#include "cmd_common.h"
#include "errors.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace berth {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build", "Build and publish a unit") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("source", cfg_ptr->source_root, "Unit source directory")->required();
  sub->add_option("--profile", cfg_ptr->profile, "Build profile (CMAKE_BUILD_TYPE)")
      ->capture_default_str();
  sub->add_option("--target", cfg_ptr->target, "Library target to build");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_build::cmd_build(cmd_build::cfg cfg,
                     std::optional<std::filesystem::path> const &cli_state_root)
    : cfg_{ std::move(cfg) }, cli_state_root_{ cli_state_root } {}

bool cmd_build::execute() { return execute_with(*cmd_make_builder(cli_state_root_)); }

bool cmd_build::execute_with(builder const &b) {
  try {
    auto const artifact{ b.build(std::filesystem::absolute(cfg_.source_root),
                                 cmd_build_options(cfg_.profile, cfg_.target)) };
    tui::info("built %s generation %lld with %s",
              artifact.unit_name.c_str(),
              static_cast<long long>(artifact.generation),
              artifact.toolchain_version.c_str());
    tui::print_stdout("%s\n", artifact.path.string().c_str());
    return true;
  } catch (build_error const &e) {
    for (auto const &line : e.diagnostics()) { tui::error("%s", line.c_str()); }
    tui::error("build failed: %s", e.what());
    return false;
  }
}

}  // namespace berth
