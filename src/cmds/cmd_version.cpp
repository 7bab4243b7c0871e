#include "cmd_version.h"

#include "service.h"
#include "tui.h"

#include <CLI/CLI.hpp>
#include <semver.hpp>
#include <sol/sol.hpp>

#include "tbb/version.h"

#include <memory>

#ifndef BERTH_VERSION_STR
#error "BERTH_VERSION_STR must be defined by the build system"
#endif

namespace berth {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg,
                         std::optional<std::filesystem::path> const & /*cli_state_root*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("berth version %s (unit SDK %s, ABI %u)",
            BERTH_VERSION_STR,
            BERTH_SDK_VERSION,
            static_cast<unsigned>(kUnitAbiVersion));
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %s", TBB_VERSION_STRING);
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace berth
