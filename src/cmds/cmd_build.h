#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace berth {

class builder;

// Builds and publishes one unit, printing the artifact path and generation.
class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {
    std::filesystem::path source_root;
    std::string profile{ "Release" };
    std::optional<std::string> target;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_build(cfg cfg, std::optional<std::filesystem::path> const &cli_state_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

  // Runs the build with an explicit builder; execute() supplies the cmake one.
  bool execute_with(builder const &b);

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_state_root_;
};

}  // namespace berth
