#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace berth {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // False reports failure through the process exit code.
  virtual bool execute() = 0;

  // Create command with the CLI state root override (for commands that touch state)
  template <typename config>
  static ptr_t create(config const &cfg,
                      std::optional<std::filesystem::path> const &cli_state_root);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg,
                       std::optional<std::filesystem::path> const &cli_state_root) {
  return std::make_unique<typename config::cmd_t>(cfg, cli_state_root);
}

}  // namespace berth
