#pragma once

#include "cmd.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CLI { class App; }

namespace berth {

class builder;
class host;

// Builds, loads and serves units until terminated, reading runner commands from stdin.
class cmd_run : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_run> {
    std::vector<std::filesystem::path> sources;
    std::string address{ "127.0.0.1:8000" };
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> env;
    int grace_ms{ 5000 };
    bool watch{ false };
    int poll_ms{ 500 };
    std::string profile{ "Release" };
    std::size_t jobs{ 0 };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_run(cfg cfg, std::optional<std::filesystem::path> const &cli_state_root);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

  // Host for the configured sources. Throws std::invalid_argument on bad options.
  std::unique_ptr<host> make_host(std::shared_ptr<builder> b) const;

 private:
  cfg cfg_;
  std::optional<std::filesystem::path> cli_state_root_;
};

struct run_control_result {
  std::string output;
  bool quit{ false };
};

// One stdin line: "status [unit]", "reload <unit>", "stop <unit>", "start <unit>" or
// "quit". Errors are reported in the output, never thrown.
run_control_result run_control_dispatch(host &h, std::string_view line);

}  // namespace berth
