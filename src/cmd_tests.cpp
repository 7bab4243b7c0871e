#include "cmd.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <optional>

namespace {

class test_cmd : public berth::cmd {
 public:
  struct cfg : berth::cmd_cfg<test_cmd> {
    bool succeed{ true };
  };
  test_cmd(cfg c, std::optional<std::filesystem::path> const &cli_state_root)
      : cfg_{ c }, state_root_{ cli_state_root } {}
  bool execute() override { return cfg_.succeed; }

  cfg cfg_;
  std::optional<std::filesystem::path> state_root_;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  CHECK(std::is_same_v<test_cmd::cfg::cmd_t, test_cmd>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  cfg.succeed = false;
  auto cmd{ berth::cmd::create(cfg, std::filesystem::path{ "/tmp/state" }) };
  REQUIRE(cmd);
  auto *typed{ dynamic_cast<test_cmd *>(cmd.get()) };
  REQUIRE(typed);
  CHECK(typed->state_root_ == std::filesystem::path{ "/tmp/state" });
  CHECK_FALSE(cmd->execute());
}
