#pragma once

#include "service.h"
#include "template.h"
#include "util.h"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace berth {

// Deployment configuration read from a Lua script (berth.lua by default):
//
//   ENV = "staging"
//   VARIABLES = { region = "eu-west-1" }
//   RESOURCES = {
//     database = { url = "{env}-db" },
//     ["static-folder"] = { folder = "public" },
//   }
//
// Every global is optional. Values inside RESOURCES tables must be strings, numbers
// or booleans. Immutable after load.
struct deploy_config : unmovable {
  static constexpr char const *kFileName{ "berth.lua" };

  std::filesystem::path origin;  // empty for the default configuration
  std::optional<std::string> env;
  template_vars variables;
  std::map<std::string, resource_config, std::less<>> resources;

  deploy_config() = default;

  // Looks for berth.lua directly inside source_root.
  static std::optional<std::filesystem::path> discover(
      std::filesystem::path const &source_root);

  // Throws std::runtime_error on script errors or malformed globals.
  static std::unique_ptr<deploy_config> load(std::filesystem::path const &path);
  static std::unique_ptr<deploy_config> load(std::string_view script,
                                             std::filesystem::path const &origin);

  // The user's overrides for `kind`, or nullptr if there are none.
  resource_config const *find(std::string_view kind) const;
};

}  // namespace berth
