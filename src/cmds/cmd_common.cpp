#include "cmd_common.h"

#include "cmake_toolchain.h"

#include <cstdlib>

#ifndef BERTH_SDK_INCLUDE_DIR_DEFAULT
#error "BERTH_SDK_INCLUDE_DIR_DEFAULT must be defined by the build system"
#endif

namespace berth {

std::filesystem::path cmd_sdk_include_dir() {
  if (char const *env{ std::getenv("BERTH_SDK_INCLUDE_DIR") }; env && *env) { return env; }
  return BERTH_SDK_INCLUDE_DIR_DEFAULT;
}

build_options cmd_build_options(std::string profile, std::optional<std::string> target) {
  return build_options{ .profile = std::move(profile),
                        .target = std::move(target),
                        .sdk_include_dir = cmd_sdk_include_dir(),
                        .env = std::nullopt };
}

std::shared_ptr<builder> cmd_make_builder(
    std::optional<std::filesystem::path> const &cli_state_root) {
  auto store{ std::make_shared<artifact_store>(resolve_state_root(cli_state_root)) };
  return std::make_shared<builder>(std::move(store), std::make_shared<cmake_toolchain>());
}

}  // namespace berth
