#pragma once

#include "artifact_store.h"
#include "builder.h"
#include "toolchain.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace berth {

// Directory holding service.h for unit builds: $BERTH_SDK_INCLUDE_DIR, else the
// directory this binary was built with.
std::filesystem::path cmd_sdk_include_dir();

build_options cmd_build_options(std::string profile, std::optional<std::string> target);

// Builder over the resolved state root and the cmake toolchain.
std::shared_ptr<builder> cmd_make_builder(
    std::optional<std::filesystem::path> const &cli_state_root);

}  // namespace berth
