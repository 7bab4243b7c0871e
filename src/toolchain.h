#pragma once

#include "process.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace berth {

struct build_options {
  std::string profile{ "Release" };
  std::optional<std::string> target;      // library target; inferred when unset
  std::filesystem::path sdk_include_dir;  // directory holding service.h
  std::optional<process_env_t> env;       // nullopt inherits the host environment
};

// What the toolchain's own metadata query says about a unit project.
struct unit_metadata {
  std::string package_name;
  std::string target;
  std::filesystem::path artifact;  // compiled library, absolute
  std::string toolchain_version;
  std::optional<std::string> minimum_toolchain_version;
  std::optional<std::string> required_sdk_version;
  std::optional<std::string> unit_name;  // explicit override of package_name
};

class toolchain {
 public:
  virtual ~toolchain() = default;

  virtual std::string_view name() const = 0;

  // Configures `build_dir` from `source_root` and reads back its metadata.
  // Throws build_error.
  virtual unit_metadata query_metadata(std::filesystem::path const &source_root,
                                       std::filesystem::path const &build_dir,
                                       build_options const &options) = 0;

  // Compiles the metadata's target. Throws build_error.
  virtual void compile(std::filesystem::path const &build_dir,
                       unit_metadata const &metadata,
                       build_options const &options) = 0;
};

// Runs one toolchain step, logging each output line under `label`. Returns every
// line the step printed. A non-zero exit or death by signal throws
// build_error(toolchain_failed) carrying those lines verbatim.
std::vector<std::string> toolchain_run_step(std::string const &label,
                                            std::vector<std::string> const &argv,
                                            build_options const &options);

}  // namespace berth
