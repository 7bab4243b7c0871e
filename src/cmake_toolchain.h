#pragma once

#include "toolchain.h"

#include <filesystem>
#include <optional>
#include <string>

namespace berth {

// Drives CMake as a subprocess and reads unit metadata through the CMake file API
// (codemodel-v2 and cache-v2 replies).
class cmake_toolchain : public toolchain {
 public:
  static constexpr char const *kMinimumCMakeVersion{ "3.20" };

  explicit cmake_toolchain(std::string cmake_program = "cmake");

  std::string_view name() const override { return "cmake"; }

  unit_metadata query_metadata(std::filesystem::path const &source_root,
                               std::filesystem::path const &build_dir,
                               build_options const &options) override;

  void compile(std::filesystem::path const &build_dir,
               unit_metadata const &metadata,
               build_options const &options) override;

 private:
  std::string cmake_;
};

// Drops the stateless query files that make the next configure write replies.
void cmake_file_api_write_queries(std::filesystem::path const &build_dir);

// Parses the newest file API reply under build_dir. `target` selects the library
// target; when unset exactly one MODULE or SHARED library must exist.
// Throws build_error (metadata_malformed or manifest_field_missing).
unit_metadata cmake_file_api_read(std::filesystem::path const &build_dir,
                                  std::string const &profile,
                                  std::optional<std::string> const &target);

}  // namespace berth
