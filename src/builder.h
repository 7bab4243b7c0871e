#pragma once

#include "artifact_store.h"
#include "toolchain.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace berth {

struct build_artifact {
  std::string unit_name;
  std::filesystem::path path;
  std::chrono::system_clock::time_point built_at;
  std::int64_t generation;
  std::string toolchain_version;
};

// Turns a unit source tree into a published artifact. Builds of one source tree
// are serialized across threads and processes; different units build in parallel.
class builder : unmovable {
 public:
  builder(std::shared_ptr<artifact_store> store, std::shared_ptr<toolchain> tc);

  // Throws build_error. Never replaces a published artifact on failure.
  build_artifact build(std::filesystem::path const &source_root,
                       build_options const &options) const;

  artifact_store &store() const { return *store_; }

  // Stable per-source key for the build tree: "<dirname>-<hash>".
  static std::string source_key(std::filesystem::path const &source_root);

 private:
  std::shared_ptr<artifact_store> store_;
  std::shared_ptr<toolchain> toolchain_;
};

}  // namespace berth
