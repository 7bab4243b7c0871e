#pragma once

#include "builder.h"
#include "deploy_config.h"
#include "failure.h"
#include "loader.h"
#include "resource_factory.h"
#include "service.h"
#include "service_handle.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace berth {

enum class unit_state { building, loaded, running, stopped, crashed };

std::string_view unit_state_name(unit_state state);

struct unit_status {
  std::string unit;
  unit_state state;
  std::int64_t generation;  // 0 until the first successful build
  bound_address address;
  std::optional<failure_info> last_failure;
  bool forced_stop{ false };
  std::vector<std::string> resources;  // kinds provisioned by the current generation

  std::string describe() const;
};

struct supervisor_cfg {
  std::filesystem::path source_root;
  bound_address address;
  std::optional<std::string> env;  // else the config's ENV, else "local"
  std::chrono::milliseconds grace{ service_handle::kDefaultGrace };
  build_options build;
  std::optional<std::filesystem::path> config_path;      // else <source>/berth.lua if present
  std::shared_ptr<provisioner_registry const> registry;  // null selects the builtins
};

// Owns one unit: builds it, loads it, runs it and swaps generations on reload.
// Control operations are serialized; status() never waits for a build.
class supervisor : unmovable {
 public:
  supervisor(supervisor_cfg cfg, std::shared_ptr<builder> b);
  ~supervisor();

  // Builds (unless a loaded generation is already available), loads and starts the
  // unit. Failures move the unit to crashed and are reported through status().
  // No-op while running.
  unit_status start();

  // Stops the running generation within the grace period.
  unit_status stop();

  // Builds and loads a new generation, then replaces the running one. If the build or
  // load fails the running generation is untouched, status() is unchanged and the
  // build_error or load_error propagates.
  unit_status reload();

  unit_status status() const;

  // Unit name once built, else the source directory's name.
  std::string name() const;
  std::filesystem::path const &source_root() const { return cfg_.source_root; }
  bound_address const &address() const { return cfg_.address; }

 private:
  struct prepared {
    build_artifact artifact;
    loaded_unit::ptr_t unit;
    std::shared_ptr<deploy_config const> deploy;
  };

  // Throws build_error or load_error; `phase` tells which step failed.
  prepared prepare(failure_phase &phase);
  void launch(prepared p);
  void stop_active();
  void record_failure(failure_info info);
  void on_terminal(std::uint64_t launch_id, handle_outcome const &outcome);
  std::shared_ptr<deploy_config const> load_deploy_config() const;

  supervisor_cfg cfg_;
  std::shared_ptr<builder> builder_;
  std::string const password_;

  std::mutex control_mutex_;  // serializes start/stop/reload

  mutable std::mutex state_mutex_;
  unit_status status_;
  std::uint64_t launch_id_{ 0 };
  std::optional<build_artifact> artifact_;
  loaded_unit::ptr_t loaded_;
  std::shared_ptr<host_resource_factory> factory_;
  service_handle::ptr_t handle_;
};

}  // namespace berth
