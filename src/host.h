#pragma once

#include "builder.h"
#include "resource_factory.h"
#include "service.h"
#include "supervisor.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace berth {

struct host_unit_cfg {
  std::filesystem::path source_root;
  bound_address address;
  std::optional<std::filesystem::path> config_path;
};

struct host_cfg {
  std::vector<host_unit_cfg> units;
  std::optional<std::string> env;
  std::chrono::milliseconds grace{ service_handle::kDefaultGrace };
  build_options build;
  std::shared_ptr<provisioner_registry const> registry;
  std::size_t jobs{ 0 };  // 0 selects the TBB default
};

// `count` addresses starting at `base`, one port apart. Throws std::invalid_argument
// if the range runs past port 65535.
std::vector<bound_address> host_assign_addresses(bound_address const &base, std::size_t count);

// Runs several units side by side, one supervisor each.
class host : unmovable {
 public:
  // Throws std::invalid_argument on an empty unit list or a duplicate address.
  host(host_cfg cfg, std::shared_ptr<builder> b);
  ~host();

  // Starts every unit in parallel; failures are reported per unit in the result.
  std::vector<unit_status> start_all();
  std::vector<unit_status> stop_all();
  std::vector<unit_status> status_all() const;

  // Per-unit runner controls. Throw std::invalid_argument for an unknown unit;
  // reload() also propagates build_error and load_error.
  unit_status start(std::string_view name);
  unit_status stop(std::string_view name);
  unit_status reload(std::string_view name);
  unit_status status(std::string_view name) const;

  // Matches the unit name, falling back to the source directory name. nullptr if none.
  supervisor *find(std::string_view name);

  std::vector<supervisor *> supervisors();

 private:
  supervisor &get(std::string_view name) const;

  host_cfg cfg_;
  std::vector<std::unique_ptr<supervisor>> supervisors_;
};

}  // namespace berth
