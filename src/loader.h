#pragma once

#include "builder.h"
#include "service.h"
#include "service_handle.h"
#include "util.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace berth {

// An opened unit library whose entry point passed every check. The library stays
// mapped while this object or any handle started from it is alive.
class loaded_unit : public std::enable_shared_from_this<loaded_unit>, unmovable {
 public:
  using ptr_t = std::shared_ptr<loaded_unit const>;

  ~loaded_unit();

  std::string const &unit() const { return unit_; }
  std::filesystem::path const &path() const { return path_; }
  std::string_view sdk_version() const;

  // Runs construct then serve on a new worker thread.
  service_handle::ptr_t start(std::shared_ptr<resource_factory> factory,
                              bound_address address,
                              std::int64_t generation = 0,
                              service_handle::terminal_cb_t on_terminal = {}) const;

 private:
  friend ptr_t load_unit(std::filesystem::path const &artifact, std::string unit);

  loaded_unit(std::string unit, std::filesystem::path path, void *library, unit_abi const *abi);

  std::string unit_;
  std::filesystem::path path_;
  void *library_;
  unit_abi const *abi_;
};

// Opens `artifact` and validates its entry point. No unit code other than the entry
// point runs. Throws load_error.
loaded_unit::ptr_t load_unit(std::filesystem::path const &artifact, std::string unit = {});
loaded_unit::ptr_t load_unit(build_artifact const &artifact);

}  // namespace berth
