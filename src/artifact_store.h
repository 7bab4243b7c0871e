#pragma once

#include "platform.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace berth {

// On-disk state under one root:
//   units/<unit>/<unit>-g<N>.so   published artifacts, one per generation
//   build/<key>/                  toolchain build trees
//   data/<unit>/                  provisioned resource data
//   locks/<name>.lock             cross-process locks
class artifact_store : unmovable {
 public:
  using path = std::filesystem::path;

  // Held while one generation of a unit is being published. Destroying it without
  // commit() removes the staging file and leaves published artifacts untouched.
  class publish_lock : unmovable {
   public:
    using ptr_t = std::unique_ptr<publish_lock>;

    ~publish_lock();

    std::int64_t generation() const;
    path const &staging_path() const;
    path const &final_path() const;

    // Copies `compiled` to the staging path, fsyncs it and renames it into place.
    // Throws build_error(publish_failed). Returns the final path.
    path commit(path const &compiled);

   private:
    friend class artifact_store;
    publish_lock(std::string unit,
                 platform::file_lock lock,
                 path lock_path,
                 std::int64_t generation,
                 path staging,
                 path final_path);

    struct impl;
    std::unique_ptr<impl> m;
  };

  struct artifact_entry {
    std::int64_t generation;
    path file;
  };

  // nullopt uses the platform default state root. Throws std::runtime_error if there
  // is none.
  explicit artifact_store(std::optional<path> root = std::nullopt);
  ~artifact_store();

  path const &root() const;
  path unit_dir(std::string_view unit) const;
  path build_dir(std::string_view key) const;
  path data_dir(std::string_view unit) const;
  path lock_path(std::string_view name) const;

  // Blocks until no other publisher of `unit` (in any process) is active, then
  // reserves the next generation.
  publish_lock::ptr_t begin_publish(std::string const &unit);

  // Published artifacts of `unit`, oldest generation first.
  std::vector<artifact_entry> artifacts(std::string_view unit) const;

  // Removes every published generation of `unit` except `keep`. Returns the count removed.
  std::size_t prune(std::string_view unit, std::int64_t keep) const;

  static std::string artifact_filename(std::string_view unit, std::int64_t generation);
  static std::optional<std::int64_t> parse_generation(std::string_view unit,
                                                      std::string_view filename);

 private:
  path root_;
};

// The CLI override, else the platform default (BERTH_STATE_ROOT, XDG_CACHE_HOME, HOME).
// Throws std::runtime_error if none is available.
std::filesystem::path resolve_state_root(std::optional<std::filesystem::path> cli_override);

}  // namespace berth
