#pragma once

#include "util.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

namespace berth {

struct source_fingerprint {
  std::size_t files{ 0 };
  std::filesystem::file_time_type newest{};
  std::uintmax_t bytes{ 0 };

  bool operator==(source_fingerprint const &) const = default;
};

// Regular files under `root`, skipping hidden directories and build output
// ("build", "cmake-build-*"). Unreadable entries are skipped.
source_fingerprint source_fingerprint_of(std::filesystem::path const &root);

bool source_watch_is_ignored_dir(std::filesystem::path const &dir);

// Polls a source tree and calls on_change from the polling thread whenever the
// fingerprint differs from the previous poll.
class source_watch : unmovable {
 public:
  source_watch(std::filesystem::path root,
               std::chrono::milliseconds interval,
               std::function<void()> on_change);
  ~source_watch();

  std::filesystem::path const &root() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace berth
