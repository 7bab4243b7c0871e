#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace berth::platform {

// Exclusive advisory lock on a file. Blocks until acquired. Serializes threads of
// this process as well as other processes.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void flush_directory(std::filesystem::path const &dir);

std::optional<std::filesystem::path> get_default_state_root();
char const *get_default_state_root_env_vars();

void set_env_var(char const *name, char const *value);

// Expands ~ and $VARS; command substitution is rejected.
std::filesystem::path expand_path(std::string_view p);

}  // namespace berth::platform
