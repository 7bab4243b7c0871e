#pragma once

// Helpers shared by the unit tests. Linked into berth_unit_tests only.

#include "resource_factory.h"
#include "toolchain.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace berth::test {

// Paths of the test units built alongside the tests.
std::filesystem::path echo_unit_path();
std::filesystem::path scripted_unit_path();
std::filesystem::path noentry_unit_path();
std::filesystem::path abi_mismatch_unit_path();

// Fresh directory under the system temp dir. Pair with scoped_path_cleanup.
std::filesystem::path make_temp_dir(std::string const &tag);

// A currently unused loopback TCP port.
std::uint16_t free_tcp_port();

// Connects to 127.0.0.1:port, retrying for up to `timeout_ms`, and returns the first
// line the server sends. nullopt if nothing answered.
std::optional<std::string> read_line_from(std::uint16_t port, int timeout_ms);

std::vector<std::string> read_lines(std::filesystem::path const &path);

// "script" provisioner for scripted_unit; the payload can change between calls.
class script_provisioner : public resource_provisioner {
 public:
  explicit script_provisioner(std::string script = "mode=serve");

  void set(std::string script);
  std::string provision(provision_request const &request) const override;

 private:
  mutable std::mutex mutex_;
  std::string script_;
};

// Factory for scripted_unit: builtins plus the given script provisioner.
std::shared_ptr<host_resource_factory> make_script_factory(
    std::shared_ptr<script_provisioner> script,
    std::string unit = "scripted");

// Toolchain that "compiles" by copying a prebuilt test unit into the build tree. An
// empty package names the unit after its source directory.
class prebuilt_toolchain : public toolchain {
 public:
  explicit prebuilt_toolchain(std::filesystem::path library, std::string package = "scripted");

  void set_library(std::filesystem::path library);
  void fail_next_compile(bool fail);

  std::string_view name() const override { return "prebuilt"; }
  unit_metadata query_metadata(std::filesystem::path const &source_root,
                               std::filesystem::path const &build_dir,
                               build_options const &options) override;
  void compile(std::filesystem::path const &build_dir,
               unit_metadata const &metadata,
               build_options const &options) override;

 private:
  std::mutex mutex_;
  std::filesystem::path library_;
  std::string package_;
  bool fail_{ false };
};

}  // namespace berth::test
