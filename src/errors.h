#pragma once

// Error types shared by the host and by service units. Header-only so units can use
// them without linking anything.

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace berth {

enum class build_error_cause {
  source_missing,
  toolchain_failed,
  metadata_malformed,
  manifest_field_missing,
  invalid_unit_name,
  toolchain_too_old,
  sdk_incompatible,
  publish_failed,
};

enum class load_error_cause {
  artifact_missing,
  artifact_unreadable,
  artifact_malformed,
  entry_point_missing,
  abi_mismatch,
};

enum class provisioning_error_cause { unknown_kind, template_resolution, backend };

constexpr std::string_view cause_name(build_error_cause c) {
  switch (c) {
    case build_error_cause::source_missing: return "source_missing";
    case build_error_cause::toolchain_failed: return "toolchain_failed";
    case build_error_cause::metadata_malformed: return "metadata_malformed";
    case build_error_cause::manifest_field_missing: return "manifest_field_missing";
    case build_error_cause::invalid_unit_name: return "invalid_unit_name";
    case build_error_cause::toolchain_too_old: return "toolchain_too_old";
    case build_error_cause::sdk_incompatible: return "sdk_incompatible";
    case build_error_cause::publish_failed: return "publish_failed";
  }
  return "unknown";
}

constexpr std::string_view cause_name(load_error_cause c) {
  switch (c) {
    case load_error_cause::artifact_missing: return "artifact_missing";
    case load_error_cause::artifact_unreadable: return "artifact_unreadable";
    case load_error_cause::artifact_malformed: return "artifact_malformed";
    case load_error_cause::entry_point_missing: return "entry_point_missing";
    case load_error_cause::abi_mismatch: return "abi_mismatch";
  }
  return "unknown";
}

constexpr std::string_view cause_name(provisioning_error_cause c) {
  switch (c) {
    case provisioning_error_cause::unknown_kind: return "unknown_kind";
    case provisioning_error_cause::template_resolution: return "template_resolution";
    case provisioning_error_cause::backend: return "backend";
  }
  return "unknown";
}

// Build failed. diagnostics() holds the toolchain's output lines verbatim.
class build_error : public std::runtime_error {
 public:
  build_error(build_error_cause cause,
              std::string const &message,
              std::vector<std::string> diagnostics = {})
      : std::runtime_error{ message },
        cause_{ cause },
        diagnostics_{ std::move(diagnostics) } {}

  build_error_cause cause() const { return cause_; }
  std::vector<std::string> const &diagnostics() const { return diagnostics_; }

 private:
  build_error_cause cause_;
  std::vector<std::string> diagnostics_;
};

class load_error : public std::runtime_error {
 public:
  load_error(load_error_cause cause, std::string path, std::string const &detail)
      : std::runtime_error{ std::string{ cause_name(cause) } + ": " + path + ": " + detail },
        cause_{ cause },
        path_{ std::move(path) } {}

  load_error_cause cause() const { return cause_; }
  std::string const &path() const { return path_; }

 private:
  load_error_cause cause_;
  std::string path_;
};

class provisioning_error : public std::runtime_error {
 public:
  provisioning_error(provisioning_error_cause cause,
                     std::string kind,
                     std::string const &detail)
      : std::runtime_error{ "provisioning '" + kind + "' failed (" +
                            std::string{ cause_name(cause) } + "): " + detail },
        cause_{ cause },
        kind_{ std::move(kind) } {}

  provisioning_error_cause cause() const { return cause_; }
  std::string const &kind() const { return kind_; }

 private:
  provisioning_error_cause cause_;
  std::string kind_;
};

// Thrown by a service's serve() to report that it cannot keep serving.
class serve_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace berth
