#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace berth {

enum class failure_phase { build, load, construct, serve };

std::string_view failure_phase_name(failure_phase phase);

// Captured description of why a unit or a reload attempt failed.
struct failure_info {
  failure_phase phase;
  std::string cause;  // stable identifier, e.g. "toolchain_failed", "unknown_kind"
  std::string message;
  std::optional<std::string> resource_kind;
  std::vector<std::string> diagnostics;

  std::string describe() const;
};

// Classifies the in-flight exception `ep`. Never throws.
failure_info failure_from_exception(std::exception_ptr ep, failure_phase phase);

failure_info failure_unexpected_return();

}  // namespace berth
