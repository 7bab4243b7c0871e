#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace berth {

// Unit names must be usable as host labels: 1-63 characters from [a-z0-9-], no
// leading or trailing '-', and not a reserved word.

// Returns the reason `name` is invalid, or nullopt if it is valid.
std::optional<std::string> unit_name_problem(std::string_view name);

inline bool unit_name_is_valid(std::string_view name) {
  return !unit_name_problem(name).has_value();
}

// Human-readable statement of the rules, for error messages.
std::string_view unit_name_rules();

}  // namespace berth
