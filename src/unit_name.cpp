#include "unit_name.h"

#include <array>

namespace berth {

namespace {

constexpr std::size_t kMaxLength{ 63 };

constexpr std::array<std::string_view, 5> kReserved{
  "berth", "berthapp", "console", "unstable", "staging",
};

bool is_label_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

}  // namespace

std::optional<std::string> unit_name_problem(std::string_view name) {
  if (name.empty()) { return std::string{ "unit name is empty" }; }

  if (name.size() > kMaxLength) {
    return "unit name '" + std::string{ name } + "' is longer than " +
           std::to_string(kMaxLength) + " characters";
  }

  for (char const c : name) {
    if (!is_label_char(c)) {
      return "unit name '" + std::string{ name } + "' contains '" + std::string(1, c) +
             "'; only lowercase letters, digits and '-' are allowed";
    }
  }

  if (name.front() == '-' || name.back() == '-') {
    return "unit name '" + std::string{ name } + "' starts or ends with '-'";
  }

  for (auto const reserved : kReserved) {
    if (name == reserved) {
      return "unit name '" + std::string{ name } + "' is reserved";
    }
  }

  return std::nullopt;
}

std::string_view unit_name_rules() {
  return "unit names must be 1-63 characters of lowercase letters, digits and '-', "
         "must not start or end with '-', and must not be one of: berth, berthapp, "
         "console, unstable, staging";
}

}  // namespace berth
