#include "version.h"

#include <semver.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace berth {

namespace {

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

bool all_digits(std::string_view s) {
  if (s.empty()) { return false; }
  for (char const c : s) {
    if (c < '0' || c > '9') { return false; }
  }
  return true;
}

}  // namespace

std::optional<std::string> version_normalize(std::string_view v) {
  v = trim(v);
  if (v.empty()) { return std::nullopt; }

  // Split off any pre-release or build suffix; only the numeric core is padded.
  auto const suffix_pos{ v.find_first_of("-+") };
  std::string_view core{ v.substr(0, suffix_pos) };
  std::string_view const suffix{ suffix_pos == std::string_view::npos
                                     ? std::string_view{}
                                     : v.substr(suffix_pos) };

  std::string parts[3]{ "0", "0", "0" };
  int count{ 0 };
  while (!core.empty()) {
    auto const dot{ core.find('.') };
    std::string_view const part{ core.substr(0, dot) };
    if (!all_digits(part)) { return std::nullopt; }
    if (count < 3) { parts[count] = std::string{ part }; }
    ++count;
    if (dot == std::string_view::npos) { break; }
    core.remove_prefix(dot + 1);
    if (core.empty()) { return std::nullopt; }
  }
  if (count == 0 || count > 4) { return std::nullopt; }

  std::string result{ parts[0] + "." + parts[1] + "." + parts[2] };
  result.append(suffix);

  semver::version<> parsed;
  if (!semver::parse(result, parsed)) { return std::nullopt; }
  return result;
}

bool version_satisfies(std::string_view available, std::string_view required) {
  auto const avail{ version_normalize(available) };
  if (!avail) {
    throw std::invalid_argument("unparseable version: " + std::string{ available });
  }
  auto const req{ version_normalize(required) };
  if (!req) {
    throw std::invalid_argument("unparseable version requirement: " +
                                std::string{ required });
  }

  semver::version<> a;
  semver::version<> r;
  semver::parse(*avail, a);
  semver::parse(*req, r);
  return a >= r;
}

}  // namespace berth
