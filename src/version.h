#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace berth {

// Pads short numeric versions to three components ("3.20" -> "3.20.0", "4" -> "4.0.0")
// and drops a fourth numeric component ("3.28.0.1" -> "3.28.0"). Returns nullopt if the
// result does not parse as semver.
std::optional<std::string> version_normalize(std::string_view v);

// True if `available` is at least `required`. Both are normalized first.
// Throws std::invalid_argument if either side does not parse.
bool version_satisfies(std::string_view available, std::string_view required);

}  // namespace berth
