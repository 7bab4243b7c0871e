#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace berth {

using template_vars = std::map<std::string, std::string, std::less<>>;

class template_error : public std::runtime_error {
 public:
  template_error(std::string const &message, std::string variable)
      : std::runtime_error{ message }, variable_{ std::move(variable) } {}

  // Offending variable name; empty for syntax errors.
  std::string const &variable() const { return variable_; }

 private:
  std::string variable_;
};

// Substitutes "{name}" with vars[name]. "{{" and "}}" produce literal braces.
// Throws template_error for unknown variables or malformed placeholders.
std::string template_render(std::string_view text, template_vars const &vars);

}  // namespace berth
