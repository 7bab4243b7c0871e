#include "template.h"

namespace berth {

namespace {

bool is_name_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '-' || c == '.';
}

}  // namespace

std::string template_render(std::string_view text, template_vars const &vars) {
  std::string out;
  out.reserve(text.size());

  for (std::size_t i{ 0 }; i < text.size(); ++i) {
    char const c{ text[i] };

    if (c == '}') {
      if (i + 1 < text.size() && text[i + 1] == '}') {
        out.push_back('}');
        ++i;
        continue;
      }
      throw template_error("unmatched '}' at offset " + std::to_string(i) + " in '" +
                               std::string{ text } + "'",
                           {});
    }

    if (c != '{') {
      out.push_back(c);
      continue;
    }

    if (i + 1 < text.size() && text[i + 1] == '{') {
      out.push_back('{');
      ++i;
      continue;
    }

    auto const close{ text.find('}', i + 1) };
    if (close == std::string_view::npos) {
      throw template_error("unterminated placeholder in '" + std::string{ text } + "'", {});
    }

    std::string_view const name{ text.substr(i + 1, close - i - 1) };
    if (name.empty()) {
      throw template_error("empty placeholder in '" + std::string{ text } + "'", {});
    }
    for (char const n : name) {
      if (!is_name_char(n)) {
        throw template_error("invalid placeholder '{" + std::string{ name } + "}' in '" +
                                 std::string{ text } + "'",
                             std::string{ name });
      }
    }

    auto const it{ vars.find(name) };
    if (it == vars.end()) {
      throw template_error("unknown variable '" + std::string{ name } + "' in '" +
                               std::string{ text } + "'",
                           std::string{ name });
    }

    out.append(it->second);
    i = close;
  }

  return out;
}

}  // namespace berth
