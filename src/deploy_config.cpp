#include "deploy_config.h"

#include "sol_util.h"
#include "tui.h"

#include <cmath>
#include <stdexcept>

namespace berth {

namespace {

config_value to_config_value(sol::object const &value, std::string const &context) {
  switch (value.get_type()) {
    case sol::type::string: return value.as<std::string>();
    case sol::type::boolean: return value.as<bool>();
    case sol::type::number: {
      double const d{ value.as<double>() };
      // 2^63 itself is out of range; int64 max rounds up to it as a double.
      if (std::trunc(d) == d && d >= -0x1p63 && d < 0x1p63) {
        return static_cast<std::int64_t>(d);
      }
      return d;
    }
    default:
      throw std::runtime_error(context + " must be a string, number or boolean, got " +
                               std::string{ sol_util_type_name(value) });
  }
}

std::string key_string(sol::object const &key, std::string const &context) {
  if (key.get_type() != sol::type::string) {
    throw std::runtime_error(context + ": keys must be strings, got " +
                             std::string{ sol_util_type_name(key) });
  }
  return key.as<std::string>();
}

}  // namespace

std::optional<std::filesystem::path> deploy_config::discover(
    std::filesystem::path const &source_root) {
  auto const candidate{ source_root / kFileName };
  std::error_code ec;
  if (std::filesystem::is_regular_file(candidate, ec)) { return candidate; }
  return std::nullopt;
}

std::unique_ptr<deploy_config> deploy_config::load(std::filesystem::path const &path) {
  tui::debug("Loading deploy config from file: %s", path.string().c_str());
  return load(util_load_file(path), path);
}

std::unique_ptr<deploy_config> deploy_config::load(std::string_view script,
                                                   std::filesystem::path const &origin) {
  auto lua{ sol_util_make_lua_state() };

  if (sol::protected_function_result result{
          lua->safe_script(script, sol::script_pass_on_error, origin.string()) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to execute deploy config " + origin.string() + ": " +
                             err.what());
  }

  auto cfg{ std::make_unique<deploy_config>() };
  cfg->origin = origin;

  sol::table const globals{ lua->globals() };
  std::string const context{ origin.string() };
  cfg->env = sol_util_get_optional<std::string>(globals, "ENV", context);

  if (auto const vars{ sol_util_get_optional<sol::table>(globals, "VARIABLES", context) }) {
    for (auto const &[key, value] : *vars) {
      std::string const name{ key_string(key, "VARIABLES") };
      cfg->variables[name] = config_value_to_string(to_config_value(value, "VARIABLES." + name));
    }
  }

  if (auto const resources{ sol_util_get_optional<sol::table>(globals, "RESOURCES", context) }) {
    for (auto const &[key, value] : *resources) {
      std::string const kind{ key_string(key, "RESOURCES") };
      if (value.get_type() != sol::type::table) {
        throw std::runtime_error("RESOURCES." + kind + " must be a table, got " +
                                 std::string{ sol_util_type_name(value) });
      }

      resource_config fields;
      for (auto const &[field_key, field_value] : value.as<sol::table>()) {
        std::string const field{ key_string(field_key, "RESOURCES." + kind) };
        fields[field] = to_config_value(field_value, "RESOURCES." + kind + "." + field);
      }
      cfg->resources[kind] = std::move(fields);
    }
  }

  tui::debug("Deploy config %s: %zu resource override(s), %zu variable(s)",
             origin.string().c_str(),
             cfg->resources.size(),
             cfg->variables.size());
  return cfg;
}

resource_config const *deploy_config::find(std::string_view kind) const {
  auto const it{ resources.find(kind) };
  return it == resources.end() ? nullptr : &it->second;
}

}  // namespace berth
