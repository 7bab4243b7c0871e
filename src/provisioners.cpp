#include "provisioners.h"

#include <picojson.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace berth {

namespace {

std::string field_or(resource_config const &config,
                     std::string_view field,
                     std::string fallback) {
  auto const it{ config.find(field) };
  return it == config.end() ? fallback : config_value_to_string(it->second);
}

// Rejects values that would let a resource escape its root directory.
std::string checked_relative(std::string const &value, char const *field) {
  std::filesystem::path const p{ value };
  if (value.empty() || p.is_absolute()) {
    throw std::invalid_argument(std::string{ field } + " must be a non-empty relative path");
  }
  for (auto const &part : p) {
    if (part == "..") {
      throw std::invalid_argument(std::string{ field } + " must not contain '..'");
    }
  }
  return value;
}

}  // namespace

std::string database_provisioner::provision(provision_request const &request) const {
  if (auto const url{ request.config.find("url") }; url != request.config.end()) {
    return config_value_to_string(url->second);
  }

  auto const password_it{ request.variables.find("password") };
  std::string const default_password{
    password_it == request.variables.end() ? std::string{} : password_it->second
  };

  std::string const engine{ field_or(request.config, "engine", "postgres") };
  std::string const user{ field_or(request.config, "user", request.unit) };
  std::string const password{ field_or(request.config, "password", default_password) };
  std::string const host{ field_or(request.config, "host", "localhost") };
  std::string const port{ field_or(request.config, "port", "5432") };
  std::string const name{ field_or(request.config, "name", request.unit) };

  if (engine.empty() || host.empty() || name.empty()) {
    throw std::invalid_argument("engine, host and name must not be empty");
  }

  return engine + "://" + user + ":" + password + "@" + host + ":" + port + "/" + name;
}

std::string secrets_provisioner::provision(provision_request const &request) const {
  picojson::object obj;
  for (auto const &[key, value] : request.config) {
    obj[key] = std::visit(match{
                              [](std::string const &s) { return picojson::value{ s }; },
                              [](std::int64_t i) {
                                return picojson::value{ static_cast<double>(i) };
                              },
                              [](double d) { return picojson::value{ d }; },
                              [](bool b) { return picojson::value{ b }; },
                          },
                          value);
  }
  return picojson::value{ obj }.serialize();
}

std::string persist_provisioner::provision(provision_request const &request) const {
  std::string const name{ checked_relative(field_or(request.config, "name", "default"),
                                           "name") };
  auto const dir{ request.data_dir / "persist" / name };

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::system_error(ec, "failed to create persist directory " + dir.string());
  }
  return dir.string();
}

std::string static_folder_provisioner::provision(provision_request const &request) const {
  std::string const folder{ checked_relative(field_or(request.config, "folder", "static"),
                                             "folder") };
  auto const dir{ request.source_root / folder };

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    throw std::runtime_error("static folder does not exist: " + dir.string());
  }
  return std::filesystem::canonical(dir).string();
}

void provisioners_register_builtins(provisioner_registry &registry) {
  registry.add("database", std::make_shared<database_provisioner>());
  registry.add("secrets", std::make_shared<secrets_provisioner>());
  registry.add("persist", std::make_shared<persist_provisioner>());
  registry.add("static-folder", std::make_shared<static_folder_provisioner>());
}

}  // namespace berth
