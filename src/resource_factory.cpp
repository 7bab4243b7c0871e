#include "resource_factory.h"

#include "provisioners.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace berth {

void provisioner_registry::add(std::string kind,
                               std::shared_ptr<resource_provisioner const> provisioner) {
  if (!provisioner) {
    throw std::logic_error("provisioner for kind '" + kind + "' is null");
  }
  if (provisioners_.contains(kind)) {
    throw std::logic_error("provisioner already registered for kind '" + kind + "'");
  }
  provisioners_.emplace(std::move(kind), std::move(provisioner));
}

resource_provisioner const *provisioner_registry::find(std::string_view kind) const {
  auto const it{ provisioners_.find(kind) };
  return it == provisioners_.end() ? nullptr : it->second.get();
}

std::vector<std::string> provisioner_registry::kinds() const {
  std::vector<std::string> result;
  result.reserve(provisioners_.size());
  for (auto const &[kind, _] : provisioners_) { result.push_back(kind); }
  return result;
}

std::shared_ptr<provisioner_registry const> provisioner_registry::with_builtins() {
  auto registry{ std::make_shared<provisioner_registry>() };
  provisioners_register_builtins(*registry);
  return registry;
}

template_vars resource_deployment_variables(std::string const &unit,
                                            std::string const &env,
                                            std::string const &password,
                                            std::filesystem::path const &data_dir,
                                            deploy_config const *deploy) {
  template_vars vars{
    { "project", unit },
    { "unit", unit },
    { "env", env },
    { "password", password },
    { "data_dir", data_dir.string() },
  };

  if (deploy) {
    for (auto const &[name, value] : deploy->variables) {
      if (!vars.emplace(name, value).second) {
        tui::warn("Ignoring VARIABLES.%s: shadows a built-in variable", name.c_str());
      }
    }
  }
  return vars;
}

host_resource_factory::host_resource_factory(resource_factory_cfg cfg)
    : cfg_{ std::move(cfg) } {
  if (!cfg_.registry) { throw std::logic_error("host_resource_factory requires a registry"); }
}

void host_resource_factory::fail(provisioning_error_cause cause,
                                 std::string const &kind,
                                 std::string const &detail) const {
  provisioning_error err{ cause, kind, detail };
  tui::warn("[%s] %s", cfg_.unit.c_str(), err.what());
  BERTH_TRACE_PROVISION_FAILED(cfg_.unit, kind, std::string{ cause_name(cause) });
  throw err;
}

resource_connection host_resource_factory::provision(std::string_view kind,
                                                     resource_config const &config) {
  std::string const kind_str{ kind };

  auto const *provisioner{ cfg_.registry->find(kind) };
  if (!provisioner) {
    std::string known;
    for (auto const &k : cfg_.registry->kinds()) {
      known += known.empty() ? k : ", " + k;
    }
    fail(provisioning_error_cause::unknown_kind,
         kind_str,
         "no provisioner for this kind (known: " + known + ")");
  }

  resource_config merged{ config };
  if (cfg_.deploy) {
    if (auto const *overrides{ cfg_.deploy->find(kind) }) {
      for (auto const &[field, value] : *overrides) { merged[field] = value; }
    }
  }

  resource_config rendered;
  for (auto const &[field, value] : merged) {
    auto const *text{ std::get_if<std::string>(&value) };
    if (!text) {
      rendered.emplace(field, value);
      continue;
    }

    try {
      rendered.emplace(field, template_render(*text, cfg_.variables));
    } catch (template_error const &e) {
      fail(provisioning_error_cause::template_resolution,
           kind_str,
           "field '" + field + "': " + e.what());
    }
  }

  std::string payload;
  try {
    payload = provisioner->provision(provision_request{ .kind = kind_str,
                                                        .unit = cfg_.unit,
                                                        .config = rendered,
                                                        .variables = cfg_.variables,
                                                        .data_dir = cfg_.data_dir,
                                                        .source_root = cfg_.source_root });
  } catch (provisioning_error const &) {
    throw;
  } catch (std::exception const &e) {
    fail(provisioning_error_cause::backend, kind_str, e.what());
  }

  ledger_.push_back(kind_str);
  tui::debug("[%s] provisioned %s", cfg_.unit.c_str(), kind_str.c_str());
  BERTH_TRACE_RESOURCE_PROVISIONED(cfg_.unit, kind_str);

  return resource_connection{ .kind = kind_str, .payload = std::move(payload) };
}

std::vector<std::string> host_resource_factory::provisioned() const {
  return { ledger_.begin(), ledger_.end() };
}

}  // namespace berth
