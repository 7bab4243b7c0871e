#pragma once

#include "deploy_config.h"
#include "service.h"
#include "template.h"
#include "util.h"

#include "tbb/concurrent_vector.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace berth {

// Everything a provisioner may look at. Config values are already merged with the
// deployment overrides and rendered.
struct provision_request {
  std::string const &kind;
  std::string const &unit;
  resource_config const &config;
  template_vars const &variables;
  std::filesystem::path const &data_dir;
  std::filesystem::path const &source_root;
};

// Strategy for one resource kind. Returns the connection payload; any exception is
// reported to the unit as a backend failure.
class resource_provisioner {
 public:
  virtual ~resource_provisioner() = default;
  virtual std::string provision(provision_request const &request) const = 0;
};

class provisioner_registry {
 public:
  // Throws std::logic_error if `kind` is already registered.
  void add(std::string kind, std::shared_ptr<resource_provisioner const> provisioner);

  resource_provisioner const *find(std::string_view kind) const;
  std::vector<std::string> kinds() const;

  // database, secrets, persist, static-folder
  static std::shared_ptr<provisioner_registry const> with_builtins();

 private:
  std::map<std::string, std::shared_ptr<resource_provisioner const>, std::less<>> provisioners_;
};

// Template variables every unit sees: project, unit, env, password, data_dir, plus
// the user's VARIABLES (which cannot shadow the built-in names).
template_vars resource_deployment_variables(std::string const &unit,
                                            std::string const &env,
                                            std::string const &password,
                                            std::filesystem::path const &data_dir,
                                            deploy_config const *deploy);

struct resource_factory_cfg {
  std::string unit;
  std::shared_ptr<provisioner_registry const> registry;
  std::shared_ptr<deploy_config const> deploy;  // may be null
  template_vars variables;
  std::filesystem::path data_dir;
  std::filesystem::path source_root;
};

// Scoped to one unit and one data directory. Immutable after construction except for
// the ledger of provisioned kinds.
class host_resource_factory : public resource_factory, unmovable {
 public:
  explicit host_resource_factory(resource_factory_cfg cfg);

  resource_connection provision(std::string_view kind,
                                resource_config const &config) override;
  std::string const &unit_name() const override { return cfg_.unit; }

  std::vector<std::string> provisioned() const;

 private:
  [[noreturn]] void fail(provisioning_error_cause cause,
                         std::string const &kind,
                         std::string const &detail) const;

  resource_factory_cfg cfg_;
  tbb::concurrent_vector<std::string> ledger_;
};

}  // namespace berth
