#pragma once

#include "resource_factory.h"

namespace berth {

// "database": connection URL. `url` wins if present; otherwise assembled from
// engine, user, password, host, port and name.
class database_provisioner : public resource_provisioner {
 public:
  std::string provision(provision_request const &request) const override;
};

// "secrets": the config rendered as a JSON object.
class secrets_provisioner : public resource_provisioner {
 public:
  std::string provision(provision_request const &request) const override;
};

// "persist": creates <data_dir>/persist/<name> and returns its path.
class persist_provisioner : public resource_provisioner {
 public:
  std::string provision(provision_request const &request) const override;
};

// "static-folder": <source_root>/<folder>, which must already exist.
class static_folder_provisioner : public resource_provisioner {
 public:
  std::string provision(provision_request const &request) const override;
};

void provisioners_register_builtins(provisioner_registry &registry);

}  // namespace berth
