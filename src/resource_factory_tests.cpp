#include "resource_factory.h"

#include "provisioners.h"
#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

struct counting_provisioner : berth::resource_provisioner {
  mutable std::atomic_int calls{ 0 };

  std::string provision(berth::provision_request const &request) const override {
    ++calls;
    return request.kind + ":" + berth::config_value_to_string(request.config.at("name"));
  }
};

struct failing_provisioner : berth::resource_provisioner {
  std::string provision(berth::provision_request const &) const override {
    throw std::runtime_error("backend unavailable");
  }
};

std::shared_ptr<berth::deploy_config const> staging_config() {
  return berth::deploy_config::load(R"lua(
ENV = "staging"
RESOURCES = { database = { url = "{env}-db" } }
)lua",
                                    "berth.lua");
}

berth::resource_factory_cfg make_cfg(std::shared_ptr<berth::deploy_config const> deploy = {}) {
  return berth::resource_factory_cfg{
    .unit = "api",
    .registry = berth::provisioner_registry::with_builtins(),
    .deploy = deploy,
    .variables = berth::resource_deployment_variables("api",
                                                      "staging",
                                                      "pw",
                                                      "/tmp/berth-data/api",
                                                      deploy.get()),
    .data_dir = "/tmp/berth-data/api",
    .source_root = "/tmp/berth-src/api",
  };
}

}  // namespace

TEST_CASE("provisioner_registry stores and lists kinds") {
  berth::provisioner_registry registry;
  auto const p{ std::make_shared<counting_provisioner>() };
  registry.add("queue", p);

  CHECK(registry.find("queue") == p.get());
  CHECK(registry.find("cache") == nullptr);
  CHECK(registry.kinds() == std::vector<std::string>{ "queue" });

  CHECK_THROWS_AS(registry.add("queue", p), std::logic_error);
  CHECK_THROWS_AS(registry.add("null", nullptr), std::logic_error);
}

TEST_CASE("provisioner_registry::with_builtins registers the local kinds") {
  auto const registry{ berth::provisioner_registry::with_builtins() };
  CHECK(registry->kinds() ==
        std::vector<std::string>{ "database", "persist", "secrets", "static-folder" });
}

TEST_CASE("resource_deployment_variables") {
  auto const deploy{ berth::deploy_config::load(
      "VARIABLES = { region = 'eu', env = 'shadowed' }", "berth.lua") };
  auto const vars{ berth::resource_deployment_variables("api", "local", "pw", "/d", deploy.get()) };

  CHECK(vars.at("project") == "api");
  CHECK(vars.at("unit") == "api");
  CHECK(vars.at("env") == "local");
  CHECK(vars.at("password") == "pw");
  CHECK(vars.at("data_dir") == "/d");
  CHECK(vars.at("region") == "eu");
}

TEST_CASE("host_resource_factory renders deployment overrides") {
  berth::host_resource_factory factory{ make_cfg(staging_config()) };
  CHECK(factory.unit_name() == "api");

  auto const conn{ factory.provision("database", {}) };
  CHECK(conn.kind == "database");
  CHECK(conn.payload == "staging-db");
  CHECK(factory.provisioned() == std::vector<std::string>{ "database" });
}

TEST_CASE("host_resource_factory lets deployment values win over the service's") {
  berth::host_resource_factory factory{ make_cfg(staging_config()) };
  auto const conn{ factory.provision("database", { { "url", std::string{ "dev-db" } } }) };
  CHECK(conn.payload == "staging-db");
}

TEST_CASE("host_resource_factory renders service-supplied templates") {
  berth::host_resource_factory factory{ make_cfg() };
  auto const conn{ factory.provision("database", { { "name", std::string{ "{unit}_{env}" } } }) };
  CHECK(conn.payload == "postgres://api:pw@localhost:5432/api_staging");
}

TEST_CASE("host_resource_factory reports unknown kinds") {
  berth::host_resource_factory factory{ make_cfg() };

  try {
    factory.provision("message-queue", {});
    FAIL("expected provisioning_error");
  } catch (berth::provisioning_error const &e) {
    CHECK(e.cause() == berth::provisioning_error_cause::unknown_kind);
    CHECK(e.kind() == "message-queue");
    CHECK(std::string{ e.what() }.find("message-queue") != std::string::npos);
  }
  CHECK(factory.provisioned().empty());
}

TEST_CASE("host_resource_factory reports unresolvable templates") {
  berth::host_resource_factory factory{ make_cfg() };

  try {
    factory.provision("database", { { "url", std::string{ "{region}-db" } } });
    FAIL("expected provisioning_error");
  } catch (berth::provisioning_error const &e) {
    CHECK(e.cause() == berth::provisioning_error_cause::template_resolution);
    CHECK(e.kind() == "database");
    CHECK(std::string{ e.what() }.find("region") != std::string::npos);
  }
}

TEST_CASE("host_resource_factory wraps provisioner failures as backend") {
  auto registry{ std::make_shared<berth::provisioner_registry>() };
  registry->add("flaky", std::make_shared<failing_provisioner>());

  auto cfg{ make_cfg() };
  cfg.registry = registry;
  berth::host_resource_factory factory{ std::move(cfg) };

  try {
    factory.provision("flaky", {});
    FAIL("expected provisioning_error");
  } catch (berth::provisioning_error const &e) {
    CHECK(e.cause() == berth::provisioning_error_cause::backend);
    CHECK(e.kind() == "flaky");
    CHECK(std::string{ e.what() }.find("backend unavailable") != std::string::npos);
  }
}

TEST_CASE("host_resource_factory passes non-string values through untouched") {
  auto registry{ std::make_shared<berth::provisioner_registry>() };
  registry->add("secrets", std::make_shared<berth::secrets_provisioner>());

  auto cfg{ make_cfg() };
  cfg.registry = registry;
  berth::host_resource_factory factory{ std::move(cfg) };

  auto const conn{ factory.provision(
      "secrets",
      { { "retries", std::int64_t{ 3 } }, { "tls", true }, { "token", std::string{ "{{x}}" } } }) };
  CHECK(conn.payload == R"({"retries":3,"tls":true,"token":"{x}"})");
}

TEST_CASE("host_resource_factory is safe to call concurrently") {
  auto registry{ std::make_shared<berth::provisioner_registry>() };
  auto const counter{ std::make_shared<counting_provisioner>() };
  registry->add("queue", counter);

  auto cfg{ make_cfg() };
  cfg.registry = registry;
  berth::host_resource_factory factory{ std::move(cfg) };

  std::vector<std::thread> threads;
  for (int i{ 0 }; i < 8; ++i) {
    threads.emplace_back([&factory, i] {
      for (int j{ 0 }; j < 25; ++j) {
        auto const conn{ factory.provision("queue",
                                           { { "name", std::int64_t{ i } } }) };
        CHECK(conn.payload == "queue:" + std::to_string(i));
      }
    });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(counter->calls == 200);
  CHECK(factory.provisioned().size() == 200);
}
