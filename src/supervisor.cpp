#include "supervisor.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <stdexcept>

namespace berth {

namespace {

constexpr std::size_t kPasswordLength{ 24 };

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

}  // namespace

std::string_view unit_state_name(unit_state state) {
  switch (state) {
    case unit_state::building: return "building";
    case unit_state::loaded: return "loaded";
    case unit_state::running: return "running";
    case unit_state::stopped: return "stopped";
    case unit_state::crashed: return "crashed";
  }
  return "unknown";
}

std::string unit_status::describe() const {
  std::string out{ unit + " " + std::string{ unit_state_name(state) } };
  if (generation > 0) { out += " g" + std::to_string(generation); }
  out += " " + address.to_string();
  if (forced_stop) { out += " (forced stop)"; }
  if (!resources.empty()) {
    out += " resources=";
    for (std::size_t i{ 0 }; i < resources.size(); ++i) {
      out += (i ? "," : "") + resources[i];
    }
  }
  if (last_failure) { out += "\n  last failure: " + last_failure->describe(); }
  return out;
}

supervisor::supervisor(supervisor_cfg cfg, std::shared_ptr<builder> b)
    : cfg_{ std::move(cfg) },
      builder_{ std::move(b) },
      password_{ util_random_alnum(kPasswordLength) } {
  if (!builder_) { throw std::logic_error("supervisor requires a builder"); }
  if (!cfg_.registry) { cfg_.registry = provisioner_registry::with_builtins(); }

  status_ = unit_status{ .unit = cfg_.source_root.filename().string(),
                         .state = unit_state::stopped,
                         .generation = 0,
                         .address = cfg_.address,
                         .last_failure = std::nullopt };
}

supervisor::~supervisor() { stop_active(); }

std::string supervisor::name() const {
  std::lock_guard lock{ state_mutex_ };
  return status_.unit;
}

unit_status supervisor::status() const {
  std::lock_guard lock{ state_mutex_ };
  unit_status result{ status_ };
  if (factory_) { result.resources = factory_->provisioned(); }
  return result;
}

std::shared_ptr<deploy_config const> supervisor::load_deploy_config() const {
  if (cfg_.config_path) { return deploy_config::load(*cfg_.config_path); }
  if (auto const found{ deploy_config::discover(cfg_.source_root) }) {
    return deploy_config::load(*found);
  }
  return std::make_shared<deploy_config>();
}

supervisor::prepared supervisor::prepare(failure_phase &phase) {
  phase = failure_phase::build;

  std::shared_ptr<deploy_config const> deploy;
  try {
    deploy = load_deploy_config();
  } catch (std::runtime_error const &e) {
    throw build_error(build_error_cause::metadata_malformed,
                      std::string{ "deployment config: " } + e.what());
  }

  auto artifact{ builder_->build(cfg_.source_root, cfg_.build) };

  phase = failure_phase::load;
  auto unit{ load_unit(artifact) };

  return prepared{ .artifact = std::move(artifact),
                   .unit = std::move(unit),
                   .deploy = std::move(deploy) };
}

void supervisor::launch(prepared p) {
  std::string const &unit{ p.artifact.unit_name };
  std::string const env{ cfg_.env ? *cfg_.env : p.deploy->env.value_or("local") };
  auto const data_dir{ builder_->store().data_dir(unit) };

  auto factory{ std::make_shared<host_resource_factory>(resource_factory_cfg{
      .unit = unit,
      .registry = cfg_.registry,
      .deploy = p.deploy,
      .variables = resource_deployment_variables(unit, env, password_, data_dir, p.deploy.get()),
      .data_dir = data_dir,
      .source_root = cfg_.source_root }) };

  std::uint64_t id{ 0 };
  {
    std::lock_guard lock{ state_mutex_ };
    id = ++launch_id_;
    status_.unit = unit;
    if (status_.state != unit_state::running) { status_.state = unit_state::loaded; }
    status_.generation = p.artifact.generation;
    status_.forced_stop = false;
    factory_ = factory;
  }

  auto handle{ p.unit->start(factory,
                             cfg_.address,
                             p.artifact.generation,
                             [this, id](handle_outcome const &outcome) {
                               on_terminal(id, outcome);
                             }) };

  {
    std::lock_guard lock{ state_mutex_ };
    if (status_.state == unit_state::loaded) { status_.state = unit_state::running; }
    artifact_ = p.artifact;
    loaded_ = p.unit;
    handle_ = std::move(handle);
  }

  tui::info("[%s] generation %lld started on %s (env %s)",
            unit.c_str(),
            static_cast<long long>(p.artifact.generation),
            cfg_.address.to_string().c_str(),
            env.c_str());

  builder_->store().prune(unit, p.artifact.generation);
}

void supervisor::on_terminal(std::uint64_t launch_id, handle_outcome const &outcome) {
  std::lock_guard lock{ state_mutex_ };
  if (launch_id != launch_id_) { return; }

  status_.state =
      outcome.state == handle_state::crashed ? unit_state::crashed : unit_state::stopped;
  status_.forced_stop = outcome.forced;
  if (outcome.failure) { status_.last_failure = outcome.failure; }
}

void supervisor::stop_active() {
  service_handle::ptr_t handle;
  {
    std::lock_guard lock{ state_mutex_ };
    handle = std::move(handle_);
  }
  if (handle) { handle->stop(cfg_.grace); }
}

void supervisor::record_failure(failure_info info) {
  tui::error("[%s] %s", name().c_str(), info.describe().c_str());

  std::lock_guard lock{ state_mutex_ };
  status_.state = unit_state::crashed;
  status_.last_failure = std::move(info);
}

unit_status supervisor::start() {
  std::lock_guard control{ control_mutex_ };

  {
    std::lock_guard lock{ state_mutex_ };
    if (handle_ && !handle_->outcome()) { return status_; }
  }
  stop_active();

  std::optional<prepared> p;
  {
    std::lock_guard lock{ state_mutex_ };
    if (loaded_ && artifact_) {
      p = prepared{ .artifact = *artifact_, .unit = loaded_, .deploy = nullptr };
    } else {
      status_.state = unit_state::building;
    }
  }

  failure_phase phase{ failure_phase::build };
  try {
    if (p) {
      p->deploy = load_deploy_config();
    } else {
      p = prepare(phase);
    }
  } catch (std::exception const &) {
    record_failure(failure_from_exception(std::current_exception(), phase));
    return status();
  }

  launch(std::move(*p));
  return status();
}

unit_status supervisor::stop() {
  std::lock_guard control{ control_mutex_ };
  stop_active();

  std::lock_guard lock{ state_mutex_ };
  if (status_.state != unit_state::crashed) { status_.state = unit_state::stopped; }
  return status_;
}

unit_status supervisor::reload() {
  std::lock_guard control{ control_mutex_ };

  auto const before{ status() };
  auto const begin{ std::chrono::steady_clock::now() };
  BERTH_TRACE_RELOAD_START(before.unit, before.generation);
  tui::info("[%s] reloading (generation %lld)",
            before.unit.c_str(),
            static_cast<long long>(before.generation));

  failure_phase phase{ failure_phase::build };
  std::optional<prepared> p;
  try {
    p = prepare(phase);
  } catch (std::exception const &) {
    auto const info{ failure_from_exception(std::current_exception(), phase) };
    tui::warn("[%s] reload aborted, generation %lld untouched: %s",
              before.unit.c_str(),
              static_cast<long long>(before.generation),
              info.describe().c_str());
    BERTH_TRACE_RELOAD_ABORTED(before.unit, before.generation, info.cause);
    throw;
  }

  std::int64_t const next{ p->artifact.generation };
  {
    // Retire the old launch so its terminal event does not leave running.
    std::lock_guard lock{ state_mutex_ };
    ++launch_id_;
  }
  stop_active();
  launch(std::move(*p));

  BERTH_TRACE_RELOAD_COMPLETE(before.unit, before.generation, next, elapsed_ms(begin));
  return status();
}

}  // namespace berth
