#include "host.h"

#include "tui.h"

#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <limits>
#include <set>
#include <stdexcept>

namespace berth {

namespace {

supervisor *find_supervisor(std::vector<std::unique_ptr<supervisor>> const &all,
                            std::string_view name) {
  for (auto const &s : all) {
    if (s->name() == name) { return s.get(); }
  }
  for (auto const &s : all) {
    if (s->source_root().filename() == name) { return s.get(); }
  }
  return nullptr;
}

}  // namespace

std::vector<bound_address> host_assign_addresses(bound_address const &base, std::size_t count) {
  if (count > 0 && base.port + count - 1 > std::numeric_limits<std::uint16_t>::max()) {
    throw std::invalid_argument("address range starting at " + base.to_string() +
                                " does not fit " + std::to_string(count) + " units");
  }

  std::vector<bound_address> out;
  out.reserve(count);
  for (std::size_t i{ 0 }; i < count; ++i) {
    out.push_back(bound_address{ .host = base.host,
                                 .port = static_cast<std::uint16_t>(base.port + i) });
  }
  return out;
}

host::host(host_cfg cfg, std::shared_ptr<builder> b) : cfg_{ std::move(cfg) } {
  if (cfg_.units.empty()) { throw std::invalid_argument("host requires at least one unit"); }
  if (!cfg_.registry) { cfg_.registry = provisioner_registry::with_builtins(); }

  std::set<std::string> seen;
  for (auto const &unit : cfg_.units) {
    if (auto const addr{ unit.address.to_string() }; !seen.insert(addr).second) {
      throw std::invalid_argument("duplicate address " + addr + " for " +
                                  unit.source_root.string());
    }
  }

  for (auto const &unit : cfg_.units) {
    supervisors_.push_back(std::make_unique<supervisor>(
        supervisor_cfg{ .source_root = unit.source_root,
                        .address = unit.address,
                        .env = cfg_.env,
                        .grace = cfg_.grace,
                        .build = cfg_.build,
                        .config_path = unit.config_path,
                        .registry = cfg_.registry },
        b));
  }
}

host::~host() { stop_all(); }

std::vector<unit_status> host::start_all() {
  std::vector<unit_status> result(supervisors_.size());

  int const concurrency{ cfg_.jobs ? static_cast<int>(cfg_.jobs)
                                   : tbb::task_arena::automatic };
  tbb::task_arena arena{ concurrency };
  arena.execute([&] {
    tbb::task_group group;
    for (std::size_t i{ 0 }; i < supervisors_.size(); ++i) {
      group.run([this, &result, i] { result[i] = supervisors_[i]->start(); });
    }
    group.wait();
  });

  for (auto const &status : result) { tui::info("%s", status.describe().c_str()); }
  return result;
}

std::vector<unit_status> host::stop_all() {
  std::vector<unit_status> result;
  result.reserve(supervisors_.size());
  for (auto &s : supervisors_) { result.push_back(s->stop()); }
  return result;
}

std::vector<unit_status> host::status_all() const {
  std::vector<unit_status> result;
  result.reserve(supervisors_.size());
  for (auto const &s : supervisors_) { result.push_back(s->status()); }
  return result;
}

supervisor &host::get(std::string_view name) const {
  if (auto *s{ find_supervisor(supervisors_, name) }) { return *s; }
  throw std::invalid_argument("unknown unit '" + std::string{ name } + "'");
}

unit_status host::start(std::string_view name) { return get(name).start(); }
unit_status host::stop(std::string_view name) { return get(name).stop(); }
unit_status host::reload(std::string_view name) { return get(name).reload(); }
unit_status host::status(std::string_view name) const { return get(name).status(); }

supervisor *host::find(std::string_view name) { return find_supervisor(supervisors_, name); }

std::vector<supervisor *> host::supervisors() {
  std::vector<supervisor *> out;
  for (auto &s : supervisors_) { out.push_back(s.get()); }
  return out;
}

}  // namespace berth
