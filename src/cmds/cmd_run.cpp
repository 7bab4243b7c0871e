#include "cmd_run.h"

#include "cmd_common.h"
#include "host.h"
#include "source_watch.h"
#include "termination.h"
#include "tui.h"
#include "util.h"

#include <CLI/CLI.hpp>

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace berth {

namespace {

constexpr char kControlUsage[]{
  "commands: status [unit], reload <unit>, stop <unit>, start <unit>, quit"
};

std::string describe_all(std::vector<unit_status> const &all) {
  std::string out;
  for (auto const &s : all) { out += s.describe() + "\n"; }
  return out;
}

// Splits complete lines out of `buffer`, leaving any partial tail in place.
std::vector<std::string> take_lines(std::string &buffer) {
  std::vector<std::string> lines;
  for (auto nl{ buffer.find('\n') }; nl != std::string::npos; nl = buffer.find('\n')) {
    lines.push_back(buffer.substr(0, nl));
    buffer.erase(0, nl + 1);
  }
  return lines;
}

}  // namespace

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Build, load and serve units") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("sources", cfg_ptr->sources, "Unit source directories")->required();
  sub->add_option("--address", cfg_ptr->address, "First unit's host:port; ports increment")
      ->capture_default_str();
  sub->add_option("--config", cfg_ptr->config_path, "Deployment config (berth.lua)")
      ->check(CLI::ExistingFile);
  sub->add_option("--env", cfg_ptr->env, "Environment name (overrides ENV)");
  sub->add_option("--grace-ms", cfg_ptr->grace_ms, "Stop grace period in milliseconds")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  sub->add_flag("--watch", cfg_ptr->watch, "Reload units when their sources change");
  sub->add_option("--poll-ms", cfg_ptr->poll_ms, "Source poll interval for --watch")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  sub->add_option("--profile", cfg_ptr->profile, "Build profile (CMAKE_BUILD_TYPE)")
      ->capture_default_str();
  sub->add_option("--jobs,-j", cfg_ptr->jobs, "Units built in parallel (0 = auto)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_run::cmd_run(cmd_run::cfg cfg,
                 std::optional<std::filesystem::path> const &cli_state_root)
    : cfg_{ std::move(cfg) }, cli_state_root_{ cli_state_root } {}

std::unique_ptr<host> cmd_run::make_host(std::shared_ptr<builder> b) const {
  if (cfg_.sources.empty()) { throw std::invalid_argument("run: no unit sources given"); }
  if (cfg_.config_path && cfg_.sources.size() > 1) {
    throw std::invalid_argument("run: --config requires a single unit source");
  }

  auto const addresses{ host_assign_addresses(bound_address::parse(cfg_.address),
                                              cfg_.sources.size()) };

  host_cfg hcfg{ .units = {},
                 .env = cfg_.env,
                 .grace = std::chrono::milliseconds{ cfg_.grace_ms },
                 .build = cmd_build_options(cfg_.profile, std::nullopt),
                 .registry = nullptr,
                 .jobs = cfg_.jobs };
  for (std::size_t i{ 0 }; i < cfg_.sources.size(); ++i) {
    hcfg.units.push_back(host_unit_cfg{ .source_root = std::filesystem::absolute(cfg_.sources[i]),
                                        .address = addresses[i],
                                        .config_path = cfg_.config_path });
  }
  return std::make_unique<host>(std::move(hcfg), std::move(b));
}

bool cmd_run::execute() {
  termination_handler_install();

  auto h{ make_host(cmd_make_builder(cli_state_root_)) };
  h->start_all();

  std::vector<std::unique_ptr<source_watch>> watches;
  if (cfg_.watch) {
    for (auto *s : h->supervisors()) {
      watches.push_back(std::make_unique<source_watch>(
          s->source_root(), std::chrono::milliseconds{ cfg_.poll_ms }, [s] {
            tui::info("[%s] sources changed, reloading", s->name().c_str());
            s->reload();
          }));
    }
  }

  tui::info("%s", kControlUsage);

  std::string buffer;
  bool stdin_open{ true };
  while (!termination_requested()) {
    std::array<pollfd, 2> fds{ { { .fd = termination_fd(), .events = POLLIN, .revents = 0 },
                                 { .fd = stdin_open ? STDIN_FILENO : -1,
                                   .events = POLLIN,
                                   .revents = 0 } } };
    if (::poll(fds.data(), fds.size(), -1) < 0) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll");
    }
    if (!(fds[1].revents & (POLLIN | POLLHUP))) { continue; }

    char chunk[1024];
    auto const n{ ::read(STDIN_FILENO, chunk, sizeof(chunk)) };
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) { continue; }
      throw std::system_error(errno, std::generic_category(), "read stdin");
    }
    if (n == 0) {
      tui::debug("stdin closed; running until terminated");
      stdin_open = false;
      continue;
    }

    buffer.append(chunk, static_cast<std::size_t>(n));
    for (auto const &line : take_lines(buffer)) {
      auto const result{ run_control_dispatch(*h, line) };
      if (!result.output.empty()) { tui::print_stdout("%s", result.output.c_str()); }
      if (result.quit) { termination_request(); }
    }
  }

  tui::info("shutting down");
  watches.clear();
  auto const final_status{ h->stop_all() };
  for (auto const &s : final_status) { tui::info("%s", s.describe().c_str()); }
  return true;
}

run_control_result run_control_dispatch(host &h, std::string_view line) {
  auto const words{ util_split_words(line) };
  if (words.empty()) { return {}; }

  auto const &verb{ words[0] };
  if (verb == "quit" || verb == "exit") { return { .output = {}, .quit = true }; }

  if (verb == "status") {
    if (words.size() == 1) { return { .output = describe_all(h.status_all()), .quit = false }; }
  } else if (verb != "reload" && verb != "stop" && verb != "start") {
    return { .output = "unknown command '" + verb + "'; " + kControlUsage + "\n",
             .quit = false };
  } else if (words.size() != 2) {
    return { .output = verb + " requires a unit name\n", .quit = false };
  }

  try {
    unit_status status;
    if (verb == "status") {
      status = h.status(words[1]);
    } else if (verb == "reload") {
      status = h.reload(words[1]);
    } else if (verb == "stop") {
      status = h.stop(words[1]);
    } else {
      status = h.start(words[1]);
    }
    return { .output = status.describe() + "\n", .quit = false };
  } catch (std::exception const &e) {
    return { .output = verb + " failed: " + e.what() + "\n", .quit = false };
  }
}

}  // namespace berth
