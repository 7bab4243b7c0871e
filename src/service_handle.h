#pragma once

#include "failure.h"
#include "service.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace berth {

enum class handle_state { loaded, constructing, serving, stopped, crashed };

std::string_view handle_state_name(handle_state state);

struct handle_outcome {
  handle_state state;                   // stopped or crashed
  std::optional<failure_info> failure;  // set when crashed
  bool forced{ false };                 // stop grace period expired
};

// One running instance of a loaded unit. construct() and serve() run on the
// handle's own worker thread; the state only moves forward
// (loaded -> constructing -> serving -> stopped | crashed) and the terminal outcome
// is produced exactly once.
class service_handle : unmovable {
 public:
  using ptr_t = std::unique_ptr<service_handle>;
  using terminal_cb_t = std::function<void(handle_outcome const &)>;

  static constexpr std::chrono::milliseconds kDefaultGrace{ 5000 };

  struct launch_cfg {
    std::string unit;
    std::int64_t generation{ 0 };
    bound_address address;
    unit_abi const *abi{ nullptr };
    std::shared_ptr<void const> keep_alive;  // keeps the library mapped
    std::shared_ptr<resource_factory> factory;
    terminal_cb_t on_terminal;  // runs on the worker thread, or on the stop() caller's
                                // thread for a forced stop; must not call stop()
  };

  // Spawns the worker. Throws std::logic_error on a malformed cfg.
  static ptr_t launch(launch_cfg cfg);

  // Stops with kDefaultGrace if still running.
  ~service_handle();

  std::string const &unit() const;
  std::int64_t generation() const;
  bound_address const &address() const;

  handle_state state() const;
  std::optional<handle_outcome> outcome() const;

  // Blocks until the handle is terminal or `timeout` elapses.
  std::optional<handle_outcome> wait_for(std::chrono::milliseconds timeout) const;

  // Requests a cooperative stop and waits up to `grace`. If the service has not
  // returned by then its worker is abandoned and the outcome is Stopped with
  // forced set. On a terminal handle this does nothing and returns the same outcome.
  handle_outcome stop(std::chrono::milliseconds grace = kDefaultGrace);

 private:
  struct shared_state;

  explicit service_handle(std::shared_ptr<shared_state> state);
  static void run(std::shared_ptr<shared_state> state);

  std::shared_ptr<shared_state> s_;
};

}  // namespace berth
