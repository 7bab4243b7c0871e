#include "service_handle.h"

#include "trace.h"
#include "tui.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace berth {

std::string_view handle_state_name(handle_state state) {
  switch (state) {
    case handle_state::loaded: return "loaded";
    case handle_state::constructing: return "constructing";
    case handle_state::serving: return "serving";
    case handle_state::stopped: return "stopped";
    case handle_state::crashed: return "crashed";
  }
  return "unknown";
}

struct service_handle::shared_state {
  launch_cfg cfg;
  cancel_token cancel;

  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  handle_state state{ handle_state::loaded };
  std::optional<handle_outcome> outcome;
  std::thread worker;

  // Caller holds mutex.
  void transition(handle_state next) {
    state = next;
    BERTH_TRACE_HANDLE_STATE_CHANGED(cfg.unit,
                                     cfg.generation,
                                     std::string{ handle_state_name(next) });
  }

  // Records the terminal outcome unless one exists already (a forced stop got there
  // first). Fires the terminal callback outside the lock.
  void finish(handle_outcome result) {
    terminal_cb_t cb;
    {
      std::lock_guard lock{ mutex };
      if (outcome) {
        tui::debug("[%s g%lld] worker finished after forced stop",
                   cfg.unit.c_str(),
                   static_cast<long long>(cfg.generation));
        return;
      }
      transition(result.state);
      outcome = result;
      cb = std::move(cfg.on_terminal);
    }
    cv.notify_all();

    if (result.failure) {
      tui::error("[%s g%lld] crashed: %s",
                 cfg.unit.c_str(),
                 static_cast<long long>(cfg.generation),
                 result.failure->describe().c_str());
    } else {
      tui::info("[%s g%lld] stopped%s",
                cfg.unit.c_str(),
                static_cast<long long>(cfg.generation),
                result.forced ? " (forced)" : "");
    }

    if (cb) { cb(result); }
  }
};

service_handle::ptr_t service_handle::launch(launch_cfg cfg) {
  if (!cfg.abi || !cfg.abi->construct || !cfg.abi->destroy) {
    throw std::logic_error("service_handle::launch requires a complete unit_abi");
  }
  if (!cfg.factory) { throw std::logic_error("service_handle::launch requires a factory"); }

  auto state{ std::make_shared<shared_state>() };
  state->cfg = std::move(cfg);

  ptr_t handle{ new service_handle{ state } };
  {
    std::lock_guard lock{ state->mutex };
    state->worker = std::thread{ &service_handle::run, state };
  }
  return handle;
}

service_handle::service_handle(std::shared_ptr<shared_state> state) : s_{ std::move(state) } {}

service_handle::~service_handle() {
  stop(kDefaultGrace);

  std::lock_guard lock{ s_->mutex };
  if (s_->worker.joinable()) {
    if (s_->worker.get_id() == std::this_thread::get_id()) {
      s_->worker.detach();
    } else {
      s_->worker.join();
    }
  }
}

void service_handle::run(std::shared_ptr<shared_state> state) {
  auto const &cfg{ state->cfg };

  {
    std::lock_guard lock{ state->mutex };
    if (state->outcome) { return; }  // forced stop before the worker got going
    state->transition(handle_state::constructing);
  }

  std::unique_ptr<service, void (*)(service *)> svc{ nullptr, cfg.abi->destroy };
  try {
    svc.reset(cfg.abi->construct(*cfg.factory));
    if (!svc) { throw std::runtime_error("construct returned no service"); }
  } catch (...) {
    state->finish(handle_outcome{
        .state = handle_state::crashed,
        .failure = failure_from_exception(std::current_exception(), failure_phase::construct) });
    return;
  }

  {
    std::unique_lock lock{ state->mutex };
    if (state->cancel.stop_requested()) {
      lock.unlock();
      svc.reset();
      state->finish(handle_outcome{ .state = handle_state::stopped, .failure = std::nullopt });
      return;
    }
    state->transition(handle_state::serving);
  }

  tui::info("[%s g%lld] serving on %s",
            cfg.unit.c_str(),
            static_cast<long long>(cfg.generation),
            cfg.address.to_string().c_str());

  std::optional<failure_info> failure;
  try {
    svc->serve(cfg.address, state->cancel);
    if (!state->cancel.stop_requested()) { failure = failure_unexpected_return(); }
  } catch (...) {
    auto info{ failure_from_exception(std::current_exception(), failure_phase::serve) };
    if (state->cancel.stop_requested()) {
      tui::warn("[%s g%lld] error during shutdown: %s",
                cfg.unit.c_str(),
                static_cast<long long>(cfg.generation),
                info.describe().c_str());
    } else {
      failure = std::move(info);
    }
  }

  svc.reset();
  state->finish(handle_outcome{
      .state = failure ? handle_state::crashed : handle_state::stopped,
      .failure = std::move(failure) });
}

std::string const &service_handle::unit() const { return s_->cfg.unit; }

std::int64_t service_handle::generation() const { return s_->cfg.generation; }

bound_address const &service_handle::address() const { return s_->cfg.address; }

handle_state service_handle::state() const {
  std::lock_guard lock{ s_->mutex };
  return s_->state;
}

std::optional<handle_outcome> service_handle::outcome() const {
  std::lock_guard lock{ s_->mutex };
  return s_->outcome;
}

std::optional<handle_outcome> service_handle::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock lock{ s_->mutex };
  s_->cv.wait_for(lock, timeout, [this] { return s_->outcome.has_value(); });
  return s_->outcome;
}

handle_outcome service_handle::stop(std::chrono::milliseconds grace) {
  s_->cancel.request_stop();

  std::unique_lock lock{ s_->mutex };
  if (!s_->cv.wait_for(lock, grace, [this] { return s_->outcome.has_value(); })) {
    handle_outcome forced{ .state = handle_state::stopped, .failure = std::nullopt, .forced = true };
    s_->transition(handle_state::stopped);
    s_->outcome = forced;
    auto cb{ std::move(s_->cfg.on_terminal) };
    if (s_->worker.joinable()) { s_->worker.detach(); }
    lock.unlock();
    s_->cv.notify_all();

    tui::warn("[%s g%lld] did not stop within %lld ms; abandoning its worker",
              s_->cfg.unit.c_str(),
              static_cast<long long>(s_->cfg.generation),
              static_cast<long long>(grace.count()));
    BERTH_TRACE_FORCED_STOP(s_->cfg.unit,
                            s_->cfg.generation,
                            static_cast<std::int64_t>(grace.count()));
    if (cb) { cb(forced); }
    return forced;
  }

  handle_outcome result{ *s_->outcome };
  if (s_->worker.joinable() && s_->worker.get_id() != std::this_thread::get_id()) {
    std::thread worker{ std::move(s_->worker) };
    lock.unlock();
    worker.join();
  }
  return result;
}

}  // namespace berth
