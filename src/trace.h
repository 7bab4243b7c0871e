#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace berth {

namespace trace_events {

struct build_start {
  std::string unit;
  std::string source_root;
};

struct build_complete {
  std::string unit;
  std::string artifact;
  std::int64_t generation;
  std::int64_t duration_ms;
};

struct build_failed {
  std::string unit;
  std::string cause;
  std::int64_t duration_ms;
};

struct toolchain_step {
  std::string unit;
  std::string command;
  int exit_code;
  std::int64_t duration_ms;
};

struct artifact_published {
  std::string unit;
  std::string path;
  std::int64_t generation;
};

struct artifacts_pruned {
  std::string unit;
  std::int64_t removed;
};

struct lock_acquired {
  std::string unit;
  std::string lock_path;
  std::int64_t wait_duration_ms;
};

struct lock_released {
  std::string unit;
  std::string lock_path;
  std::int64_t hold_duration_ms;
};

struct unit_loaded {
  std::string unit;
  std::string path;
  std::string sdk_version;
};

struct load_failed {
  std::string unit;
  std::string path;
  std::string cause;
};

struct handle_state_changed {
  std::string unit;
  std::int64_t generation;
  std::string state;
};

struct forced_stop {
  std::string unit;
  std::int64_t generation;
  std::int64_t grace_ms;
};

struct resource_provisioned {
  std::string unit;
  std::string kind;
};

struct provision_failed {
  std::string unit;
  std::string kind;
  std::string cause;
};

struct reload_start {
  std::string unit;
  std::int64_t generation;
};

struct reload_complete {
  std::string unit;
  std::int64_t old_generation;
  std::int64_t new_generation;
  std::int64_t duration_ms;
};

struct reload_aborted {
  std::string unit;
  std::int64_t generation;
  std::string cause;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::build_start,
                                   trace_events::build_complete,
                                   trace_events::build_failed,
                                   trace_events::toolchain_step,
                                   trace_events::artifact_published,
                                   trace_events::artifacts_pruned,
                                   trace_events::lock_acquired,
                                   trace_events::lock_released,
                                   trace_events::unit_loaded,
                                   trace_events::load_failed,
                                   trace_events::handle_state_changed,
                                   trace_events::forced_stop,
                                   trace_events::resource_provisioned,
                                   trace_events::provision_failed,
                                   trace_events::reload_start,
                                   trace_events::reload_complete,
                                   trace_events::reload_aborted>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace berth

#define BERTH_TRACE_UNLIKELY [[unlikely]]

#define BERTH_TRACE_EMIT(event_expr) \
  do { \
    if (::berth::tui::g_trace_enabled) BERTH_TRACE_UNLIKELY { \
        ::berth::tui::trace event_expr; \
      } \
  } while (0)

#define BERTH_TRACE_BUILD_START(unit_value, source_root_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::build_start{ \
      .unit = (unit_value), \
      .source_root = (source_root_value), \
  }))

#define BERTH_TRACE_BUILD_COMPLETE(unit_value, artifact_value, generation_value, duration_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::build_complete{ \
      .unit = (unit_value), \
      .artifact = (artifact_value), \
      .generation = (generation_value), \
      .duration_ms = (duration_value), \
  }))

#define BERTH_TRACE_BUILD_FAILED(unit_value, cause_value, duration_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::build_failed{ \
      .unit = (unit_value), \
      .cause = (cause_value), \
      .duration_ms = (duration_value), \
  }))

#define BERTH_TRACE_TOOLCHAIN_STEP(unit_value, command_value, exit_code_value, duration_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::toolchain_step{ \
      .unit = (unit_value), \
      .command = (command_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))

#define BERTH_TRACE_ARTIFACT_PUBLISHED(unit_value, path_value, generation_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::artifact_published{ \
      .unit = (unit_value), \
      .path = (path_value), \
      .generation = (generation_value), \
  }))

#define BERTH_TRACE_ARTIFACTS_PRUNED(unit_value, removed_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::artifacts_pruned{ \
      .unit = (unit_value), \
      .removed = (removed_value), \
  }))

#define BERTH_TRACE_LOCK_ACQUIRED(unit_value, lock_path_value, wait_duration_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::lock_acquired{ \
      .unit = (unit_value), \
      .lock_path = (lock_path_value), \
      .wait_duration_ms = (wait_duration_value), \
  }))

#define BERTH_TRACE_LOCK_RELEASED(unit_value, lock_path_value, hold_duration_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::lock_released{ \
      .unit = (unit_value), \
      .lock_path = (lock_path_value), \
      .hold_duration_ms = (hold_duration_value), \
  }))

#define BERTH_TRACE_UNIT_LOADED(unit_value, path_value, sdk_version_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::unit_loaded{ \
      .unit = (unit_value), \
      .path = (path_value), \
      .sdk_version = (sdk_version_value), \
  }))

#define BERTH_TRACE_LOAD_FAILED(unit_value, path_value, cause_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::load_failed{ \
      .unit = (unit_value), \
      .path = (path_value), \
      .cause = (cause_value), \
  }))

#define BERTH_TRACE_HANDLE_STATE_CHANGED(unit_value, generation_value, state_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::handle_state_changed{ \
      .unit = (unit_value), \
      .generation = (generation_value), \
      .state = (state_value), \
  }))

#define BERTH_TRACE_FORCED_STOP(unit_value, generation_value, grace_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::forced_stop{ \
      .unit = (unit_value), \
      .generation = (generation_value), \
      .grace_ms = (grace_value), \
  }))

#define BERTH_TRACE_RESOURCE_PROVISIONED(unit_value, kind_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::resource_provisioned{ \
      .unit = (unit_value), \
      .kind = (kind_value), \
  }))

#define BERTH_TRACE_PROVISION_FAILED(unit_value, kind_value, cause_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::provision_failed{ \
      .unit = (unit_value), \
      .kind = (kind_value), \
      .cause = (cause_value), \
  }))

#define BERTH_TRACE_RELOAD_START(unit_value, generation_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::reload_start{ \
      .unit = (unit_value), \
      .generation = (generation_value), \
  }))

#define BERTH_TRACE_RELOAD_COMPLETE(unit_value, old_value, new_value, duration_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::reload_complete{ \
      .unit = (unit_value), \
      .old_generation = (old_value), \
      .new_generation = (new_value), \
      .duration_ms = (duration_value), \
  }))

#define BERTH_TRACE_RELOAD_ABORTED(unit_value, generation_value, cause_value) \
  BERTH_TRACE_EMIT((::berth::trace_events::reload_aborted{ \
      .unit = (unit_value), \
      .generation = (generation_value), \
      .cause = (cause_value), \
  }))
