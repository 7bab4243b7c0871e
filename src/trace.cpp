#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace berth {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(build_start),
          TRACE_NAME(build_complete),
          TRACE_NAME(build_failed),
          TRACE_NAME(toolchain_step),
          TRACE_NAME(artifact_published),
          TRACE_NAME(artifacts_pruned),
          TRACE_NAME(lock_acquired),
          TRACE_NAME(lock_released),
          TRACE_NAME(unit_loaded),
          TRACE_NAME(load_failed),
          TRACE_NAME(handle_state_changed),
          TRACE_NAME(forced_stop),
          TRACE_NAME(resource_provisioned),
          TRACE_NAME(provision_failed),
          TRACE_NAME(reload_start),
          TRACE_NAME(reload_complete),
          TRACE_NAME(reload_aborted),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(
      match{
          [&](trace_events::build_start const &value) {
            oss << " unit=" << value.unit << " source_root=" << value.source_root;
          },
          [&](trace_events::build_complete const &value) {
            oss << " unit=" << value.unit << " artifact=" << value.artifact
                << " generation=" << value.generation
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::build_failed const &value) {
            oss << " unit=" << value.unit << " cause=" << value.cause
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::toolchain_step const &value) {
            oss << " unit=" << value.unit << " command=" << value.command
                << " exit_code=" << value.exit_code
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::artifact_published const &value) {
            oss << " unit=" << value.unit << " path=" << value.path
                << " generation=" << value.generation;
          },
          [&](trace_events::artifacts_pruned const &value) {
            oss << " unit=" << value.unit << " removed=" << value.removed;
          },
          [&](trace_events::lock_acquired const &value) {
            oss << " unit=" << value.unit << " lock_path=" << value.lock_path
                << " wait_ms=" << value.wait_duration_ms;
          },
          [&](trace_events::lock_released const &value) {
            oss << " unit=" << value.unit << " lock_path=" << value.lock_path
                << " hold_ms=" << value.hold_duration_ms;
          },
          [&](trace_events::unit_loaded const &value) {
            oss << " unit=" << value.unit << " path=" << value.path
                << " sdk_version=" << value.sdk_version;
          },
          [&](trace_events::load_failed const &value) {
            oss << " unit=" << value.unit << " path=" << value.path
                << " cause=" << value.cause;
          },
          [&](trace_events::handle_state_changed const &value) {
            oss << " unit=" << value.unit << " generation=" << value.generation
                << " state=" << value.state;
          },
          [&](trace_events::forced_stop const &value) {
            oss << " unit=" << value.unit << " generation=" << value.generation
                << " grace_ms=" << value.grace_ms;
          },
          [&](trace_events::resource_provisioned const &value) {
            oss << " unit=" << value.unit << " kind=" << value.kind;
          },
          [&](trace_events::provision_failed const &value) {
            oss << " unit=" << value.unit << " kind=" << value.kind
                << " cause=" << value.cause;
          },
          [&](trace_events::reload_start const &value) {
            oss << " unit=" << value.unit << " generation=" << value.generation;
          },
          [&](trace_events::reload_complete const &value) {
            oss << " unit=" << value.unit << " old_generation=" << value.old_generation
                << " new_generation=" << value.new_generation
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::reload_aborted const &value) {
            oss << " unit=" << value.unit << " generation=" << value.generation
                << " cause=" << value.cause;
          },
      },
      event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::build_start const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "source_root", value.source_root);
          },
          [&](trace_events::build_complete const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "artifact", value.artifact);
            append_kv(output, "generation", value.generation);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::build_failed const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "cause", value.cause);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::toolchain_step const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "command", value.command);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::artifact_published const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "path", value.path);
            append_kv(output, "generation", value.generation);
          },
          [&](trace_events::artifacts_pruned const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "removed", value.removed);
          },
          [&](trace_events::lock_acquired const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "wait_duration_ms", value.wait_duration_ms);
          },
          [&](trace_events::lock_released const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "lock_path", value.lock_path);
            append_kv(output, "hold_duration_ms", value.hold_duration_ms);
          },
          [&](trace_events::unit_loaded const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "path", value.path);
            append_kv(output, "sdk_version", value.sdk_version);
          },
          [&](trace_events::load_failed const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "path", value.path);
            append_kv(output, "cause", value.cause);
          },
          [&](trace_events::handle_state_changed const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "generation", value.generation);
            append_kv(output, "state", value.state);
          },
          [&](trace_events::forced_stop const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "generation", value.generation);
            append_kv(output, "grace_ms", value.grace_ms);
          },
          [&](trace_events::resource_provisioned const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "kind", value.kind);
          },
          [&](trace_events::provision_failed const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "kind", value.kind);
            append_kv(output, "cause", value.cause);
          },
          [&](trace_events::reload_start const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "generation", value.generation);
          },
          [&](trace_events::reload_complete const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "old_generation", value.old_generation);
            append_kv(output, "new_generation", value.new_generation);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::reload_aborted const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "generation", value.generation);
            append_kv(output, "cause", value.cause);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace berth
