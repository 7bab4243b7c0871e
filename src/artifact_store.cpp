#include "artifact_store.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace berth {

namespace {

constexpr std::string_view kArtifactExtension{ ".so" };

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

}  // namespace

struct artifact_store::publish_lock::impl {
  std::string unit;
  platform::file_lock lock;
  path lock_path;
  std::int64_t generation;
  path staging;
  path final_path;
  std::chrono::steady_clock::time_point acquired_at{ std::chrono::steady_clock::now() };
  bool committed{ false };
};

artifact_store::publish_lock::publish_lock(std::string unit,
                                           platform::file_lock lock,
                                           path lock_path,
                                           std::int64_t generation,
                                           path staging,
                                           path final_path)
    : m{ std::make_unique<impl>(impl{ .unit = std::move(unit),
                                      .lock = std::move(lock),
                                      .lock_path = std::move(lock_path),
                                      .generation = generation,
                                      .staging = std::move(staging),
                                      .final_path = std::move(final_path) }) } {}

artifact_store::publish_lock::~publish_lock() {
  if (!m->committed) {
    std::error_code ec;
    std::filesystem::remove(m->staging, ec);
    if (ec) {
      tui::warn("Failed to remove staging file %s: %s",
                m->staging.string().c_str(),
                ec.message().c_str());
    }
  }

  std::int64_t const hold_ms{ elapsed_ms(m->acquired_at) };
  BERTH_TRACE_LOCK_RELEASED(m->unit, m->lock_path.string(), hold_ms);
}

std::int64_t artifact_store::publish_lock::generation() const { return m->generation; }

artifact_store::path const &artifact_store::publish_lock::staging_path() const {
  return m->staging;
}

artifact_store::path const &artifact_store::publish_lock::final_path() const {
  return m->final_path;
}

artifact_store::path artifact_store::publish_lock::commit(path const &compiled) {
  if (m->committed) {
    throw std::logic_error("publish_lock::commit called twice for " + m->final_path.string());
  }

  try {
    util_copy_file_synced(compiled, m->staging);
    platform::atomic_rename(m->staging, m->final_path);
    platform::flush_directory(m->final_path.parent_path());
  } catch (std::exception const &e) {
    throw build_error(build_error_cause::publish_failed,
                      "failed to publish " + m->final_path.string() + ": " + e.what());
  }

  m->committed = true;
  tui::debug("Published %s (generation %lld)",
             m->final_path.string().c_str(),
             static_cast<long long>(m->generation));
  BERTH_TRACE_ARTIFACT_PUBLISHED(m->unit, m->final_path.string(), m->generation);
  return m->final_path;
}

artifact_store::artifact_store(std::optional<path> root)
    : root_{ resolve_state_root(std::move(root)) } {}

artifact_store::~artifact_store() = default;

artifact_store::path const &artifact_store::root() const { return root_; }

artifact_store::path artifact_store::unit_dir(std::string_view unit) const {
  return root_ / "units" / unit;
}

artifact_store::path artifact_store::build_dir(std::string_view key) const {
  return root_ / "build" / key;
}

artifact_store::path artifact_store::data_dir(std::string_view unit) const {
  return root_ / "data" / unit;
}

artifact_store::path artifact_store::lock_path(std::string_view name) const {
  return root_ / "locks" / (std::string{ name } + ".lock");
}

artifact_store::publish_lock::ptr_t artifact_store::begin_publish(std::string const &unit) {
  auto const dir{ unit_dir(unit) };
  auto const lock_file{ lock_path("publish-" + unit) };

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (!ec) { std::filesystem::create_directories(lock_file.parent_path(), ec); }
  if (ec) {
    throw build_error(build_error_cause::publish_failed,
                      "failed to create " + dir.string() + ": " + ec.message());
  }

  auto const wait_start{ std::chrono::steady_clock::now() };
  platform::file_lock lock{ lock_file };
  BERTH_TRACE_LOCK_ACQUIRED(unit, lock_file.string(), elapsed_ms(wait_start));

  std::int64_t generation{ 1 };
  if (auto const existing{ artifacts(unit) }; !existing.empty()) {
    generation = existing.back().generation + 1;
  }

  auto const final_path{ dir / artifact_filename(unit, generation) };
  auto const staging{ dir / ("." + artifact_filename(unit, generation) + ".staging-" +
                             util_random_alnum(8)) };

  return publish_lock::ptr_t{ new publish_lock{
      unit, std::move(lock), lock_file, generation, staging, final_path } };
}

std::vector<artifact_store::artifact_entry> artifact_store::artifacts(
    std::string_view unit) const {
  std::vector<artifact_entry> result;

  std::error_code ec;
  std::filesystem::directory_iterator it{ unit_dir(unit), ec };
  if (ec) { return result; }

  for (auto const &entry : it) {
    if (!entry.is_regular_file(ec)) { continue; }
    if (auto const gen{ parse_generation(unit, entry.path().filename().string()) }) {
      result.push_back(artifact_entry{ .generation = *gen, .file = entry.path() });
    }
  }

  std::sort(result.begin(), result.end(), [](auto const &a, auto const &b) {
    return a.generation < b.generation;
  });
  return result;
}

std::size_t artifact_store::prune(std::string_view unit, std::int64_t keep) const {
  std::size_t removed{ 0 };
  for (auto const &entry : artifacts(unit)) {
    if (entry.generation == keep) { continue; }

    std::error_code ec;
    if (std::filesystem::remove(entry.file, ec)) {
      ++removed;
    } else if (ec) {
      tui::warn("Failed to prune %s: %s", entry.file.string().c_str(), ec.message().c_str());
    }
  }

  if (removed > 0) {
    tui::debug("Pruned %zu artifact(s) of %.*s",
               removed,
               static_cast<int>(unit.size()),
               unit.data());
    BERTH_TRACE_ARTIFACTS_PRUNED(std::string{ unit }, static_cast<std::int64_t>(removed));
  }
  return removed;
}

std::string artifact_store::artifact_filename(std::string_view unit, std::int64_t generation) {
  return std::string{ unit } + "-g" + std::to_string(generation) +
         std::string{ kArtifactExtension };
}

std::optional<std::int64_t> artifact_store::parse_generation(std::string_view unit,
                                                             std::string_view filename) {
  std::string const prefix{ std::string{ unit } + "-g" };
  if (!filename.starts_with(prefix) || !filename.ends_with(kArtifactExtension)) {
    return std::nullopt;
  }

  std::string_view const digits{ filename.substr(
      prefix.size(), filename.size() - prefix.size() - kArtifactExtension.size()) };
  if (digits.empty() || digits.size() > 18) { return std::nullopt; }

  std::int64_t value{ 0 };
  for (char const c : digits) {
    if (c < '0' || c > '9') { return std::nullopt; }
    value = value * 10 + (c - '0');
  }
  if (value == 0) { return std::nullopt; }
  return value;
}

std::filesystem::path resolve_state_root(std::optional<std::filesystem::path> cli_override) {
  if (cli_override) { return platform::expand_path(cli_override->string()); }

  if (auto root{ platform::get_default_state_root() }) { return *root; }

  throw std::runtime_error(std::string{ "cannot determine state root; set " } +
                           platform::get_default_state_root_env_vars());
}

}  // namespace berth
