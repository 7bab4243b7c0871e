#include "builder.h"

#include "errors.h"
#include "service.h"
#include "trace.h"
#include "tui.h"
#include "unit_name.h"
#include "version.h"

#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace berth {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

// FNV-1a; stable across runs and platforms.
std::uint64_t fnv1a(std::string_view s) {
  std::uint64_t h{ 14695981039346656037ull };
  for (unsigned char const c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return h;
}

void require_version(std::string_view available,
                     std::string_view required,
                     build_error_cause too_old,
                     std::string const &what) {
  bool ok{ false };
  try {
    ok = version_satisfies(available, required);
  } catch (std::invalid_argument const &e) {
    throw build_error(build_error_cause::metadata_malformed,
                      what + ": " + e.what());
  }
  if (!ok) {
    throw build_error(too_old,
                      what + ": " + std::string{ required } + " required, " +
                          std::string{ available } + " available");
  }
}

void report_failure(std::string const &label,
                    build_error const &e,
                    std::chrono::steady_clock::time_point start) {
  tui::error("Build of %s failed: %s", label.c_str(), e.what());
  for (auto const &line : e.diagnostics()) { tui::error("  %s", line.c_str()); }
  BERTH_TRACE_BUILD_FAILED(label, std::string{ cause_name(e.cause()) }, elapsed_ms(start));
}

}  // namespace

builder::builder(std::shared_ptr<artifact_store> store, std::shared_ptr<toolchain> tc)
    : store_{ std::move(store) }, toolchain_{ std::move(tc) } {
  if (!store_ || !toolchain_) { throw std::logic_error("builder requires a store and a toolchain"); }
}

std::string builder::source_key(std::filesystem::path const &source_root) {
  std::error_code ec;
  auto canonical{ std::filesystem::weakly_canonical(source_root, ec) };
  if (ec) { canonical = source_root.lexically_normal(); }

  std::string dirname{ canonical.filename().string() };
  if (dirname.empty()) { dirname = "root"; }

  char hash[17]{};
  std::snprintf(hash,
                sizeof hash,
                "%016llx",
                static_cast<unsigned long long>(fnv1a(canonical.string())));
  return dirname + "-" + std::string{ hash, 8 };
}

build_artifact builder::build(std::filesystem::path const &source_root,
                              build_options const &options) const {
  auto const start{ std::chrono::steady_clock::now() };
  std::string label{ source_root.filename().string() };
  BERTH_TRACE_BUILD_START(label, source_root.string());

  try {
    std::error_code ec;
    if (!std::filesystem::is_directory(source_root, ec)) {
      throw build_error(build_error_cause::source_missing,
                        "source directory does not exist: " + source_root.string());
    }
    if (!std::filesystem::is_regular_file(source_root / "CMakeLists.txt", ec)) {
      throw build_error(build_error_cause::source_missing,
                        "no CMakeLists.txt in " + source_root.string());
    }

    auto const key{ source_key(source_root) };
    auto const build_dir{ store_->build_dir(key) };
    auto const lock_file{ store_->lock_path("build-" + key) };
    std::filesystem::create_directories(lock_file.parent_path(), ec);
    if (!ec) { std::filesystem::create_directories(build_dir, ec); }
    if (ec) {
      throw build_error(build_error_cause::toolchain_failed,
                        "failed to create " + build_dir.string() + ": " + ec.message());
    }

    auto const wait_start{ std::chrono::steady_clock::now() };
    platform::file_lock build_lock{ lock_file };
    auto const locked_at{ std::chrono::steady_clock::now() };
    BERTH_TRACE_LOCK_ACQUIRED(label, lock_file.string(), elapsed_ms(wait_start));

    auto const meta{ toolchain_->query_metadata(source_root, build_dir, options) };

    std::string const name{ meta.unit_name.value_or(meta.package_name) };
    if (name.empty()) {
      throw build_error(build_error_cause::manifest_field_missing,
                        "project declares no name");
    }
    if (auto const problem{ unit_name_problem(name) }) {
      throw build_error(build_error_cause::invalid_unit_name,
                        "invalid unit name '" + name + "': " + *problem + " (" +
                            std::string{ unit_name_rules() } + ")");
    }
    label = name;

    if (meta.required_sdk_version) {
      require_version(BERTH_SDK_VERSION,
                      *meta.required_sdk_version,
                      build_error_cause::sdk_incompatible,
                      "berth SDK");
    }
    if (meta.minimum_toolchain_version) {
      require_version(meta.toolchain_version,
                      *meta.minimum_toolchain_version,
                      build_error_cause::toolchain_too_old,
                      std::string{ toolchain_->name() });
    }

    tui::info("Building %s (%s, %s)",
              name.c_str(),
              meta.target.c_str(),
              options.profile.c_str());
    toolchain_->compile(build_dir, meta, options);

    auto publish{ store_->begin_publish(name) };
    auto const published{ publish->commit(meta.artifact) };
    std::int64_t const generation{ publish->generation() };
    publish.reset();

    BERTH_TRACE_LOCK_RELEASED(label, lock_file.string(), elapsed_ms(locked_at));

    std::int64_t const duration_ms{ elapsed_ms(start) };
    tui::info("Built %s generation %lld in %lld ms",
              name.c_str(),
              static_cast<long long>(generation),
              static_cast<long long>(duration_ms));
    BERTH_TRACE_BUILD_COMPLETE(name, published.string(), generation, duration_ms);

    return build_artifact{ .unit_name = name,
                           .path = published,
                           .built_at = std::chrono::system_clock::now(),
                           .generation = generation,
                           .toolchain_version = meta.toolchain_version };
  } catch (build_error const &e) {
    report_failure(label, e, start);
    throw;
  } catch (std::exception const &e) {
    build_error wrapped{ build_error_cause::toolchain_failed, e.what() };
    report_failure(label, wrapped, start);
    throw wrapped;
  }
}

}  // namespace berth
