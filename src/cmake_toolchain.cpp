#include "cmake_toolchain.h"

#include "errors.h"
#include "tui.h"
#include "util.h"
#include "version.h"

#include <picojson.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace berth {

namespace {

std::filesystem::path api_dir(std::filesystem::path const &build_dir) {
  return build_dir / ".cmake" / "api" / "v1";
}

[[noreturn]] void malformed(std::string const &what) {
  throw build_error(build_error_cause::metadata_malformed, "CMake file API: " + what);
}

[[noreturn]] void missing(std::string const &what) {
  throw build_error(build_error_cause::manifest_field_missing, what);
}

picojson::object read_json_object(std::filesystem::path const &path) {
  std::string text;
  try {
    text = util_load_file(path);
  } catch (std::exception const &e) {
    malformed(e.what());
  }

  picojson::value root;
  if (std::string const err{ picojson::parse(root, text) }; !err.empty()) {
    malformed(path.filename().string() + ": " + err);
  }
  if (!root.is<picojson::object>()) { malformed(path.filename().string() + ": not an object"); }
  return root.get<picojson::object>();
}

template <typename T>
T const &member(picojson::object const &obj, char const *key, std::string const &where) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<T>()) {
    malformed(where + ": missing or mistyped '" + key + "'");
  }
  return it->second.get<T>();
}

template <typename T>
T const *optional_member(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<T>()) { return nullptr; }
  return &it->second.get<T>();
}

// Newest index-*.json; names sort by timestamp.
std::filesystem::path newest_index(std::filesystem::path const &reply_dir) {
  std::vector<std::filesystem::path> indexes;
  std::error_code ec;
  for (std::filesystem::directory_iterator it{ reply_dir, ec }, end; !ec && it != end;
       it.increment(ec)) {
    auto const name{ it->path().filename().string() };
    if (name.starts_with("index-") && name.ends_with(".json")) { indexes.push_back(it->path()); }
  }
  if (indexes.empty()) { malformed("no reply index in " + reply_dir.string()); }
  return *std::max_element(indexes.begin(), indexes.end());
}

std::filesystem::path reply_file(std::filesystem::path const &reply_dir,
                                 picojson::object const &index,
                                 char const *query) {
  auto const &reply{ member<picojson::object>(index, "reply", "index") };
  auto const *entry{ optional_member<picojson::object>(reply, query) };
  if (!entry) { malformed(std::string{ "no reply for " } + query); }
  return reply_dir / member<std::string>(*entry, "jsonFile", query);
}

bool is_library_type(std::string const &type) {
  return type == "MODULE_LIBRARY" || type == "SHARED_LIBRARY";
}

}  // namespace

void cmake_file_api_write_queries(std::filesystem::path const &build_dir) {
  auto const query_dir{ api_dir(build_dir) / "query" };
  std::error_code ec;
  std::filesystem::create_directories(query_dir, ec);
  if (ec) {
    throw build_error(build_error_cause::toolchain_failed,
                      "failed to create " + query_dir.string() + ": " + ec.message());
  }

  for (char const *query : { "codemodel-v2", "cache-v2" }) {
    util_write_file_synced(query_dir / query, "");
  }
}

unit_metadata cmake_file_api_read(std::filesystem::path const &build_dir,
                                  std::string const &profile,
                                  std::optional<std::string> const &target) {
  auto const reply_dir{ api_dir(build_dir) / "reply" };
  auto const index{ read_json_object(newest_index(reply_dir)) };

  unit_metadata meta;

  auto const &cmake{ member<picojson::object>(index, "cmake", "index") };
  auto const &version{ member<picojson::object>(cmake, "version", "index.cmake") };
  meta.toolchain_version = member<std::string>(version, "string", "index.cmake.version");

  auto const codemodel{ read_json_object(reply_file(reply_dir, index, "codemodel-v2")) };
  auto const &configs{ member<picojson::array>(codemodel, "configurations", "codemodel") };
  if (configs.empty() || !configs.front().is<picojson::object>()) {
    malformed("codemodel has no configurations");
  }

  picojson::object const *config{ &configs.front().get<picojson::object>() };
  for (auto const &c : configs) {
    if (!c.is<picojson::object>()) { continue; }
    auto const *name{ optional_member<std::string>(c.get<picojson::object>(), "name") };
    if (name && *name == profile) {
      config = &c.get<picojson::object>();
      break;
    }
  }

  auto const &projects{ member<picojson::array>(*config, "projects", "configuration") };
  if (projects.empty() || !projects.front().is<picojson::object>()) {
    missing("CMakeLists.txt declares no project()");
  }
  meta.package_name =
      member<std::string>(projects.front().get<picojson::object>(), "name", "project");

  // Top-level directory carries cmake_minimum_required (file API 2.5+).
  if (auto const *dirs{ optional_member<picojson::array>(*config, "directories") };
      dirs && !dirs->empty() && dirs->front().is<picojson::object>()) {
    auto const &top{ dirs->front().get<picojson::object>() };
    if (auto const *min{ optional_member<picojson::object>(top, "minimumCMakeVersion") }) {
      if (auto const *s{ optional_member<std::string>(*min, "string") }) {
        meta.minimum_toolchain_version = *s;
      }
    }
  }

  auto const &paths{ member<picojson::object>(codemodel, "paths", "codemodel") };
  std::filesystem::path const reply_build_dir{
    member<std::string>(paths, "build", "codemodel.paths")
  };

  std::vector<picojson::object> libraries;
  for (auto const &t : member<picojson::array>(*config, "targets", "configuration")) {
    if (!t.is<picojson::object>()) { malformed("target entry is not an object"); }
    auto const &entry{ t.get<picojson::object>() };
    auto const &name{ member<std::string>(entry, "name", "target") };
    if (target && name != *target) { continue; }

    auto const detail{ read_json_object(
        reply_dir / member<std::string>(entry, "jsonFile", "target " + name)) };
    auto const &type{ member<std::string>(detail, "type", "target " + name) };
    if (target && !is_library_type(type)) {
      throw build_error(build_error_cause::manifest_field_missing,
                        "target '" + name + "' is a " + type +
                            ", expected MODULE or SHARED library");
    }
    if (is_library_type(type)) { libraries.push_back(detail); }
  }

  if (libraries.empty()) {
    missing(target ? "no target named '" + *target + "'"
                   : std::string{ "no MODULE or SHARED library target" });
  }
  if (libraries.size() > 1) {
    std::string names;
    for (auto const &lib : libraries) {
      if (!names.empty()) { names += ", "; }
      names += member<std::string>(lib, "name", "target");
    }
    missing("several library targets (" + names + "); choose one with --target");
  }

  auto const &lib{ libraries.front() };
  meta.target = member<std::string>(lib, "name", "target");

  auto const &artifacts{ member<picojson::array>(lib, "artifacts", "target " + meta.target) };
  if (artifacts.empty() || !artifacts.front().is<picojson::object>()) {
    malformed("target " + meta.target + " has no artifacts");
  }
  std::filesystem::path const artifact{
    member<std::string>(artifacts.front().get<picojson::object>(), "path", "artifact")
  };
  meta.artifact = artifact.is_absolute() ? artifact : reply_build_dir / artifact;

  auto const cache{ read_json_object(reply_file(reply_dir, index, "cache-v2")) };
  for (auto const &e : member<picojson::array>(cache, "entries", "cache")) {
    if (!e.is<picojson::object>()) { continue; }
    auto const &entry{ e.get<picojson::object>() };
    auto const *name{ optional_member<std::string>(entry, "name") };
    auto const *value{ optional_member<std::string>(entry, "value") };
    if (!name || !value || value->empty()) { continue; }

    if (*name == "BERTH_UNIT_NAME") {
      meta.unit_name = *value;
    } else if (*name == "BERTH_REQUIRED_SDK_VERSION") {
      meta.required_sdk_version = *value;
    }
  }

  return meta;
}

cmake_toolchain::cmake_toolchain(std::string cmake_program)
    : cmake_{ std::move(cmake_program) } {}

unit_metadata cmake_toolchain::query_metadata(std::filesystem::path const &source_root,
                                              std::filesystem::path const &build_dir,
                                              build_options const &options) {
  cmake_file_api_write_queries(build_dir);

  std::vector<std::string> argv{ cmake_,
                                 "-S",
                                 source_root.string(),
                                 "-B",
                                 build_dir.string(),
                                 "-DCMAKE_BUILD_TYPE=" + options.profile };
  if (!options.sdk_include_dir.empty()) {
    argv.push_back("-DBERTH_SDK_INCLUDE_DIR=" + options.sdk_include_dir.string());
  }
  toolchain_run_step("cmake-configure", argv, options);

  auto meta{ cmake_file_api_read(build_dir, options.profile, options.target) };

  bool satisfied{ false };
  try {
    satisfied = version_satisfies(meta.toolchain_version, kMinimumCMakeVersion);
  } catch (std::invalid_argument const &) {
    malformed("unparseable CMake version '" + meta.toolchain_version + "'");
  }
  if (!satisfied) {
    throw build_error(build_error_cause::toolchain_too_old,
                      "CMake " + meta.toolchain_version + " is older than the required " +
                          kMinimumCMakeVersion);
  }

  tui::debug("cmake metadata: package=%s target=%s artifact=%s cmake=%s",
             meta.package_name.c_str(),
             meta.target.c_str(),
             meta.artifact.string().c_str(),
             meta.toolchain_version.c_str());
  return meta;
}

void cmake_toolchain::compile(std::filesystem::path const &build_dir,
                              unit_metadata const &metadata,
                              build_options const &options) {
  toolchain_run_step("cmake-build",
                     { cmake_,
                       "--build",
                       build_dir.string(),
                       "--target",
                       metadata.target,
                       "--config",
                       options.profile },
                     options);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(metadata.artifact, ec)) {
    throw build_error(build_error_cause::toolchain_failed,
                      "build succeeded but " + metadata.artifact.string() + " was not produced");
  }
}

}  // namespace berth
