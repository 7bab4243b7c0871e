#include "loader.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <dlfcn.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace berth {

namespace {

struct library_closer {
  void operator()(void *library) const noexcept {
    if (library) { ::dlclose(library); }
  }
};

using library_ptr_t = std::unique_ptr<void, library_closer>;

std::string last_dl_error(char const *fallback) {
  char const *err{ ::dlerror() };
  return err ? err : fallback;
}

}  // namespace

loaded_unit::loaded_unit(std::string unit,
                         std::filesystem::path path,
                         void *library,
                         unit_abi const *abi)
    : unit_{ std::move(unit) }, path_{ std::move(path) }, library_{ library }, abi_{ abi } {}

loaded_unit::~loaded_unit() {
  tui::debug("Unloading %s", path_.string().c_str());
  library_closer{}(library_);
}

std::string_view loaded_unit::sdk_version() const {
  return abi_->sdk_version ? abi_->sdk_version : "unknown";
}

service_handle::ptr_t loaded_unit::start(std::shared_ptr<resource_factory> factory,
                                         bound_address address,
                                         std::int64_t generation,
                                         service_handle::terminal_cb_t on_terminal) const {
  return service_handle::launch(service_handle::launch_cfg{ .unit = unit_,
                                                            .generation = generation,
                                                            .address = std::move(address),
                                                            .abi = abi_,
                                                            .keep_alive = shared_from_this(),
                                                            .factory = std::move(factory),
                                                            .on_terminal = std::move(on_terminal) });
}

loaded_unit::ptr_t load_unit(std::filesystem::path const &artifact, std::string unit) {
  if (unit.empty()) { unit = artifact.stem().string(); }
  std::string const path_str{ artifact.string() };

  auto const fail{ [&](load_error_cause cause, std::string const &detail) {
    load_error err{ cause, path_str, detail };
    tui::error("Failed to load %s: %s", unit.c_str(), err.what());
    BERTH_TRACE_LOAD_FAILED(unit, path_str, std::string{ cause_name(cause) });
    return err;
  } };

  std::error_code ec;
  if (!std::filesystem::exists(artifact, ec)) {
    throw fail(load_error_cause::artifact_missing, "no such file");
  }
  if (!std::filesystem::is_regular_file(artifact, ec)) {
    throw fail(load_error_cause::artifact_unreadable, "not a regular file");
  }
  if (::access(artifact.c_str(), R_OK) != 0) {
    throw fail(load_error_cause::artifact_unreadable, std::strerror(errno));
  }

  ::dlerror();
  library_ptr_t library{ ::dlopen(artifact.c_str(), RTLD_NOW | RTLD_LOCAL) };
  if (!library) {
    throw fail(load_error_cause::artifact_malformed, last_dl_error("dlopen failed"));
  }

  ::dlerror();
  void *const sym{ ::dlsym(library.get(), kUnitEntrySymbol) };
  if (!sym) {
    throw fail(load_error_cause::entry_point_missing,
               std::string{ kUnitEntrySymbol } + ": " + last_dl_error("symbol not found"));
  }

  auto const entry{ reinterpret_cast<unit_entry_fn>(sym) };
  unit_abi const *const abi{ entry() };
  if (!abi) { throw fail(load_error_cause::abi_mismatch, "entry point returned null"); }
  if (abi->abi_version != kUnitAbiVersion) {
    throw fail(load_error_cause::abi_mismatch,
               "ABI version " + std::to_string(abi->abi_version) + ", host expects " +
                   std::to_string(kUnitAbiVersion));
  }
  if (abi->struct_size != sizeof(unit_abi)) {
    throw fail(load_error_cause::abi_mismatch,
               "entry table is " + std::to_string(abi->struct_size) + " bytes, host expects " +
                   std::to_string(sizeof(unit_abi)));
  }
  if (!abi->construct || !abi->destroy) {
    throw fail(load_error_cause::abi_mismatch, "entry table has null functions");
  }

  loaded_unit::ptr_t loaded{ new loaded_unit{ unit, artifact, library.release(), abi } };
  tui::info("Loaded %s from %s (sdk %s)",
            unit.c_str(),
            path_str.c_str(),
            std::string{ loaded->sdk_version() }.c_str());
  BERTH_TRACE_UNIT_LOADED(unit, path_str, std::string{ loaded->sdk_version() });
  return loaded;
}

loaded_unit::ptr_t load_unit(build_artifact const &artifact) {
  return load_unit(artifact.path, artifact.unit_name);
}

}  // namespace berth
