// Test unit: exports the entry point with a table from a future ABI.

#include "service.h"

extern "C" __attribute__((visibility("default"))) berth::unit_abi const *berth_unit_entry() {
  static berth::unit_abi const abi{
    .abi_version = berth::kUnitAbiVersion + 1,
    .struct_size = static_cast<std::uint32_t>(sizeof(berth::unit_abi)),
    .sdk_version = "99.0.0",
    .construct = nullptr,
    .destroy = nullptr,
  };
  return &abi;
}
