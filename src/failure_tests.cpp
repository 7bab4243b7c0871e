#include "failure.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

namespace {

template <typename E>
berth::failure_info classify(E const &e, berth::failure_phase phase) {
  return berth::failure_from_exception(std::make_exception_ptr(e), phase);
}

}  // namespace

TEST_CASE("failure_from_exception keeps build diagnostics verbatim") {
  berth::build_error const err{ berth::build_error_cause::toolchain_failed,
                                "cmake --build exited with status 2",
                                { "main.cpp:3:1: error: expected ';'", "  3 | }" } };
  auto const info{ classify(err, berth::failure_phase::build) };

  CHECK(info.phase == berth::failure_phase::build);
  CHECK(info.cause == "toolchain_failed");
  REQUIRE(info.diagnostics.size() == 2);
  CHECK(info.diagnostics[0] == "main.cpp:3:1: error: expected ';'");
  CHECK(info.diagnostics[1] == "  3 | }");
}

TEST_CASE("failure_from_exception names the resource kind") {
  berth::provisioning_error const err{ berth::provisioning_error_cause::unknown_kind,
                                       "quantum-db",
                                       "no provisioner registered" };
  auto const info{ classify(err, berth::failure_phase::construct) };

  CHECK(info.cause == "unknown_kind");
  REQUIRE(info.resource_kind.has_value());
  CHECK(*info.resource_kind == "quantum-db");
  CHECK(info.describe().find("resource=quantum-db") != std::string::npos);
}

TEST_CASE("failure_from_exception classifies load and serve errors") {
  CHECK(classify(berth::load_error{ berth::load_error_cause::abi_mismatch, "/x.so", "v9" },
                 berth::failure_phase::load)
            .cause == "abi_mismatch");
  CHECK(classify(berth::serve_error{ "socket closed" }, berth::failure_phase::serve).cause ==
        "serve_failed");
}

TEST_CASE("failure_from_exception handles foreign exceptions") {
  CHECK(classify(std::runtime_error{ "boom" }, berth::failure_phase::construct).cause ==
        "construct_failed");
  CHECK(classify(std::runtime_error{ "boom" }, berth::failure_phase::serve).cause ==
        "exception");
  CHECK(berth::failure_from_exception(std::make_exception_ptr(42),
                                      berth::failure_phase::serve)
            .cause == "non_standard_exception");
}

TEST_CASE("failure_unexpected_return") {
  auto const info{ berth::failure_unexpected_return() };
  CHECK(info.phase == berth::failure_phase::serve);
  CHECK(info.cause == "unexpected_return");
  CHECK(info.describe() == "serve failed [unexpected_return]: serve() returned without a "
                           "stop request");
}
