#include "failure.h"

#include "errors.h"

#include <system_error>

namespace berth {

std::string_view failure_phase_name(failure_phase phase) {
  switch (phase) {
    case failure_phase::build: return "build";
    case failure_phase::load: return "load";
    case failure_phase::construct: return "construct";
    case failure_phase::serve: return "serve";
  }
  return "unknown";
}

std::string failure_info::describe() const {
  std::string out{ std::string{ failure_phase_name(phase) } + " failed [" + cause + "]" };
  if (resource_kind) { out += " resource=" + *resource_kind; }
  out += ": " + message;
  return out;
}

failure_info failure_from_exception(std::exception_ptr ep, failure_phase phase) {
  failure_info info{ .phase = phase,
                     .cause = {},
                     .message = {},
                     .resource_kind = std::nullopt,
                     .diagnostics = {} };

  try {
    std::rethrow_exception(ep);
  } catch (build_error const &e) {
    info.cause = cause_name(e.cause());
    info.message = e.what();
    info.diagnostics = e.diagnostics();
  } catch (load_error const &e) {
    info.cause = cause_name(e.cause());
    info.message = e.what();
  } catch (provisioning_error const &e) {
    info.cause = cause_name(e.cause());
    info.message = e.what();
    info.resource_kind = e.kind();
  } catch (serve_error const &e) {
    info.cause = "serve_failed";
    info.message = e.what();
  } catch (std::system_error const &e) {
    info.cause = "system_error";
    info.message = e.what();
  } catch (std::exception const &e) {
    info.cause = phase == failure_phase::construct ? "construct_failed" : "exception";
    info.message = e.what();
  } catch (...) {
    // Units may throw anything; record it rather than let it escape a worker thread.
    info.cause = "non_standard_exception";
    info.message = "unit threw an exception not derived from std::exception";
  }

  return info;
}

failure_info failure_unexpected_return() {
  return failure_info{ .phase = failure_phase::serve,
                       .cause = "unexpected_return",
                       .message = "serve() returned without a stop request",
                       .resource_kind = std::nullopt,
                       .diagnostics = {} };
}

}  // namespace berth
