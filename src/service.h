#pragma once

// The contract between the berth host and a service unit. A unit is a shared library
// built against this header that exports its service with BERTH_SERVICE().
//
//   class api : public berth::service {
//    public:
//     static std::unique_ptr<api> construct(berth::resource_factory &factory);
//     void serve(berth::bound_address const &address,
//                berth::cancel_token const &cancel) override;
//   };
//
//   BERTH_SERVICE(api)

#include "errors.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#define BERTH_SDK_VERSION "0.1.0"

namespace berth {

using config_value = std::variant<std::string, std::int64_t, double, bool>;
using resource_config = std::map<std::string, config_value, std::less<>>;

inline std::string config_value_to_string(config_value const &v) {
  if (auto const *s{ std::get_if<std::string>(&v) }) { return *s; }
  if (auto const *i{ std::get_if<std::int64_t>(&v) }) { return std::to_string(*i); }
  if (auto const *b{ std::get_if<bool>(&v) }) { return *b ? "true" : "false"; }
  std::string s{ std::to_string(std::get<double>(v)) };
  s.erase(s.find_last_not_of('0') + 1);
  if (!s.empty() && s.back() == '.') { s.push_back('0'); }
  return s;
}

// Handle to a provisioned resource. The payload (typically a connection string or
// a path) is owned by the requesting service.
struct resource_connection {
  std::string kind;
  std::string payload;
};

// Host-side provisioning service handed to a unit's construct(). Safe to call
// concurrently. Throws provisioning_error.
class resource_factory {
 public:
  virtual ~resource_factory() = default;

  virtual resource_connection provision(std::string_view kind,
                                        resource_config const &config) = 0;

  virtual std::string const &unit_name() const = 0;
};

struct bound_address {
  std::string host;
  std::uint16_t port{ 0 };

  std::string to_string() const { return host + ":" + std::to_string(port); }

  // "host:port"; throws std::invalid_argument.
  static bound_address parse(std::string_view text) {
    auto const colon{ text.rfind(':') };
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
      throw std::invalid_argument("address must be host:port: " + std::string{ text });
    }

    std::string_view const port_text{ text.substr(colon + 1) };
    unsigned long port{ 0 };
    for (char const c : port_text) {
      if (c < '0' || c > '9') {
        throw std::invalid_argument("invalid port in address: " + std::string{ text });
      }
      port = port * 10 + static_cast<unsigned long>(c - '0');
      if (port > 65535) {
        throw std::invalid_argument("port out of range in address: " + std::string{ text });
      }
    }

    return bound_address{ .host = std::string{ text.substr(0, colon) },
                          .port = static_cast<std::uint16_t>(port) };
  }

  bool operator==(bound_address const &) const = default;
};

// Cooperative stop signal. Copies share state; the host requests, the service observes.
class cancel_token {
 public:
  cancel_token() : state_{ std::make_shared<state>() } {}

  bool stop_requested() const {
    std::lock_guard lock{ state_->mutex };
    return state_->stopped;
  }

  // Blocks until a stop is requested or `timeout` elapses. Returns stop_requested().
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock lock{ state_->mutex };
    return state_->cv.wait_for(lock, timeout, [this] { return state_->stopped; });
  }

  void wait() const {
    std::unique_lock lock{ state_->mutex };
    state_->cv.wait(lock, [this] { return state_->stopped; });
  }

  void request_stop() const {
    {
      std::lock_guard lock{ state_->mutex };
      state_->stopped = true;
    }
    state_->cv.notify_all();
  }

 private:
  struct state {
    std::mutex mutex;
    std::condition_variable cv;
    bool stopped{ false };
  };

  std::shared_ptr<state> state_;
};

// A constructed network service. serve() runs until the cancel token fires, then
// releases its address and returns. Returning without a stop request counts as a
// crash. Throwing serve_error (or anything else) also counts as a crash.
class service {
 public:
  virtual ~service() = default;
  virtual void serve(bound_address const &address, cancel_token const &cancel) = 0;
};

inline constexpr std::uint32_t kUnitAbiVersion{ 1 };
inline constexpr char kUnitEntrySymbol[]{ "berth_unit_entry" };

// Fixed-shape table returned by a unit's entry point. Appending fields requires
// bumping kUnitAbiVersion.
struct unit_abi {
  std::uint32_t abi_version;
  std::uint32_t struct_size;
  char const *sdk_version;
  service *(*construct)(resource_factory &factory);
  void (*destroy)(service *svc);
};

extern "C" {
using unit_entry_fn = unit_abi const *(*)();
}

}  // namespace berth

#define BERTH_SERVICE(service_type)                                                \
  extern "C" __attribute__((visibility("default"))) ::berth::unit_abi const *      \
  berth_unit_entry() {                                                              \
    static ::berth::unit_abi const abi{                                             \
      .abi_version = ::berth::kUnitAbiVersion,                                      \
      .struct_size = static_cast<std::uint32_t>(sizeof(::berth::unit_abi)),         \
      .sdk_version = BERTH_SDK_VERSION,                                             \
      .construct = [](::berth::resource_factory &factory) -> ::berth::service * {   \
        return service_type::construct(factory).release();                          \
      },                                                                            \
      .destroy = [](::berth::service *svc) { delete svc; },                         \
    };                                                                              \
    return &abi;                                                                    \
  }
