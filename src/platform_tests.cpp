#include "platform.h"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace berth {

namespace {

std::filesystem::path make_temp_dir() {
  static std::atomic<int> counter{ 0 };
  auto const dir{ std::filesystem::temp_directory_path() /
                  ("berth-platform-test-" + std::to_string(::getpid()) + "-" +
                   std::to_string(counter.fetch_add(1))) };
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace

TEST_CASE("platform::expand_path empty path returns empty path") {
  CHECK(platform::expand_path("").empty());
}

TEST_CASE("platform::expand_path plain path returns unchanged") {
  CHECK(platform::expand_path("/absolute/path/to/something") ==
        "/absolute/path/to/something");
  CHECK(platform::expand_path("relative/path") == "relative/path");
}

TEST_CASE("platform::expand_path tilde expands to HOME") {
  char const *home{ std::getenv("HOME") };
  REQUIRE(home != nullptr);

  CHECK(platform::expand_path("~/units/api") ==
        std::filesystem::path{ home } / "units" / "api");
}

TEST_CASE("platform::expand_path rejects undefined variables") {
  CHECK_THROWS_AS(platform::expand_path("$BERTH_SURELY_UNDEFINED_VARIABLE/x"),
                  std::runtime_error);
}

TEST_CASE("platform::get_default_state_root honors BERTH_STATE_ROOT") {
  char const *previous{ std::getenv("BERTH_STATE_ROOT") };
  std::string const saved{ previous ? previous : "" };

  platform::set_env_var("BERTH_STATE_ROOT", "/tmp/berth-state-root-test");
  auto const root{ platform::get_default_state_root() };
  REQUIRE(root.has_value());
  CHECK(*root == "/tmp/berth-state-root-test");

  if (previous) {
    platform::set_env_var("BERTH_STATE_ROOT", saved.c_str());
  } else {
    ::unsetenv("BERTH_STATE_ROOT");
  }
}

TEST_CASE("platform::atomic_rename replaces destination") {
  auto const dir{ make_temp_dir() };
  scoped_path_cleanup cleanup{ dir };

  { std::ofstream{ dir / "staging" } << "new"; }
  { std::ofstream{ dir / "final" } << "old"; }

  platform::atomic_rename(dir / "staging", dir / "final");
  CHECK_FALSE(std::filesystem::exists(dir / "staging"));
  CHECK(util_load_file(dir / "final") == "new");

  CHECK_THROWS_AS(platform::atomic_rename(dir / "absent", dir / "final"),
                  std::system_error);
}

TEST_CASE("platform::file_lock serializes threads on the same path") {
  auto const dir{ make_temp_dir() };
  scoped_path_cleanup cleanup{ dir };
  auto const lock_path{ dir / "unit.lock" };

  std::atomic<int> inside{ 0 };
  std::atomic<int> max_inside{ 0 };

  std::vector<std::thread> threads;
  for (int i{ 0 }; i < 4; ++i) {
    threads.emplace_back([&] {
      platform::file_lock lock{ lock_path };
      CHECK(static_cast<bool>(lock));
      int const now{ ++inside };
      int prev{ max_inside.load() };
      while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --inside;
    });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(max_inside.load() == 1);
}

TEST_CASE("platform::file_lock on different paths does not block") {
  auto const dir{ make_temp_dir() };
  scoped_path_cleanup cleanup{ dir };

  platform::file_lock a{ dir / "a.lock" };
  platform::file_lock b{ dir / "b.lock" };
  CHECK(static_cast<bool>(a));
  CHECK(static_cast<bool>(b));

  platform::file_lock moved{ std::move(a) };
  CHECK(static_cast<bool>(moved));
}

}  // namespace berth
