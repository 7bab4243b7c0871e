#include "source_watch.h"

#include "test_support.h"
#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("source_watch_is_ignored_dir") {
  CHECK(berth::source_watch_is_ignored_dir("/src/app/.git"));
  CHECK(berth::source_watch_is_ignored_dir("/src/app/build"));
  CHECK(berth::source_watch_is_ignored_dir("/src/app/cmake-build-debug"));
  CHECK_FALSE(berth::source_watch_is_ignored_dir("/src/app/src"));
  CHECK_FALSE(berth::source_watch_is_ignored_dir("/src/app/builder"));
}

TEST_CASE("source_fingerprint_of") {
  auto const root{ berth::test::make_temp_dir("fingerprint") };
  berth::scoped_path_cleanup cleanup{ root };

  SUBCASE("missing root is empty") {
    CHECK(berth::source_fingerprint_of(root / "nope") == berth::source_fingerprint{});
  }

  SUBCASE("counts sources and skips build output") {
    berth::util_write_file_synced(root / "CMakeLists.txt", "project(x)\n");
    std::filesystem::create_directories(root / "src");
    berth::util_write_file_synced(root / "src" / "unit.cpp", "int x;\n");
    std::filesystem::create_directories(root / "build");
    berth::util_write_file_synced(root / "build" / "libunit.so", "binary");
    std::filesystem::create_directories(root / ".git");
    berth::util_write_file_synced(root / ".git" / "HEAD", "ref");

    auto const fp{ berth::source_fingerprint_of(root) };
    CHECK(fp.files == 2);
    CHECK(fp.bytes == 11 + 7);

    berth::util_write_file_synced(root / "build" / "libunit.so", "rebuilt binary");
    CHECK(berth::source_fingerprint_of(root) == fp);

    berth::util_write_file_synced(root / "src" / "unit.cpp", "int x, y;\n");
    CHECK(berth::source_fingerprint_of(root) != fp);
  }
}

TEST_CASE("source_watch calls back on change") {
  auto const root{ berth::test::make_temp_dir("watch") };
  berth::scoped_path_cleanup cleanup{ root };
  berth::util_write_file_synced(root / "unit.cpp", "int x;\n");

  std::atomic_int changes{ 0 };
  {
    berth::source_watch watch{ root, 10ms, [&] { ++changes; } };
    CHECK(watch.root() == root);

    std::this_thread::sleep_for(60ms);
    CHECK(changes == 0);

    berth::util_write_file_synced(root / "other.cpp", "int y;\n");
    for (int i{ 0 }; i < 200 && changes == 0; ++i) { std::this_thread::sleep_for(5ms); }
    CHECK(changes == 1);
  }
}

TEST_CASE("source_watch keeps polling after a handler throws") {
  auto const root{ berth::test::make_temp_dir("watch-throw") };
  berth::scoped_path_cleanup cleanup{ root };

  {
    std::atomic_int calls{ 0 };
    berth::source_watch watch{ root, 10ms, [&] {
                                ++calls;
                                throw std::runtime_error("reload failed");
                              } };
    berth::util_write_file_synced(root / "a.cpp", "a");
    for (int i{ 0 }; i < 200 && calls == 0; ++i) { std::this_thread::sleep_for(5ms); }
    berth::util_write_file_synced(root / "b.cpp", "b");
    for (int i{ 0 }; i < 200 && calls < 2; ++i) { std::this_thread::sleep_for(5ms); }
    CHECK(calls == 2);
  }
}
