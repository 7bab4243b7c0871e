#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("berth-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto visitor{ berth::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("util_load_file reads whole file") {
  auto const path{ make_temp_path("load") };
  {
    std::ofstream out{ path, std::ios::binary };
    out << "line one\nline two\n";
  }
  berth::scoped_path_cleanup cleanup{ path };

  CHECK(berth::util_load_file(path) == "line one\nline two\n");
}

TEST_CASE("util_load_file throws for missing file") {
  CHECK_THROWS_AS(berth::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("util_write_file_synced and util_copy_file_synced") {
  auto const dir{ make_temp_path("copy") };
  std::filesystem::create_directories(dir);
  berth::scoped_path_cleanup cleanup{ dir };

  berth::util_write_file_synced(dir / "a.bin", "payload");
  berth::util_copy_file_synced(dir / "a.bin", dir / "b.bin");

  CHECK(berth::util_load_file(dir / "b.bin") == "payload");
  CHECK_THROWS_AS(berth::util_copy_file_synced(dir / "nope", dir / "c.bin"),
                  std::system_error);
}

TEST_CASE("util_random_alnum") {
  auto const a{ berth::util_random_alnum(24) };
  auto const b{ berth::util_random_alnum(24) };

  CHECK(a.size() == 24);
  CHECK(a != b);
  for (char const c : a) {
    bool const ok{ (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') };
    CHECK(ok);
  }
}

TEST_CASE("util_trim and util_split_words") {
  CHECK(berth::util_trim("  reload api \r\n") == "reload api");
  CHECK(berth::util_trim("") == "");
  CHECK(berth::util_trim(" \t ") == "");

  auto const words{ berth::util_split_words(" reload\t api  ") };
  REQUIRE(words.size() == 2);
  CHECK(words[0] == "reload");
  CHECK(words[1] == "api");
  CHECK(berth::util_split_words("   ").empty());
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto const dir{ make_temp_path("cleanup") };
  std::filesystem::create_directories(dir / "nested");
  { std::ofstream{ dir / "nested" / "f.txt" } << "x"; }

  {
    berth::scoped_path_cleanup cleanup{ dir };
    CHECK(cleanup.path() == dir);
  }
  CHECK_FALSE(std::filesystem::exists(dir));

  SUBCASE("reset with empty path keeps target") {
    std::filesystem::create_directories(dir);
    {
      berth::scoped_path_cleanup cleanup{ dir };
      cleanup.reset();
    }
    CHECK(std::filesystem::exists(dir));
    std::filesystem::remove_all(dir);
  }
}
