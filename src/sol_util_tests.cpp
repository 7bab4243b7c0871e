#include "sol_util.h"

#include <doctest/doctest.h>

#include <stdexcept>

TEST_CASE("sol_util_make_lua_state opens the libraries config scripts use") {
  auto lua{ berth::sol_util_make_lua_state() };
  REQUIRE(lua);

  lua->script("x = string.upper('db') .. '-' .. math.floor(2.5)");
  std::string const x = (*lua)["x"];
  CHECK(x == "DB-2");

  lua->script("home = os.getenv('HOME')");
  sol::object const home = (*lua)["home"];
  CHECK(home.valid());
}

TEST_CASE("sol_util_make_lua_state error() carries a traceback") {
  auto lua{ berth::sol_util_make_lua_state() };

  auto result = lua->safe_script(R"lua(
    local function check_port(p)
      if p > 65535 then error("port out of range") end
    end
    check_port(70000)
  )lua",
                                 sol::script_pass_on_error);

  CHECK_FALSE(result.valid());
  sol::error err = result;
  std::string const msg{ err.what() };
  CHECK(msg.find("port out of range") != std::string::npos);
  CHECK(msg.find("stack traceback:") != std::string::npos);
}

TEST_CASE("sol_util_make_lua_state assert() carries a traceback") {
  auto lua{ berth::sol_util_make_lua_state() };

  auto result = lua->safe_script("assert(1 == 2, 'mismatch')", sol::script_pass_on_error);

  CHECK_FALSE(result.valid());
  sol::error err = result;
  std::string const msg{ err.what() };
  CHECK(msg.find("mismatch") != std::string::npos);
  CHECK(msg.find("stack traceback:") != std::string::npos);
}

TEST_CASE("sol_util_get_optional reads typed values") {
  auto lua{ berth::sol_util_make_lua_state() };
  lua->script("t = {flag = true, name = 'api', count = 3, nested = {a = 1}}");
  sol::table t = (*lua)["t"];

  CHECK(berth::sol_util_get_optional<bool>(t, "flag", "test") == true);
  CHECK(berth::sol_util_get_optional<std::string>(t, "name", "test") == "api");
  CHECK(berth::sol_util_get_optional<int>(t, "count", "test") == 3);

  auto const nested{ berth::sol_util_get_optional<sol::table>(t, "nested", "test") };
  REQUIRE(nested.has_value());
  CHECK(nested->get<int>("a") == 1);

  CHECK_FALSE(berth::sol_util_get_optional<bool>(t, "missing", "test").has_value());
}

TEST_CASE("sol_util_get_optional rejects the wrong type") {
  auto lua{ berth::sol_util_make_lua_state() };
  lua->script("t = {flag = 'yes', name = 123, nested = 'flat'}");
  sol::table t = (*lua)["t"];

  CHECK_THROWS_WITH_AS(berth::sol_util_get_optional<bool>(t, "flag", "berth.lua"),
                       "berth.lua: flag must be a boolean",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(berth::sol_util_get_optional<std::string>(t, "name", "berth.lua"),
                       "berth.lua: name must be a string",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(berth::sol_util_get_optional<sol::table>(t, "nested", "berth.lua"),
                       "berth.lua: nested must be a table",
                       std::runtime_error);
}

TEST_CASE("sol_util_type_name names Lua types") {
  auto lua{ berth::sol_util_make_lua_state() };
  lua->script("s = 'x'; n = 1; b = false; t = {}; f = function() end");

  CHECK(berth::sol_util_type_name((*lua)["s"]) == "string");
  CHECK(berth::sol_util_type_name((*lua)["n"]) == "number");
  CHECK(berth::sol_util_type_name((*lua)["b"]) == "boolean");
  CHECK(berth::sol_util_type_name((*lua)["t"]) == "table");
  CHECK(berth::sol_util_type_name((*lua)["f"]) == "function");
  CHECK(berth::sol_util_type_name((*lua)["undefined"]) == "nil");
}
