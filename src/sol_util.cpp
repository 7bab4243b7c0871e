#include "sol_util.h"

namespace berth {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug);

  // error() and assert() carry a traceback so config mistakes point at their line
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

std::string_view sol_util_type_name(sol::object const &obj) {
  switch (obj.get_type()) {
    case sol::type::lua_nil: return "nil";
    case sol::type::boolean: return "boolean";
    case sol::type::number: return "number";
    case sol::type::string: return "string";
    case sol::type::table: return "table";
    case sol::type::function: return "function";
    case sol::type::userdata:
    case sol::type::lightuserdata: return "userdata";
    case sol::type::thread: return "thread";
    default: return "value";
  }
}

}  // namespace berth
