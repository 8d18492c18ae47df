#pragma once

#include <exception>
#include <string>
#include <type_traits>

#include "Runtime.hh"
#include "State.hh"

namespace GLua {

/**
 * Adapts `R F(State)`, with `R` either `int` (the number of results) or
 * `void` (no results), to a `glua_CFunction`.
 *
 * Exceptions derived from `std::exception` become VM errors carrying their
 * message. The error is raised only after every C++ frame of the adapter has
 * been left, so no destructor is skipped. Errors raised by the VM itself pass
 * through untouched.
 */
template <auto F>
int function(glua_State* L) {
  {
    State state(L);
    try {
      using Result = decltype(F(state));
      static_assert(std::is_same<Result, int>::value || std::is_void<Result>::value,
        "native functions return the number of results (int) or nothing (void)");
      if constexpr (std::is_void<Result>::value) {
        F(state);
        return 0;
      } else {
        return F(state);
      }
    }
    catch (std::exception& e) {
      state.pushString(e.what());
    }
  }
  return symbols().lua_error(L);
}

inline int openModule(glua_State* L, int (*body)(State)) {
  Runtime::instance().load(State(L));
  {
    State state(L);
    try {
      return body(state);
    }
    catch (std::exception& e) {
      state.pushString(e.what());
    }
  }
  return symbols().lua_error(L);
}

/** Runs `body`, then unloads the runtime even if `body` failed */
inline int closeModule(glua_State* L, int (*body)(State)) {
  {
    State state(L);
    std::string failure;
    bool failed = false;
    int results = 0;
    try {
      results = body(state);
    }
    catch (std::exception& e) {
      failed = true;
      failure = e.what();
    }
    Runtime::instance().unload(state);
    if (!failed) {
      return results;
    }
    state.pushString(failure);
  }
  return symbols().lua_error(L);
}

} // namespace GLua

/**
 * Defines an unmangled native function. The body receives `GLua::State LUA`
 * and returns the number of results it pushed.
 *
 *   GLUA_FUNCTION(add) {
 *     LUA.pushNumber(LUA.checkNumber(1) + LUA.checkNumber(2));
 *     return 1;
 *   }
 */
#define GLUA_FUNCTION(name) \
  static int name##_body(GLua::State LUA); \
  extern "C" int name(glua_State* L) { return GLua::function<name##_body>(L); } \
  static int name##_body(GLua::State LUA)

/**
 * Defines the module entry point. The runtime is loaded before the body
 * runs.
 */
#define GLUA_MODULE_OPEN() \
  static int gluaModuleOpen(GLua::State LUA); \
  extern "C" GLUA_EXPORT int gmod13_open(glua_State* L) { return GLua::openModule(L, &gluaModuleOpen); } \
  static int gluaModuleOpen(GLua::State LUA)

/**
 * Defines the module exit point. The runtime is unloaded after the body
 * runs.
 */
#define GLUA_MODULE_CLOSE() \
  static int gluaModuleClose(GLua::State LUA); \
  extern "C" GLUA_EXPORT int gmod13_close(glua_State* L) { return GLua::closeModule(L, &gluaModuleClose); } \
  static int gluaModuleClose(GLua::State LUA)
