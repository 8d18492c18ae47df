#pragma once

#include <functional>

#include "glua.h"

/**
 * Every entry point of the host runtime that the bridge calls, as
 * X(return type, exported name, parameter list).
 */
#define GLUA_SYMBOL_LIST(X) \
  X(glua_State*, luaL_newstate, (void)) \
  X(void, lua_close, (glua_State* L)) \
  X(void, luaL_openlibs, (glua_State* L)) \
  X(int, luaL_loadfile, (glua_State* L, const char* filename)) \
  X(int, luaL_loadstring, (glua_State* L, const char* s)) \
  X(int, luaL_loadbuffer, (glua_State* L, const char* buff, size_t size, const char* name)) \
  X(void, luaL_register, (glua_State* L, const char* libname, const glua_Reg* l)) \
  X(int, luaL_ref, (glua_State* L, int t)) \
  X(void, luaL_unref, (glua_State* L, int t, int ref)) \
  X(int, luaL_newmetatable, (glua_State* L, const char* tname)) \
  X(void, luaL_traceback, (glua_State* L, glua_State* L1, const char* msg, int level)) \
  X(void, lua_getfield, (glua_State* L, int idx, const char* k)) \
  X(void, lua_setfield, (glua_State* L, int idx, const char* k)) \
  X(void, lua_pushvalue, (glua_State* L, int idx)) \
  X(void, lua_pushlightuserdata, (glua_State* L, void* p)) \
  X(void, lua_pushboolean, (glua_State* L, int b)) \
  X(void, lua_pushnumber, (glua_State* L, glua_Number n)) \
  X(void, lua_pushnil, (glua_State* L)) \
  X(void, lua_pushlstring, (glua_State* L, const char* s, size_t len)) \
  X(void, lua_pushcclosure, (glua_State* L, glua_CFunction fn, int n)) \
  X(int, lua_pushthread, (glua_State* L)) \
  X(const char*, lua_tolstring, (glua_State* L, int idx, size_t* len)) \
  X(int, lua_toboolean, (glua_State* L, int idx)) \
  X(glua_Number, lua_tonumber, (glua_State* L, int idx)) \
  X(void*, lua_touserdata, (glua_State* L, int idx)) \
  X(glua_State*, lua_tothread, (glua_State* L, int idx)) \
  X(const void*, lua_topointer, (glua_State* L, int idx)) \
  X(int, lua_pcall, (glua_State* L, int nargs, int nresults, int errfunc)) \
  X(int, lua_cpcall, (glua_State* L, glua_CFunction func, void* ud)) \
  X(void, lua_call, (glua_State* L, int nargs, int nresults)) \
  X(int, lua_error, (glua_State* L)) \
  X(void, lua_remove, (glua_State* L, int idx)) \
  X(void, lua_insert, (glua_State* L, int idx)) \
  X(void, lua_replace, (glua_State* L, int idx)) \
  X(int, lua_gettop, (glua_State* L)) \
  X(void, lua_settop, (glua_State* L, int idx)) \
  X(int, lua_type, (glua_State* L, int idx)) \
  X(const char*, lua_typename, (glua_State* L, int tp)) \
  X(void, lua_createtable, (glua_State* L, int narr, int nrec)) \
  X(void, lua_settable, (glua_State* L, int idx)) \
  X(void, lua_gettable, (glua_State* L, int idx)) \
  X(void, lua_rawgeti, (glua_State* L, int idx, int n)) \
  X(void, lua_rawseti, (glua_State* L, int idx, int n)) \
  X(int, lua_rawequal, (glua_State* L, int idx1, int idx2)) \
  X(int, lua_equal, (glua_State* L, int idx1, int idx2)) \
  X(int, lua_setmetatable, (glua_State* L, int objindex)) \
  X(int, lua_getmetatable, (glua_State* L, int objindex)) \
  X(size_t, lua_objlen, (glua_State* L, int idx)) \
  X(int, lua_next, (glua_State* L, int idx)) \
  X(void*, lua_newuserdata, (glua_State* L, size_t size)) \
  X(glua_State*, lua_newthread, (glua_State* L)) \
  X(void, lua_xmove, (glua_State* from, glua_State* to, int n)) \
  X(int, lua_yield, (glua_State* L, int nresults)) \
  X(int, lua_resume, (glua_State* L, int narg)) \
  X(int, lua_status, (glua_State* L)) \
  X(int, lua_getinfo, (glua_State* L, const char* what, glua_Debug* ar)) \
  X(int, lua_getstack, (glua_State* L, int level, glua_Debug* ar))

namespace GLua {

/** Maps an exported symbol name to its address, or nullptr if not exported */
using SymbolResolver = std::function<void*(const char* name)>;

/**
 * Function pointers into the host runtime, one per entry of
 * `GLUA_SYMBOL_LIST`. Immutable once imported.
 */
struct SymbolTable {
  #define GLUA_DECLARE_SYMBOL(ret, name, params) ret (*name) params;
  GLUA_SYMBOL_LIST(GLUA_DECLARE_SYMBOL)
  #undef GLUA_DECLARE_SYMBOL

  /**
   * Resolves every symbol through `resolve`. A missing symbol is fatal.
   */
  static SymbolTable import(const SymbolResolver& resolve);

  /**
   * Opens the host's `lua_shared` library (which then stays loaded for the
   * life of the process) and imports from it. Failure to find the library is
   * fatal.
   */
  static SymbolTable importLuaShared();
};

/**
 * Replaces the source of the process-wide table. Only has an effect before
 * the first call to `symbols()`.
 */
void setSymbolResolver(SymbolResolver resolver);

/** The process-wide table, imported on first use */
const SymbolTable& symbols();

} // namespace GLua
