/*
 * ABI-level types and constants of the host Lua runtime (Lua 5.1 / LuaJIT as
 * shipped in `lua_shared`). Nothing in this header links against the runtime:
 * every entry point is reached through `GLua::SymbolTable`.
 */
#pragma once

#include "glua_port.h"
#include <stddef.h>
#include <stdint.h>

typedef struct glua_State glua_State;

typedef int (*glua_CFunction)(glua_State* L);
typedef double glua_Number;
typedef ptrdiff_t glua_Integer;
typedef int glua_Reference;

/** Pseudo-indices */
#define GLUA_REGISTRYINDEX (-10000)
#define GLUA_ENVIRONINDEX (-10001)
#define GLUA_GLOBALSINDEX (-10002)
#define glua_upvalueindex(i) (GLUA_GLOBALSINDEX - (i))

#define GLUA_MULTRET (-1)

/** Reference sentinels. Releasing either of these is a no-op. */
#define GLUA_NOREF (-2)
#define GLUA_REFNIL (-1)

/** Type tags as returned by `lua_type` */
#define GLUA_TNONE (-1)
#define GLUA_TNIL 0
#define GLUA_TBOOLEAN 1
#define GLUA_TLIGHTUSERDATA 2
#define GLUA_TNUMBER 3
#define GLUA_TSTRING 4
#define GLUA_TTABLE 5
#define GLUA_TFUNCTION 6
#define GLUA_TUSERDATA 7
#define GLUA_TTHREAD 8

/** Status codes */
#define GLUA_OK 0
#define GLUA_YIELD 1
#define GLUA_ERRRUN 2
#define GLUA_ERRSYNTAX 3
#define GLUA_ERRMEM 4
#define GLUA_ERRERR 5
#define GLUA_ERRFILE (GLUA_ERRERR + 1)

#define GLUA_IDSIZE 60

/**
 * Activation record filled by `lua_getstack` / `lua_getinfo`. The layout must
 * match the host's `lua_Debug` exactly.
 */
typedef struct glua_Debug {
  int event;
  const char* name;
  const char* namewhat;
  const char* what;
  const char* source;
  int currentline;
  int nups;
  int linedefined;
  int lastlinedefined;
  char short_src[GLUA_IDSIZE];
  int i_ci;
} glua_Debug;

/** Entry of a `luaL_register` function list, terminated by `{NULL, NULL}` */
typedef struct glua_Reg {
  const char* name;
  glua_CFunction func;
} glua_Reg;

#if defined(_WIN32)
  #define GLUA_EXPORT __declspec(dllexport)
#else
  #define GLUA_EXPORT __attribute__((visibility("default")))
#endif
