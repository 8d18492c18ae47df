#pragma once

#include <exception>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "glua.h"
#include "LuaError.hh"
#include "PushNumber.hh"
#include "SymbolTable.hh"
#include "UserData.hh"

namespace GLua {

using Reference = glua_Reference;

/**
 * A native function received an argument of the wrong type. The message is
 * formatted like the VM's own, e.g. "bad argument #1 to 'foo' (string
 * expected, got nil)".
 */
class ArgumentError: public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** Result of `State::pcallIgnoreFunctionRef` */
struct FunctionRefCall {
  bool valid;     // the reference held a function
  bool succeeded; // the call completed without error
};

/**
 * A view of one VM stack (the main thread or a coroutine). Copyable; the host
 * owns the VM. All operations are only valid on the VM thread.
 *
 * Operations that can fail inside the VM return `std::optional<LuaError>`,
 * which is empty on success. On failure the error value has already been
 * removed from the stack.
 */
class State {
public:
  State(glua_State* L): _L(L) {}

  /** Creates a standalone VM with the standard libraries opened */
  static std::optional<State> newState();
  /** Destroys a VM created by `newState`. Runs every pending finalizer. */
  void close() const { symbols().lua_close(_L); }

  glua_State* raw() const { return _L; }

  bool operator==(const State& other) const { return _L == other._L; }
  bool operator!=(const State& other) const { return _L != other._L; }

  // Realm

  bool isClient() const { return globalFlag("CLIENT"); }
  bool isServer() const { return globalFlag("SERVER"); }
  bool isMenu() const { return globalFlag("MENU_DLL"); }

  // Type predicates

  int luaType(int index) const { return symbols().lua_type(_L, index); }
  std::string luaTypeName(int typeId) const;
  /** Name of the type of the value at `index` */
  std::string getType(int index) const { return luaTypeName(luaType(index)); }

  /** You may be looking for `isNoneOrNil` */
  bool isNil(int index) const { return luaType(index) == GLUA_TNIL; }
  bool isNone(int index) const { return luaType(index) == GLUA_TNONE; }
  bool isNoneOrNil(int index) const { return isNil(index) || isNone(index); }
  bool isFunction(int index) const { return luaType(index) == GLUA_TFUNCTION; }
  bool isTable(int index) const { return luaType(index) == GLUA_TTABLE; }
  bool isBoolean(int index) const { return luaType(index) == GLUA_TBOOLEAN; }
  bool isNumber(int index) const { return luaType(index) == GLUA_TNUMBER; }
  bool isString(int index) const { return luaType(index) == GLUA_TSTRING; }
  /** True for both full and light userdata */
  bool isUserdata(int index) const {
    int type = luaType(index);
    return type == GLUA_TUSERDATA || type == GLUA_TLIGHTUSERDATA;
  }

  // Accessors

  /**
   * The string at `index` decoded as UTF-8, with invalid sequences replaced
   * by U+FFFD. Empty unless the value is a string; numbers are not converted.
   */
  std::optional<std::string> getString(int index) const;

  /**
   * The raw bytes of the string at `index`. The view is owned by the VM and
   * only valid while the string stays on the stack.
   */
  std::optional<std::string_view> getBinaryString(int index) const;

  double toNumber(int index) const { return symbols().lua_tonumber(_L, index); }
  bool getBoolean(int index) const { return symbols().lua_toboolean(_L, index) != 0; }
  void* toUserdata(int index) const { return symbols().lua_touserdata(_L, index); }
  const void* toPointer(int index) const { return symbols().lua_topointer(_L, index); }
  State toThread(int index) const { return State(symbols().lua_tothread(_L, index)); }

  // Checked accessors. These throw `ArgumentError`.

  std::string checkString(int arg) const;
  std::string_view checkBinaryString(int arg) const;
  double checkNumber(int arg) const;
  bool checkBoolean(int arg) const;
  void checkTable(int arg) const;
  void checkFunction(int arg) const;

  /**
   * The userdata at `index` as a `T`. When `metaName` is given, the value's
   * metatable must be the registry entry of that name. Throws
   * `std::runtime_error` otherwise, or when the pointer is null or misaligned.
   */
  template <typename T>
  T& getUserdata(int index, const char* metaName = nullptr) const;

  // Stack

  int getTop() const { return symbols().lua_gettop(_L); }
  void setTop(int index) const { symbols().lua_settop(_L, index); }
  void pop() const { popN(1); }
  void popN(int count) const { if (count > 0) setTop(-count - 1); }
  void insert(int index) const { symbols().lua_insert(_L, index); }
  void remove(int index) const { symbols().lua_remove(_L, index); }
  void replace(int index) const { symbols().lua_replace(_L, index); }
  void pushValue(int index) const { symbols().lua_pushvalue(_L, index); }
  void pushNil() const { symbols().lua_pushnil(_L); }
  void pushBoolean(bool value) const { symbols().lua_pushboolean(_L, value ? 1 : 0); }
  void pushString(std::string_view value) const { symbols().lua_pushlstring(_L, value.data(), value.size()); }
  void pushBinaryString(std::string_view bytes) const { pushString(bytes); }
  void pushLightUserdata(void* data) const { symbols().lua_pushlightuserdata(_L, data); }
  void pushFunction(glua_CFunction func) const { symbols().lua_pushcclosure(_L, func, 0); }
  void pushGlobals() const { pushValue(GLUA_GLOBALSINDEX); }
  void pushRegistry() const { pushValue(GLUA_REGISTRYINDEX); }
  /** Pushes this thread; true if it is the main thread of its VM */
  bool pushThread() const { return symbols().lua_pushthread(_L) != 0; }

  /**
   * Pushes any arithmetic value. Integers beyond `GLUA_MAX_SAFE_INTEGER` in
   * magnitude cannot be represented exactly by the VM and are pushed as
   * their base-10 string instead.
   */
  template <typename T>
  void pushNumber(T value) const {
    if constexpr (std::is_floating_point<T>::value) {
      symbols().lua_pushnumber(_L, glua_Number(value));
    } else {
      static_assert(IsPushableInteger<T>::value, "pushNumber requires an arithmetic type");
      if (isSafeInteger(value)) {
        symbols().lua_pushnumber(_L, glua_Number(value));
      } else {
        pushString(integerToString(value));
      }
    }
  }

  /**
   * Pops `n` values and pushes a closure over them. Inside `func` they are
   * read with `pushClosureArg(1..n)`.
   */
  void pushClosure(glua_CFunction func, int n) const;
  void pushClosureArg(int n) const { pushValue(upvalueIndex(n)); }
  static constexpr int upvalueIndex(int n) { return GLUA_GLOBALSINDEX - n; }

  // Tables and fields

  void getField(int index, const char* key) const { symbols().lua_getfield(_L, index, key); }
  void setField(int index, const char* key) const { symbols().lua_setfield(_L, index, key); }
  void getGlobal(const char* name) const { getField(GLUA_GLOBALSINDEX, name); }
  void setGlobal(const char* name) const { setField(GLUA_GLOBALSINDEX, name); }
  void getTable(int index) const { symbols().lua_gettable(_L, index); }
  void setTable(int index) const { symbols().lua_settable(_L, index); }
  /** `seqCount` and `hashCount` are preallocation hints */
  void createTable(int seqCount, int hashCount) const { symbols().lua_createtable(_L, seqCount, hashCount); }
  void newTable() const { createTable(0, 0); }
  void rawGetI(int index, int n) const { symbols().lua_rawgeti(_L, index, n); }
  void rawSetI(int index, int n) const { symbols().lua_rawseti(_L, index, n); }
  bool rawEqual(int a, int b) const { return symbols().lua_rawequal(_L, a, b) != 0; }
  bool equal(int a, int b) const { return symbols().lua_equal(_L, a, b) != 0; }
  size_t len(int index) const { return symbols().lua_objlen(_L, index); }
  bool next(int index) const { return symbols().lua_next(_L, index) != 0; }
  /** Pushes the metatable of the value at `index`, if it has one */
  bool getMetatable(int index) const { return symbols().lua_getmetatable(_L, index) != 0; }
  bool setMetatable(int index) const { return symbols().lua_setmetatable(_L, index) != 0; }
  /**
   * Pushes the registry metatable called `name`, creating it if needed.
   * Returns true if it already existed.
   */
  bool newMetatable(const char* name) const { return symbols().luaL_newmetatable(_L, name) == 0; }
  /** Pushes the registry entry called `name` */
  void getMetatableName(const char* name) const { getField(GLUA_REGISTRYINDEX, name); }
  void registerLibrary(const char* name, const glua_Reg* functions) const { symbols().luaL_register(_L, name, functions); }

  /**
   * Pushes field `name` of the table at `index` if it holds a value of type
   * `type` and returns true. Returns false with nothing pushed when the field
   * is nil. Throws `std::runtime_error` for any other type.
   */
  bool getFieldTypeOrNil(int index, const char* name, int type) const;

  // Calls

  /**
   * Unprotected call. An error inside the callee unwinds straight to the
   * nearest enclosing protected call, skipping the caller's cleanup. Use
   * `pcallIgnore` unless a protected boundary surrounds this call.
   */
  void call(int nargs, int nresults) const { symbols().lua_call(_L, nargs, nresults); }

  std::optional<LuaError> pcall(int nargs, int nresults, int errfunc = 0) const;

  /** `pcall` that reports an error through `errorNoHalt`. Returns success. */
  bool pcallIgnore(int nargs, int nresults) const;

  /**
   * Calls the function held by `ref` with the `nargs` values already on the
   * stack. When `ref` does not hold a function, the arguments are popped and
   * nothing is called.
   */
  FunctionRefCall pcallIgnoreFunctionRef(Reference ref, int nargs, int nresults) const;

  /**
   * Calls the function below the `nargs` arguments if it is a function, or
   * pops it together with the arguments. Returns whether it was called.
   */
  bool pcallIfValidFunction(int nargs, int nresults) const;

  bool isValidFunctionRef(Reference ref) const;

  std::optional<LuaError> cpcall(glua_CFunction func, void* userdata) const;
  bool cpcallIgnore(glua_CFunction func, void* userdata, std::optional<std::string_view> traceback = std::nullopt) const;

  // Loading. On success the compiled chunk is pushed.

  std::optional<LuaError> loadString(const std::string& source) const;
  std::optional<LuaError> loadBuffer(std::string_view buffer, const char* name) const;
  std::optional<LuaError> loadFile(const char* path) const;

  // References

  /** Pops the top value into the registry and returns its reference */
  Reference reference() const { return symbols().luaL_ref(_L, GLUA_REGISTRYINDEX); }
  /** Releases `ref`. The sentinels are ignored. */
  void dereference(Reference ref) const;
  /** Pushes the value held by `ref`. Pushes nothing for the sentinels. */
  bool fromReference(Reference ref) const;

  // Coroutines

  /** Creates a coroutine sharing this VM and pushes it */
  State coroutineNew() const { return State(symbols().lua_newthread(_L)); }
  /** Pops `n` values from this stack and pushes them onto `target` */
  void coroutineExchange(State target, int n) const { symbols().lua_xmove(_L, target._L, n); }
  [[nodiscard]] int coroutineYield(int nresults) const { return symbols().lua_yield(_L, nresults); }
  [[nodiscard]] int coroutineResume(int narg) const { return symbols().lua_resume(_L, narg); }
  int coroutineStatus() const { return symbols().lua_status(_L); }

  /**
   * Resumes this coroutine and raises any failure as a VM error in `caller`.
   * Never returns on failure; see `call`.
   */
  void coroutineResumeCall(State caller, int narg) const;

  /**
   * Resumes this coroutine. Returns `GLUA_OK` or `GLUA_YIELD`, or reports the
   * failure through `errorNoHalt` and returns empty.
   */
  std::optional<int> coroutineResumeIgnore(int narg, std::optional<std::string_view> traceback = std::nullopt) const;

  // Userdata

  /**
   * Constructs a `T` in VM-owned memory, pushes it and, when `metaName` is
   * given, sets the registry metatable of that name on it.
   */
  template <typename T, typename... Args>
  T* newUserdata(const char* metaName, Args&&... args) const;

  /**
   * Ensures the registry metatable `metaName` exists with a `__gc` that runs
   * `~T`. The stack is left unchanged.
   */
  template <typename T>
  void registerFinalizer(const char* metaName) const;

  // Debug

  std::optional<glua_Debug> getStackAt(int level) const;
  std::optional<glua_Debug> debugGetInfoAt(int level, const char* what) const;
  bool debugGetInfoFromAr(glua_Debug& ar, const char* what) const;
  /** `what` must start with '>'; pops the function to inspect */
  std::optional<glua_Debug> debugGetInfoFromStack(const char* what) const;
  /** Traceback of `thread` starting at `level` */
  std::string traceback(State thread, int level) const;
  /** Prints the stack to stdout */
  void dumpStack() const;
  std::string dumpValue(int index) const;

  // Errors

  std::string typeError(int narg, const std::string& tname) const;
  std::string tagError(int narg, int tag) const;
  std::string errArgMsg(int narg, const std::string& message) const;

  /**
   * Raises a VM error. Never returns, and C++ objects of the calling frames
   * are not destroyed. Native functions should throw instead and let
   * `GLua::function` convert the exception.
   */
  [[noreturn]] void error(const char* message) const;

  /**
   * Reports an error without interrupting the VM: through
   * `ErrorNoHaltWithStack`, or `ErrorNoHalt` when a traceback is given. Falls
   * back to `GLUA_LOG_ERROR` when the global is missing or fails.
   */
  void errorNoHalt(std::string_view message, std::optional<std::string_view> traceback = std::nullopt) const;

private:
  bool globalFlag(const char* name) const;
  std::optional<LuaError> statusToError(int status) const;

  glua_State* _L;
};

/**
 * Verifies at scope exit that the stack height is what it was at
 * construction. A dirty stack is dumped and is fatal. Not checked while an
 * exception is unwinding through the scope.
 */
class StackGuard {
public:
  explicit StackGuard(State state);
  StackGuard(const StackGuard&) = delete;
  StackGuard& operator=(const StackGuard&) = delete;
  ~StackGuard();

private:
  State _state;
  int _top;
  int _uncaught;
};

#define GLUA_CONCAT_INNER(a, b) a##b
#define GLUA_CONCAT(a, b) GLUA_CONCAT_INNER(a, b)

#if GLUA_PORT_STACK_GUARD
  #define GLUA_STACK_GUARD(state) ::GLua::StackGuard GLUA_CONCAT(gluaStackGuard_, __LINE__)(state)
#else
  #define GLUA_STACK_GUARD(state) ((void)(state))
#endif

template <typename T>
T& State::getUserdata(int index, const char* metaName) const {
  if (!isUserdata(index)) {
    throw std::runtime_error(metaName
      ? std::string("expected a userdata of type: ") + metaName
      : std::string("expected a userdata"));
  }

  if (metaName) {
    // getMetatable pushes nothing when there is no metatable
    bool hasMetatable = getMetatable(index);
    getMetatableName(metaName);
    bool matches = hasMetatable && rawEqual(-1, -2);
    popN(hasMetatable ? 2 : 1);
    if (!matches) {
      throw std::runtime_error(std::string("expected a userdata of type: ") + metaName);
    }
  }

  void* userdata = toUserdata(index);
  if (!userdata) {
    throw std::runtime_error("invalid userdata pointer");
  }
  if (reinterpret_cast<uintptr_t>(userdata) % alignof(T) != 0) {
    throw std::runtime_error("invalid userdata pointer alignment");
  }
  return *static_cast<T*>(userdata);
}

template <typename T, typename... Args>
T* State::newUserdata(const char* metaName, Args&&... args) const {
  void* memory = symbols().lua_newuserdata(_L, sizeof(T));
  T* value;
  try {
    value = new (memory) T(std::forward<Args>(args)...);
  }
  catch (std::exception&) {
    pop();
    throw;
  }
  if (metaName) {
    getMetatableName(metaName);
    setMetatable(-2);
  }
  return value;
}

template <typename T>
void State::registerFinalizer(const char* metaName) const {
  newMetatable(metaName);
  pushFunction(&gcFinalizer<T>);
  setField(-2, "__gc");
  pop();
}

} // namespace GLua
