#include "State.hh"

#include <cstdio>

#include "misc.hh"

using namespace GLua;

std::optional<State> State::newState() {
  glua_State* L = symbols().luaL_newstate();
  if (!L) {
    return std::nullopt;
  }
  symbols().luaL_openlibs(L);
  return State(L);
}

bool State::globalFlag(const char* name) const {
  getGlobal(name);
  bool flag = getBoolean(-1);
  pop();
  return flag;
}

std::string State::luaTypeName(int typeId) const {
  const char* name = symbols().lua_typename(_L, typeId);
  return name ? name : "?";
}

std::optional<std::string_view> State::getBinaryString(int index) const {
  if (!isString(index)) {
    return std::nullopt;
  }
  size_t length = 0;
  const char* bytes = symbols().lua_tolstring(_L, index, &length);
  if (!bytes) {
    return std::nullopt;
  }
  return std::string_view(bytes, length);
}

std::optional<std::string> State::getString(int index) const {
  auto bytes = getBinaryString(index);
  if (!bytes) {
    return std::nullopt;
  }
  return toUtf8Lossy(*bytes);
}

std::string State::checkString(int arg) const {
  auto value = getString(arg);
  if (!value) throw ArgumentError(tagError(arg, GLUA_TSTRING));
  return std::move(*value);
}

std::string_view State::checkBinaryString(int arg) const {
  auto value = getBinaryString(arg);
  if (!value) throw ArgumentError(tagError(arg, GLUA_TSTRING));
  return *value;
}

double State::checkNumber(int arg) const {
  if (!isNumber(arg)) throw ArgumentError(tagError(arg, GLUA_TNUMBER));
  return toNumber(arg);
}

bool State::checkBoolean(int arg) const {
  if (!isBoolean(arg)) throw ArgumentError(tagError(arg, GLUA_TBOOLEAN));
  return getBoolean(arg);
}

void State::checkTable(int arg) const {
  if (!isTable(arg)) throw ArgumentError(tagError(arg, GLUA_TTABLE));
}

void State::checkFunction(int arg) const {
  if (!isFunction(arg)) throw ArgumentError(tagError(arg, GLUA_TFUNCTION));
}

void State::pushClosure(glua_CFunction func, int n) const {
  if (n > GLUA_MAX_CLOSURE_UPVALUES) {
    throw std::out_of_range("Can't push more than 255 upvalues into a closure");
  }
  symbols().lua_pushcclosure(_L, func, n);
}

bool State::getFieldTypeOrNil(int index, const char* name, int type) const {
  getField(index, name);

  if (isNoneOrNil(-1)) {
    pop();
    return false;
  }

  int actual = luaType(-1);
  if (actual != type) {
    pop();
    throw std::runtime_error(std::string("bad type for field: '") + name + "' ("
      + luaTypeName(type) + " expected, got: " + luaTypeName(actual) + ")");
  }

  return true;
}

std::optional<LuaError> State::statusToError(int status) const {
  if (status == GLUA_OK) {
    return std::nullopt;
  }
  LuaError error = LuaError::fromStatus(*this, status);
  // Every failing status leaves exactly one error value
  pop();
  return error;
}

std::optional<LuaError> State::pcall(int nargs, int nresults, int errfunc) const {
  return statusToError(symbols().lua_pcall(_L, nargs, nresults, errfunc));
}

bool State::pcallIgnore(int nargs, int nresults) const {
  if (auto error = pcall(nargs, nresults)) {
    errorNoHalt(error->toString());
    return false;
  }
  return true;
}

FunctionRefCall State::pcallIgnoreFunctionRef(Reference ref, int nargs, int nresults) const {
  if (!fromReference(ref)) {
    popN(nargs);
    return { false, false };
  }

  if (!isFunction(-1)) {
    popN(nargs + 1);
    return { false, false };
  }

  // Function goes below its arguments
  if (nargs > 0) {
    insert(-(nargs + 1));
  }

  return { true, pcallIgnore(nargs, nresults) };
}

bool State::pcallIfValidFunction(int nargs, int nresults) const {
  if (!isFunction(-nargs - 1)) {
    popN(nargs + 1);
    return false;
  }
  pcallIgnore(nargs, nresults);
  return true;
}

bool State::isValidFunctionRef(Reference ref) const {
  if (!fromReference(ref)) {
    return false;
  }
  bool function = isFunction(-1);
  pop();
  return function;
}

std::optional<LuaError> State::cpcall(glua_CFunction func, void* userdata) const {
  return statusToError(symbols().lua_cpcall(_L, func, userdata));
}

bool State::cpcallIgnore(glua_CFunction func, void* userdata, std::optional<std::string_view> traceback) const {
  if (auto error = cpcall(func, userdata)) {
    errorNoHalt(error->toString(), traceback);
    return false;
  }
  return true;
}

std::optional<LuaError> State::loadString(const std::string& source) const {
  return statusToError(symbols().luaL_loadstring(_L, source.c_str()));
}

std::optional<LuaError> State::loadBuffer(std::string_view buffer, const char* name) const {
  return statusToError(symbols().luaL_loadbuffer(_L, buffer.data(), buffer.size(), name));
}

std::optional<LuaError> State::loadFile(const char* path) const {
  return statusToError(symbols().luaL_loadfile(_L, path));
}

void State::dereference(Reference ref) const {
  if (ref == GLUA_REFNIL || ref == GLUA_NOREF) {
    return;
  }
  symbols().luaL_unref(_L, GLUA_REGISTRYINDEX, ref);
}

bool State::fromReference(Reference ref) const {
  if (ref == GLUA_REFNIL || ref == GLUA_NOREF) {
    return false;
  }
  rawGetI(GLUA_REGISTRYINDEX, ref);
  return true;
}

void State::coroutineResumeCall(State caller, int narg) const {
  int status = coroutineResume(narg);
  if (status == GLUA_OK || status == GLUA_YIELD) {
    return;
  }

  {
    std::string message;
    switch (status) {
      case GLUA_ERRRUN:
        message = getString(-1).value_or("Unknown error");
        pop();
        break;
      case GLUA_ERRMEM:
        message = "Out of memory";
        break;
      default:
        message = "Unknown internal Lua error";
        break;
    }
    caller.pushString(message);
  }
  symbols().lua_error(caller._L);
  GLUA_FATAL_ERROR("lua_error returned");
}

std::optional<int> State::coroutineResumeIgnore(int narg, std::optional<std::string_view> traceback) const {
  int status = coroutineResume(narg);
  if (status == GLUA_OK || status == GLUA_YIELD) {
    return status;
  }
  LuaError error = LuaError::fromStatus(*this, status);
  pop();
  errorNoHalt(error.toString(), traceback);
  return std::nullopt;
}

std::optional<glua_Debug> State::getStackAt(int level) const {
  glua_Debug ar {};
  if (symbols().lua_getstack(_L, level, &ar) == 0) {
    return std::nullopt;
  }
  return ar;
}

std::optional<glua_Debug> State::debugGetInfoAt(int level, const char* what) const {
  glua_Debug ar {};
  if (symbols().lua_getstack(_L, level, &ar) != 0 && symbols().lua_getinfo(_L, what, &ar) != 0) {
    return ar;
  }
  return std::nullopt;
}

bool State::debugGetInfoFromAr(glua_Debug& ar, const char* what) const {
  return symbols().lua_getinfo(_L, what, &ar) != 0;
}

std::optional<glua_Debug> State::debugGetInfoFromStack(const char* what) const {
  glua_Debug ar {};
  if (symbols().lua_getinfo(_L, what, &ar) == 0) {
    return std::nullopt;
  }
  return ar;
}

std::string State::traceback(State thread, int level) const {
  symbols().luaL_traceback(_L, thread._L, nullptr, level);
  std::string result = getString(-1).value_or("Unknown error");
  pop();
  return result;
}

std::string State::dumpValue(int index) const {
  switch (luaType(index)) {
    case GLUA_TSTRING: return "\"" + getString(index).value_or("") + "\"";
    case GLUA_TBOOLEAN: return getBoolean(index) ? "true" : "false";
    case GLUA_TNUMBER: {
      char buffer[32];
      snprintf(buffer, sizeof buffer, "%.14g", toNumber(index));
      return buffer;
    }
    default: return getType(index);
  }
}

void State::dumpStack() const {
  int top = getTop();
  printf("\n=== STACK DUMP ===\n");
  printf("Stack size: %d\n", top);
  for (int i = 1; i <= top; i++) {
    int type = luaType(i);
    if (type == GLUA_TSTRING || type == GLUA_TBOOLEAN || type == GLUA_TNUMBER) {
      printf("%d. %s: %s\n", i, luaTypeName(type).c_str(), dumpValue(i).c_str());
    } else {
      printf("%d. %s\n", i, luaTypeName(type).c_str());
    }
  }
  printf("\n");
}

std::string State::typeError(int narg, const std::string& tname) const {
  return errArgMsg(narg, tname + " expected, got " + luaTypeName(luaType(narg)));
}

std::string State::tagError(int narg, int tag) const {
  return typeError(narg, luaTypeName(tag));
}

std::string State::errArgMsg(int narg, const std::string& message) const {
  std::string fname = "?";
  std::string namewhat;

  if (auto ar = debugGetInfoAt(0, "n")) {
    if (ar->name) fname = ar->name;
    if (ar->namewhat) namewhat = ar->namewhat;
  }

  if (narg < 0 && narg > GLUA_REGISTRYINDEX) {
    narg = getTop() + narg + 1;
  }

  if (namewhat == "method") {
    narg--;
    if (narg == 0) {
      return "bad self parameter in method '" + fname + "' (" + message + ")";
    }
  }

  return "bad argument #" + std::to_string(narg) + " to '" + fname + "' (" + message + ")";
}

void State::error(const char* message) const {
  pushString(message);
  symbols().lua_error(_L);
  GLUA_FATAL_ERROR("lua_error returned");
}

void State::errorNoHalt(std::string_view message, std::optional<std::string_view> traceback) const {
  std::string text;
  if (traceback) {
    getGlobal("ErrorNoHalt");
    text = "[ERROR] ";
    text.append(message);
    text += "\n";
    text.append(*traceback);
    text += "\n";
  } else {
    getGlobal("ErrorNoHaltWithStack");
    text = std::string(message);
  }

  if (isNoneOrNil(-1)) {
    pop();
  } else {
    pushString(text);
    if (!pcall(1, 0)) {
      return;
    }
  }

  std::string fallback(message);
  if (traceback) {
    fallback += "\n";
    fallback.append(*traceback);
  }
  GLUA_LOG_ERROR(fallback.c_str());
}

StackGuard::StackGuard(State state)
  : _state(state), _top(state.getTop()), _uncaught(std::uncaught_exceptions())
{
}

StackGuard::~StackGuard() {
  if (std::uncaught_exceptions() > _uncaught) {
    return;
  }
  int top = _state.getTop();
  if (top != _top) {
    _state.dumpStack();
    GLUA_FATAL_ERROR("Stack is dirty! Expected the stack to have " + std::to_string(_top)
      + " elements, but it has " + std::to_string(top) + "!");
  }
}
