#include "LuaError.hh"

#include "State.hh"

using namespace GLua;

LuaError LuaError::fromStatus(State state, int code) {
  Kind kind;
  switch (code) {
    case GLUA_ERRMEM: return LuaError(Kind::MemoryAllocationError, std::nullopt, code);
    case GLUA_ERRERR: return LuaError(Kind::ErrorHandlerError, std::nullopt, code);
    case GLUA_ERRSYNTAX: kind = Kind::SyntaxError; break;
    case GLUA_ERRFILE: kind = Kind::FileError; break;
    case GLUA_ERRRUN: kind = Kind::RuntimeError; break;
    default: return LuaError(Kind::Unknown, std::nullopt, code);
  }

  std::optional<std::string> message;
  try {
    message = state.getString(-1);
  }
  catch (std::bad_alloc&) {
    // Translation must not fail; the kind alone still describes the error
    message = std::nullopt;
  }
  return LuaError(kind, std::move(message), code);
}

std::string LuaError::toString() const {
  switch (_kind) {
    case Kind::MemoryAllocationError: return "Out of memory";
    case Kind::SyntaxError: return _message ? "Syntax error: " + *_message : "Syntax error";
    case Kind::FileError: return _message ? "File error: " + *_message : "File error";
    case Kind::RuntimeError: return _message ? *_message : "Runtime error";
    case Kind::ErrorHandlerError: return "Error handler error";
    case Kind::Unknown: break;
  }
  return "Unknown Lua error code: " + std::to_string(_code);
}
