#pragma once

#include <optional>
#include <string>
#include <utility>

namespace GLua {

class State;

/**
 * A failure reported by the VM through a status code.
 */
class LuaError {
public:
  enum class Kind {
    MemoryAllocationError, // GLUA_ERRMEM
    SyntaxError,           // GLUA_ERRSYNTAX
    FileError,             // GLUA_ERRFILE
    RuntimeError,          // GLUA_ERRRUN
    ErrorHandlerError,     // GLUA_ERRERR
    Unknown,
  };

  LuaError(Kind kind, std::optional<std::string> message, int code)
    : _kind(kind), _message(std::move(message)), _code(code) {}

  /**
   * Translates a non-zero status code. For syntax, file and runtime errors the
   * message is taken from the top of the stack when it is a string. The stack
   * is not modified.
   */
  static LuaError fromStatus(State state, int code);

  Kind kind() const { return _kind; }
  const std::optional<std::string>& message() const { return _message; }
  int code() const { return _code; }

  std::string toString() const;

private:
  Kind _kind;
  std::optional<std::string> _message;
  int _code;
};

inline bool operator==(const LuaError& a, const LuaError& b) {
  return a.kind() == b.kind() && a.message() == b.message() && a.code() == b.code();
}

} // namespace GLua
