#include "Net.hh"

using namespace GLua;

void GLua::addNetworkStrings(State state, const std::vector<std::string>& names) {
  if (names.empty()) {
    return;
  }

  GLUA_STACK_GUARD(state);
  state.getGlobal("util");
  state.getField(-1, "AddNetworkString");
  for (auto& name : names) {
    state.pushValue(-1);
    state.pushString(name);
    state.call(1, 0);
  }
  state.popN(2);
}

void GLua::receive(State state, const std::string& name, glua_CFunction func) {
  GLUA_STACK_GUARD(state);
  state.getGlobal("net");
  state.getField(-1, "Receive");
  state.pushString(name);
  state.pushFunction(func);
  state.call(2, 0);
  state.pop();
}
