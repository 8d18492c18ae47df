#include "Runtime.hh"

using namespace GLua;

Runtime& Runtime::instance() {
  static Runtime runtime;
  return runtime;
}

void Runtime::setSymbolResolver(SymbolResolver resolver) {
  GLua::setSymbolResolver(std::move(resolver));
}

void Runtime::load(State state) {
  Phase expected = Phase::Uninitialized;
  if (!_phase.compare_exchange_strong(expected, Phase::Active, std::memory_order_acq_rel)) {
    return;
  }
  symbols();
  _taskQueue.open();
  _taskQueue.registerThink(state);
}

void Runtime::unload(State state) {
  Phase expected = Phase::Active;
  if (!_phase.compare_exchange_strong(expected, Phase::Closed, std::memory_order_acq_rel)) {
    return;
  }
  _taskQueue.close();
  _taskQueue.unregisterThink(state);
}
