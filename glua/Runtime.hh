#pragma once

#include <atomic>

#include "State.hh"
#include "SymbolTable.hh"
#include "TaskQueue.hh"

namespace GLua {

/**
 * Process-wide state of a loaded module: the imported symbols and the task
 * queue. Driven by `gmod13_open` and `gmod13_close`.
 */
class Runtime {
public:
  enum class Phase {
    Uninitialized,
    Active,
    Closed,
  };

  static Runtime& instance();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  /**
   * Imports symbols through `resolver` instead of the host's `lua_shared`.
   * Must be called before anything touches the VM.
   */
  static void setSymbolResolver(SymbolResolver resolver);

  /** Imports symbols, opens the task queue and starts its timer */
  void load(State state);
  /** Closes the task queue and stops its timer */
  void unload(State state);

  Phase phase() const { return _phase.load(std::memory_order_acquire); }
  TaskQueue& taskQueue() { return _taskQueue; }

private:
  Runtime() = default;

  std::atomic<Phase> _phase { Phase::Uninitialized };
  TaskQueue _taskQueue;
};

} // namespace GLua
