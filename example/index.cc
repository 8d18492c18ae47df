#include "glua/Module.hh"
#include "glua/Net.hh"

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <iterator>
#include <limits>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

const char* const counterMeta = "glua_example.Counter";

struct Counter {
  std::string name;
  int64_t value = 0;
};

/**
 * Timer threads started by `after`. Every thread is joined before the module
 * unloads; `stopAll` wakes the sleeping ones early.
 */
class Workers {
public:
  Workers() = default;
  ~Workers() { stopAll(); }

  template <typename F>
  void start(std::chrono::duration<double, std::milli> delay, F onElapsed);
  void stopAll();

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void joinFinished();

  std::mutex _mutex;
  std::condition_variable _wake;
  bool _stopping = false;
  std::list<Worker> _workers;
};

template <typename F>
void Workers::start(std::chrono::duration<double, std::milli> delay, F onElapsed) {
  joinFinished();

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(_mutex);
  if (_stopping) {
    return;
  }
  std::thread thread([this, delay, done, onElapsed] {
    bool stopped;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      stopped = _wake.wait_for(lock, delay, [this] { return _stopping; });
    }
    if (!stopped) {
      onElapsed();
    }
    done->store(true);
  });
  _workers.push_back(Worker { std::move(thread), done });
}

void Workers::joinFinished() {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto it = _workers.begin(); it != _workers.end();) {
      auto next = std::next(it);
      if (it->done->load()) {
        finished.splice(finished.end(), _workers, it);
      }
      it = next;
    }
  }
  for (auto& worker : finished) {
    worker.thread.join();
  }
}

void Workers::stopAll() {
  std::list<Worker> stopping;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopping = true;
    stopping.swap(_workers);
  }
  _wake.notify_all();
  for (auto& worker : stopping) {
    worker.thread.join();
  }
}

Workers workers;

// Callbacks of `after` that have not run yet. VM thread only.
std::set<GLua::Reference> pendingCallbacks;

int counterIncrement(GLua::State LUA) {
  auto& counter = LUA.getUserdata<Counter>(1, counterMeta);

  int64_t delta = 1;
  if (!LUA.isNoneOrNil(2)) {
    double amount = LUA.checkNumber(2);
    if (!(std::fabs(amount) <= double(GLUA_MAX_SAFE_INTEGER)) || amount != std::trunc(amount)) {
      throw GLua::ArgumentError(LUA.errArgMsg(2, "integer expected"));
    }
    delta = int64_t(amount);
  }

  if ((delta > 0 && counter.value > std::numeric_limits<int64_t>::max() - delta)
    || (delta < 0 && counter.value < std::numeric_limits<int64_t>::min() - delta)) {
    throw std::overflow_error("counter overflow");
  }
  counter.value += delta;
  LUA.pushNumber(counter.value);
  return 1;
}

int counterName(GLua::State LUA) {
  LUA.pushString(LUA.getUserdata<Counter>(1, counterMeta).name);
  return 1;
}

} // namespace

GLUA_FUNCTION(glua_example_add) {
  LUA.pushNumber(LUA.checkNumber(1) + LUA.checkNumber(2));
  return 1;
}

GLUA_FUNCTION(glua_example_counter) {
  LUA.newUserdata<Counter>(counterMeta, Counter { LUA.checkString(1), 0 });
  return 1;
}

// glua_example.after(ms, callback): calls back on the game thread once a
// worker thread has slept for `ms` milliseconds
GLUA_FUNCTION(glua_example_after) {
  double ms = LUA.checkNumber(1);
  if (!(ms >= 0 && ms <= 24 * 60 * 60 * 1000.0)) {
    throw GLua::ArgumentError(LUA.errArgMsg(1, "delay out of range"));
  }
  LUA.checkFunction(2);
  LUA.pushValue(2);
  GLua::Reference callback = LUA.reference();
  pendingCallbacks.insert(callback);

  workers.start(std::chrono::duration<double, std::milli>(ms), [callback] {
    GLua::waitLuaTick("glua_example.after", [callback](GLua::State state) {
      // Already released if the module closed first
      if (pendingCallbacks.erase(callback) == 0) {
        return;
      }
      state.pcallIgnoreFunctionRef(callback, 0, 0);
      state.dereference(callback);
    });
  });
  return 0;
}

GLUA_MODULE_OPEN() {
  GLUA_STACK_GUARD(LUA);

  LUA.registerFinalizer<Counter>(counterMeta);
  LUA.newMetatable(counterMeta);
  LUA.newTable();
  LUA.pushFunction(GLua::function<counterIncrement>);
  LUA.setField(-2, "Increment");
  LUA.pushFunction(GLua::function<counterName>);
  LUA.setField(-2, "Name");
  LUA.setField(-2, "__index");
  LUA.pop();

  static const glua_Reg functions[] = {
    { "add", glua_example_add },
    { "counter", glua_example_counter },
    { "after", glua_example_after },
    { nullptr, nullptr },
  };
  LUA.registerLibrary("glua_example", functions);
  LUA.pop();

  if (LUA.isServer()) {
    GLua::addNetworkStrings(LUA, { "glua_example" });
  }
  return 0;
}

// Runs before the task queue closes, so callbacks still waiting in it are
// released here
GLUA_MODULE_CLOSE() {
  workers.stopAll();
  for (GLua::Reference callback : pendingCallbacks) {
    LUA.dereference(callback);
  }
  pendingCallbacks.clear();
  return 0;
}
