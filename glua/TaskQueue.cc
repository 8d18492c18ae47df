#include "TaskQueue.hh"

#include <cstdio>
#include <random>

#include "Runtime.hh"

using namespace GLua;

namespace {

std::string randomAlphanumeric(size_t length) {
  static const char alphabet[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device device;
  std::mt19937 generator(device());
  std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
  std::string result;
  for (size_t i = 0; i < length; i++) {
    result.push_back(alphabet[pick(generator)]);
  }
  return result;
}

} // namespace

void TaskQueue::open() {
  Phase expected = Phase::Uninitialized;
  _phase.compare_exchange_strong(expected, Phase::Active, std::memory_order_acq_rel);
}

void TaskQueue::close() {
  // Destroyed after the lock is released: a captured object may schedule
  // from its destructor
  std::deque<Task> dropped;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _phase.store(Phase::Closed, std::memory_order_release);
    dropped.swap(_tasks);
    _pending.store(0, std::memory_order_release);
  }
}

void TaskQueue::schedule(std::string context, Callback callback) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (phase() != Phase::Active) {
    return;
  }
  _tasks.push_back(Task { std::move(callback), std::move(context) });
  _pending.fetch_add(1, std::memory_order_release);
}

bool TaskQueue::tryPop(Task& task) {
  Task next;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_tasks.empty()) {
      return false;
    }
    next = std::move(_tasks.front());
    _tasks.pop_front();
    _pending.fetch_sub(1, std::memory_order_release);
  }
  // Releases the previous task outside the lock
  task = std::move(next);
  return true;
}

size_t TaskQueue::drain(State state) {
  if (phase() != Phase::Active || empty()) {
    return 0;
  }

  size_t count = 0;
  Task task;
  // A task may close the queue (e.g. by unloading the module)
  while (phase() == Phase::Active && tryPop(task)) {
    count++;
    std::optional<std::string_view> context;
    if (!task.context.empty()) {
      context = task.context;
    }
    state.cpcallIgnore(&TaskQueue::runTask, &task, context);
  }
  return count;
}

int TaskQueue::runTask(glua_State* L) {
  {
    State state(L);
    Task* task = static_cast<Task*>(state.toUserdata(1));
    try {
      Callback callback = std::move(task->callback);
      callback(state);
      return 0;
    }
    catch (std::exception& e) {
      state.pushString(e.what());
    }
  }
  return symbols().lua_error(L);
}

int TaskQueue::think(glua_State* L) {
  {
    State state(L);
    auto queue = static_cast<TaskQueue*>(state.toUserdata(State::upvalueIndex(1)));
    try {
      queue->drain(state);
      return 0;
    }
    catch (std::exception& e) {
      state.pushString(e.what());
    }
  }
  return symbols().lua_error(L);
}

void TaskQueue::registerThink(State state) {
  char address[32];
  snprintf(address, sizeof address, "%p", static_cast<void*>(this));
  _timerName = GLUA_THINK_TIMER_PREFIX + randomAlphanumeric(GLUA_THINK_TIMER_RANDOM_LENGTH) + "_" + address;

  GLUA_STACK_GUARD(state);
  state.getGlobal("timer");
  if (!state.isTable(-1)) {
    state.pop();
    state.errorNoHalt("timer library is unavailable; scheduled tasks will not run");
    return;
  }
  state.getField(-1, "Create");
  state.pushString(_timerName);
  state.pushNumber(0);
  state.pushNumber(0);
  state.pushLightUserdata(this);
  state.pushClosure(&TaskQueue::think, 1);
  state.pcallIgnore(4, 0);
  state.pop();
}

void TaskQueue::unregisterThink(State state) {
  if (_timerName.empty()) {
    return;
  }

  GLUA_STACK_GUARD(state);
  state.getGlobal("timer");
  if (state.isTable(-1)) {
    state.getField(-1, "Remove");
    if (state.isFunction(-1)) {
      state.pushString(_timerName);
      state.pcallIgnore(1, 0);
    } else {
      state.pop();
    }
  }
  state.pop();
  _timerName.clear();
}

void GLua::waitLuaTick(std::string context, TaskQueue::Callback callback) {
  Runtime::instance().taskQueue().schedule(std::move(context), std::move(callback));
}
