#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include "State.hh"

namespace GLua {

/**
 * Callbacks scheduled from any thread and run on the VM thread.
 *
 * Producers call `schedule`; the VM thread calls `drain` from a timer that
 * `registerThink` installs. Tasks from one producer run in the order they
 * were scheduled. Scheduling never blocks on the consumer and the queue is
 * unbounded.
 */
class TaskQueue {
public:
  using Callback = std::function<void(State)>;

  enum class Phase {
    Uninitialized,
    Active,
    Closed,
  };

  TaskQueue() = default;
  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  void open();
  /** Drops pending tasks. Later `schedule` calls are ignored. */
  void close();
  Phase phase() const { return _phase.load(std::memory_order_acquire); }

  /**
   * Queues `callback`. `context` identifies the task in error reports, e.g. a
   * traceback captured when it was scheduled. Ignored unless the queue is
   * open.
   */
  void schedule(std::string context, Callback callback);

  /**
   * Runs every task that is ready, each in a protected call. A failing task
   * is reported through `errorNoHalt` and does not stop the others. Returns
   * the number of tasks run.
   */
  size_t drain(State state);

  /** Outstanding task count, exact only when no producer is running */
  size_t size() const { return _pending.load(std::memory_order_acquire); }
  bool empty() const { return size() == 0; }

  /** Creates the timer that drains this queue every tick */
  void registerThink(State state);
  void unregisterThink(State state);
  const std::string& thinkTimerName() const { return _timerName; }

private:
  struct Task {
    Callback callback;
    std::string context;
  };

  static int runTask(glua_State* L);
  static int think(glua_State* L);

  bool tryPop(Task& task);

  std::mutex _mutex;
  std::deque<Task> _tasks;
  std::atomic<size_t> _pending { 0 };
  std::atomic<Phase> _phase { Phase::Uninitialized };
  std::string _timerName;
};

/** Schedules `callback` onto the process-wide queue of `Runtime` */
void waitLuaTick(std::string context, TaskQueue::Callback callback);

} // namespace GLua
