#include "LuaTest.hh"

#include <cstdio>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>

#include "glua/TaskQueue.hh"

using namespace GLua;

class TaskQueueTest: public LuaTest {};

TEST_F(TaskQueueTest, IgnoresTasksUntilOpened) {
  TaskQueue queue;
  bool ran = false;
  queue.schedule("", [&](State) { ran = true; });
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.drain(lua()), 0u);
  EXPECT_FALSE(ran);
}

TEST_F(TaskQueueTest, RunsTasksInOrder) {
  TaskQueue queue;
  queue.open();
  std::vector<int> order;
  for (int i = 0; i < 5; i++) {
    queue.schedule("", [&order, i](State) { order.push_back(i); });
  }
  EXPECT_EQ(queue.size(), 5u);

  EXPECT_EQ(queue.drain(lua()), 5u);
  EXPECT_EQ(order, (std::vector<int> { 0, 1, 2, 3, 4 }));
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(TaskQueueTest, TasksRunOnTheGivenState) {
  TaskQueue queue;
  queue.open();
  queue.schedule("", [](State state) {
    state.pushString("from task");
    state.setGlobal("taskResult");
  });
  queue.drain(lua());

  lua().getGlobal("taskResult");
  EXPECT_EQ(lua().getString(-1), "from task");
}

TEST_F(TaskQueueTest, PreservesOrderPerProducer) {
  const int producers = 4;
  const int tasksPerProducer = 250;

  TaskQueue queue;
  queue.open();
  std::vector<std::vector<int>> seen(producers);

  std::vector<std::thread> threads;
  for (int p = 0; p < producers; p++) {
    threads.emplace_back([&queue, &seen, p] {
      for (int i = 0; i < tasksPerProducer; i++) {
        queue.schedule("", [&seen, p, i](State) { seen[p].push_back(i); });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(queue.drain(lua()), size_t(producers * tasksPerProducer));
  for (int p = 0; p < producers; p++) {
    ASSERT_EQ(seen[p].size(), size_t(tasksPerProducer));
    for (int i = 0; i < tasksPerProducer; i++) {
      EXPECT_EQ(seen[p][i], i);
    }
  }
}

TEST_F(TaskQueueTest, FailingTaskIsReportedAndOthersRun) {
  TaskQueue queue;
  queue.open();
  int ran = 0;
  queue.schedule("", [&](State) { ran++; });
  queue.schedule("ctx", [](State) { throw std::runtime_error("task failed"); });
  queue.schedule("", [](State) { throw std::runtime_error("no context"); });
  queue.schedule("", [&](State) { ran++; });

  EXPECT_EQ(queue.drain(lua()), 4u);
  EXPECT_EQ(ran, 2);
  ASSERT_EQ(MockLua::reportedErrors(L).size(), 2u);
  EXPECT_EQ(MockLua::reportedErrors(L)[0], "[ERROR] task failed\nctx\n");
  EXPECT_EQ(MockLua::reportedErrors(L)[1], "no context");
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(TaskQueueTest, CloseDropsPendingAndLaterTasks) {
  TaskQueue queue;
  queue.open();
  bool ran = false;
  queue.schedule("", [&](State) { ran = true; });
  queue.close();
  EXPECT_EQ(queue.phase(), TaskQueue::Phase::Closed);
  EXPECT_TRUE(queue.empty());

  queue.schedule("", [&](State) { ran = true; });
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.drain(lua()), 0u);
  EXPECT_FALSE(ran);

  queue.open();
  EXPECT_EQ(queue.phase(), TaskQueue::Phase::Closed);
}

namespace {

// Schedules a follow-up task when the last copy of the owning callback dies
struct ScheduleOnDestroy {
  ScheduleOnDestroy(TaskQueue* queue, bool* ran): queue(queue), ran(ran) {}
  ScheduleOnDestroy(const ScheduleOnDestroy&) = delete;
  ~ScheduleOnDestroy() {
    bool* flag = ran;
    queue->schedule("", [flag](State) { *flag = true; });
  }

  TaskQueue* queue;
  bool* ran;
};

} // namespace

TEST_F(TaskQueueTest, CloseReleasesTasksThatScheduleOnDestruction) {
  TaskQueue queue;
  queue.open();
  bool ran = false;
  auto holder = std::make_shared<ScheduleOnDestroy>(&queue, &ran);
  queue.schedule("", [holder](State) {});
  holder.reset();

  queue.close();
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.drain(lua()), 0u);
  EXPECT_FALSE(ran);
}

TEST_F(TaskQueueTest, DrainReleasesTasksThatScheduleOnDestruction) {
  TaskQueue queue;
  queue.open();
  bool ran = false;
  auto holder = std::make_shared<ScheduleOnDestroy>(&queue, &ran);
  queue.schedule("", [holder](State) {});
  holder.reset();

  EXPECT_EQ(queue.drain(lua()), 2u);
  EXPECT_TRUE(ran);
  EXPECT_TRUE(queue.empty());
}

TEST_F(TaskQueueTest, TaskClosingTheQueueStopsTheDrain) {
  TaskQueue queue;
  queue.open();
  int ran = 0;
  queue.schedule("", [&](State) { ran++; queue.close(); });
  queue.schedule("", [&](State) { ran++; });
  EXPECT_EQ(queue.drain(lua()), 1u);
  EXPECT_EQ(ran, 1);
}

TEST_F(TaskQueueTest, ThinkTimerDrainsTheQueue) {
  TaskQueue queue;
  queue.open();
  queue.registerThink(lua());
  EXPECT_EQ(lua().getTop(), 0);

  const std::string& name = queue.thinkTimerName();
  EXPECT_EQ(name.rfind(GLUA_THINK_TIMER_PREFIX, 0), 0u);
  char address[32];
  snprintf(address, sizeof address, "%p", static_cast<void*>(&queue));
  EXPECT_EQ(name.size(), strlen(GLUA_THINK_TIMER_PREFIX) + GLUA_THINK_TIMER_RANDOM_LENGTH + 1 + strlen(address));
  EXPECT_EQ(name.substr(name.size() - strlen(address)), address);
  EXPECT_EQ(MockLua::timerNames(L), std::vector<std::string> { name });

  int ran = 0;
  queue.schedule("", [&](State) { ran++; });
  EXPECT_EQ(MockLua::tickTimers(L), 1u);
  EXPECT_EQ(ran, 1);
  EXPECT_TRUE(MockLua::reportedErrors(L).empty());

  queue.unregisterThink(lua());
  EXPECT_TRUE(MockLua::timerNames(L).empty());
  EXPECT_TRUE(queue.thinkTimerName().empty());
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(TaskQueueTest, TimerNamesDifferPerQueue) {
  TaskQueue first;
  TaskQueue second;
  first.registerThink(lua());
  second.registerThink(lua());
  EXPECT_NE(first.thinkTimerName(), second.thinkTimerName());
  EXPECT_EQ(MockLua::timerNames(L).size(), 2u);
  first.unregisterThink(lua());
  second.unregisterThink(lua());
}

TEST_F(TaskQueueTest, MissingTimerLibraryIsReported) {
  lua().pushNil();
  lua().setGlobal("timer");

  TaskQueue queue;
  queue.registerThink(lua());
  ASSERT_EQ(MockLua::reportedErrors(L).size(), 1u);
  EXPECT_EQ(MockLua::reportedErrors(L)[0], "timer library is unavailable; scheduled tasks will not run");

  queue.unregisterThink(lua());
  EXPECT_EQ(lua().getTop(), 0);
}
