#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "glua/LuaError.hh"
#include "glua/Module.hh"
#include "glua/State.hh"
#include "glua/TaskQueue.hh"

using namespace GLua;

namespace {

std::vector<std::string> reported;

int recordError(glua_State* L) {
  reported.push_back(State(L).getString(1).value_or(""));
  return 0;
}

int destroyed = 0;

struct Tracked {
  ~Tracked() { destroyed++; }
};

int describe(State LUA) {
  LUA.pushNumber(LUA.checkNumber(1));
  return 1;
}

int failAfterConstructing(State) {
  Tracked tracked;
  throw std::runtime_error("native failure");
}

int resumeFailing(glua_State* L) {
  State state(L);
  State thread = state.coroutineNew();
  if (state.loadString("error('coroutine failed', 0)")) {
    return 0;
  }
  state.coroutineExchange(thread, 1);
  thread.coroutineResumeCall(state, 0);
  return 0;
}

bool startsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

/**
 * Runs the bridge against a real LuaJIT VM. Host globals the game would
 * provide are stood in for by `ErrorNoHalt`, `ErrorNoHaltWithStack` and a
 * `timer` table that `tick()` runs.
 */
class HostLuaTest: public ::testing::Test {
protected:
  void SetUp() override {
    auto state = State::newState();
    ASSERT_TRUE(state);
    L = state->raw();
    reported.clear();
    destroyed = 0;

    lua().pushFunction(recordError);
    lua().setGlobal("ErrorNoHalt");
    lua().pushFunction(recordError);
    lua().setGlobal("ErrorNoHaltWithStack");
    ASSERT_FALSE(run(
      "timers = {}\n"
      "timer = {\n"
      "  Create = function(name, delay, reps, fn) timers[name] = fn end,\n"
      "  Remove = function(name) timers[name] = nil end,\n"
      "}\n"));
  }

  void TearDown() override {
    if (L) lua().close();
  }

  State lua() const { return State(L); }

  std::optional<LuaError> run(const std::string& source) {
    if (auto error = lua().loadString(source)) {
      return error;
    }
    return lua().pcall(0, 0);
  }

  void tick() {
    ASSERT_FALSE(run("for _, fn in pairs(timers) do fn() end"));
  }

  void closeState() {
    lua().close();
    L = nullptr;
  }

  glua_State* L = nullptr;
};

TEST_F(HostLuaTest, References) {
  lua().pushString("hello");
  Reference ref = lua().reference();
  EXPECT_GT(ref, 0);
  EXPECT_EQ(lua().getTop(), 0);

  ASSERT_TRUE(lua().fromReference(ref));
  EXPECT_EQ(lua().getString(-1), "hello");
  lua().pop();

  lua().pushNil();
  EXPECT_EQ(lua().reference(), GLUA_REFNIL);
  EXPECT_FALSE(lua().fromReference(GLUA_REFNIL));
  EXPECT_FALSE(lua().fromReference(GLUA_NOREF));
  lua().dereference(GLUA_NOREF);
  EXPECT_EQ(lua().getTop(), 0);

  // The registry hands out a released slot again
  lua().dereference(ref);
  lua().pushString("again");
  EXPECT_EQ(lua().reference(), ref);

  ASSERT_FALSE(lua().loadString("return 1"));
  Reference functionRef = lua().reference();
  EXPECT_TRUE(lua().isValidFunctionRef(functionRef));
  EXPECT_FALSE(lua().isValidFunctionRef(ref));
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(HostLuaTest, SyntaxError) {
  auto error = lua().loadString("x = ");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind(), LuaError::Kind::SyntaxError);
  EXPECT_TRUE(startsWith(error->toString(), "Syntax error: [string \"x = \"]:1:")) << error->toString();
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(HostLuaTest, RuntimeErrorRestoresTheStack) {
  lua().pushNumber(1);
  auto error = run("error('it broke', 0)");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind(), LuaError::Kind::RuntimeError);
  EXPECT_EQ(error->toString(), "it broke");
  EXPECT_EQ(lua().getTop(), 1);

  error = run("error({})");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "Runtime error");
  EXPECT_EQ(lua().getTop(), 1);
}

TEST_F(HostLuaTest, LoadFileAndBuffer) {
  auto error = lua().loadFile("/nonexistent/glua/missing.lua");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind(), LuaError::Kind::FileError);
  EXPECT_TRUE(startsWith(error->toString(), "File error: cannot open")) << error->toString();

  ASSERT_FALSE(lua().loadBuffer("return 12", "=buffer"));
  ASSERT_FALSE(lua().pcall(0, 1));
  EXPECT_EQ(lua().toNumber(-1), 12);
  lua().pop();
}

TEST_F(HostLuaTest, ExceptionsBecomeErrorsAfterDestructorsRun) {
  lua().pushFunction(function<failAfterConstructing>);
  auto error = lua().pcall(0, 0);
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "native failure");
  EXPECT_EQ(destroyed, 1);
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(HostLuaTest, ArgumentErrorsNameTheCallee) {
  lua().pushFunction(function<describe>);
  lua().setGlobal("describe");
  ASSERT_FALSE(run("obj = { describe = describe }"));

  auto error = run("local r = obj:describe() return r");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "bad self parameter in method 'describe' (number expected, got table)");

  error = run("local r = describe('x') return r");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "bad argument #1 to 'describe' (number expected, got string)");
}

TEST_F(HostLuaTest, CoroutineYieldsAndResumes) {
  State thread = lua().coroutineNew();
  ASSERT_FALSE(lua().loadString("local x = coroutine.yield(7) return x + 1"));
  lua().coroutineExchange(thread, 1);

  EXPECT_EQ(thread.coroutineResume(0), GLUA_YIELD);
  EXPECT_EQ(thread.coroutineStatus(), GLUA_YIELD);
  EXPECT_EQ(thread.toNumber(-1), 7);
  thread.pop();

  thread.pushNumber(5);
  auto status = thread.coroutineResumeIgnore(1);
  ASSERT_TRUE(status);
  EXPECT_EQ(*status, GLUA_OK);
  EXPECT_EQ(thread.toNumber(-1), 6);
  EXPECT_TRUE(reported.empty());
  lua().pop();
}

TEST_F(HostLuaTest, CoroutineFailureRaisesInTheCaller) {
  lua().pushFunction(resumeFailing);
  auto error = lua().pcall(0, 0);
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "coroutine failed");
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(HostLuaTest, FinalizersRunWhenTheVmCloses) {
  lua().registerFinalizer<Tracked>("Tracked");
  lua().newUserdata<Tracked>("Tracked");
  lua().setGlobal("tracked");
  EXPECT_EQ(destroyed, 0);
  closeState();
  EXPECT_EQ(destroyed, 1);
}

TEST_F(HostLuaTest, TaskQueueDrainsFromTheThinkTimer) {
  TaskQueue queue;
  queue.open();
  queue.registerThink(lua());

  std::vector<int> ran;
  queue.schedule("ctx", [](State) { throw std::runtime_error("task failed"); });
  queue.schedule("", [&ran](State state) {
    state.pushNumber(2);
    ran.push_back(int(state.toNumber(-1)));
    state.pop();
  });

  tick();
  EXPECT_EQ(ran, std::vector<int> { 2 });
  ASSERT_EQ(reported.size(), 1u);
  EXPECT_EQ(reported[0], "[ERROR] task failed\nctx\n");
  EXPECT_TRUE(queue.empty());

  queue.unregisterThink(lua());
  queue.close();
  EXPECT_EQ(lua().getTop(), 0);
}
