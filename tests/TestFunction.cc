#include "LuaTest.hh"

#include "glua/Module.hh"

using namespace GLua;

namespace {

int destroyed = 0;

struct Tracked {
  ~Tracked() { destroyed++; }
};

int concat(State state) {
  state.pushString(state.checkString(1) + state.checkString(2));
  state.pushNumber(state.getTop());
  return 2;
}

void nothing(State state) {
  state.pushString("ignored");
}

int throws(State state) {
  Tracked tracked;
  throw std::runtime_error("native failure");
}

int raisesDirectly(State state) {
  state.error("raised by the VM");
}

int checksArguments(State state) {
  Tracked tracked;
  state.checkTable(1);
  return 0;
}

} // namespace

GLUA_FUNCTION(glua_test_double) {
  LUA.pushNumber(LUA.checkNumber(1) * 2);
  return 1;
}

class FunctionTest: public LuaTest {};

TEST_F(FunctionTest, ResultsReplaceArguments) {
  lua().pushNumber(100);
  lua().pushFunction(function<concat>);
  lua().pushString("ab");
  lua().pushString("cd");
  ASSERT_FALSE(lua().pcall(2, 2));
  EXPECT_EQ(lua().getTop(), 3);
  EXPECT_EQ(lua().getString(2), "abcd");
  // Two arguments plus the pushed string
  EXPECT_EQ(lua().toNumber(3), 3);
}

TEST_F(FunctionTest, VoidFunctionsReturnNothing) {
  lua().pushFunction(function<nothing>);
  ASSERT_FALSE(lua().pcall(0, GLUA_MULTRET));
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(FunctionTest, ExceptionsBecomeVmErrors) {
  destroyed = 0;
  lua().pushFunction(function<throws>);
  auto error = lua().pcall(0, 0);
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind(), LuaError::Kind::RuntimeError);
  EXPECT_EQ(error->toString(), "native failure");
  EXPECT_EQ(destroyed, 1);
  EXPECT_EQ(lua().getTop(), 0);
}

TEST_F(FunctionTest, ArgumentErrorsCarryTheFunctionName) {
  destroyed = 0;
  lua().pushFunction(function<checksArguments>);
  lua().pushNumber(1);
  ASSERT_EQ(MockLua::pcallNamed(L, 1, 0, "checks", "global"), GLUA_ERRRUN);
  EXPECT_EQ(lua().getString(-1), "bad argument #1 to 'checks' (table expected, got number)");
  EXPECT_EQ(destroyed, 1);
}

TEST_F(FunctionTest, VmErrorsPassThrough) {
  lua().pushFunction(function<raisesDirectly>);
  auto error = lua().pcall(0, 0);
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "raised by the VM");
}

TEST_F(FunctionTest, DefinedWithMacro) {
  lua().pushFunction(glua_test_double);
  lua().pushNumber(21);
  ASSERT_FALSE(lua().pcall(1, 1));
  EXPECT_EQ(lua().toNumber(-1), 42);

  lua().pushFunction(glua_test_double);
  lua().pushString("x");
  auto error = lua().pcall(1, 1);
  ASSERT_TRUE(error);
  EXPECT_EQ(error->toString(), "bad argument #1 to '?' (number expected, got string)");
}
