#include <gtest/gtest.h>

#include "glua/Runtime.hh"
#include "MockLua.hh"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  GLua::Runtime::setSymbolResolver(&MockLua::resolve);
  return RUN_ALL_TESTS();
}
