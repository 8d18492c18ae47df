#include "SymbolTable.hh"

#include <mutex>

#include "SharedLibrary.hh"
#include "misc.hh"

using namespace GLua;

namespace {

std::mutex resolverMutex;
SymbolResolver customResolver;

} // namespace

SymbolTable SymbolTable::import(const SymbolResolver& resolve) {
  SymbolTable table;
  #define GLUA_IMPORT_SYMBOL(ret, name, params) \
    { \
      void* address = resolve(#name); \
      if (!address) { \
        GLUA_FATAL_ERROR(std::string("Failed to find symbol \"") + #name + "\""); \
      } \
      table.name = reinterpret_cast<ret (*) params>(address); \
    }
  GLUA_SYMBOL_LIST(GLUA_IMPORT_SYMBOL)
  #undef GLUA_IMPORT_SYMBOL
  return table;
}

SymbolTable SymbolTable::importLuaShared() {
  try {
    OpenedLibrary opened = openFirst(luaSharedCandidates());
    SymbolTable table = import([&](const char* name) { return opened.library.symbol(name); });
    // Functions and state of the runtime must outlive every module
    opened.library.leak();
    return table;
  }
  catch (LibraryOpenError& e) {
    GLUA_FATAL_ERROR(e.what());
  }
}

void GLua::setSymbolResolver(SymbolResolver resolver) {
  std::lock_guard<std::mutex> lock(resolverMutex);
  customResolver = std::move(resolver);
}

const SymbolTable& GLua::symbols() {
  static const SymbolTable table = [] {
    SymbolResolver resolver;
    {
      std::lock_guard<std::mutex> lock(resolverMutex);
      resolver = customResolver;
    }
    return resolver ? SymbolTable::import(resolver) : SymbolTable::importLuaShared();
  }();
  return table;
}
