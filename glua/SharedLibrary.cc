#include "SharedLibrary.hh"

#include <filesystem>
#include <sstream>
#include <utility>

#ifdef _WIN32
#include <Windows.h>
#else
#include <dlfcn.h>
#endif

using namespace GLua;

namespace {

std::string lastLoaderError() {
#ifdef _WIN32
  DWORD code = GetLastError();
  char* buffer = nullptr;
  DWORD size = FormatMessageA(
    FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
    nullptr, code, 0, (LPSTR)&buffer, 0, nullptr);
  std::string message = size ? std::string(buffer, size) : "error code " + std::to_string(code);
  if (buffer) LocalFree(buffer);
  return message;
#else
  const char* message = dlerror();
  return message ? message : "unknown loader error";
#endif
}

void appendVariants(std::vector<std::string>& out, const std::vector<std::string>& dirs, const std::string& name, const std::string& suffix) {
  for (auto& dir : dirs) {
    out.push_back(dir + name + suffix);
    out.push_back(dir + "lib" + name + suffix);
  }
}

} // namespace

LibraryOpenError::LibraryOpenError(std::vector<Attempt> attempts)
  : std::runtime_error(format(attempts)), _attempts(std::move(attempts))
{
}

std::string LibraryOpenError::format(const std::vector<Attempt>& attempts) {
  std::ostringstream out;
  out << "Failed to open library\n";
  for (auto& attempt : attempts) {
    out << attempt.first << " = " << attempt.second << "\n";
  }
  return out.str();
}

SharedLibrary SharedLibrary::open(const std::string& path) {
#ifdef _WIN32
  HMODULE handle = LoadLibraryA(path.c_str());
#else
  void* handle = dlopen(path.c_str(), RTLD_LAZY | RTLD_LOCAL);
#endif
  if (!handle) {
    throw LibraryOpenError({ { path, lastLoaderError() } });
  }
  return SharedLibrary((void*)handle);
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept : _handle(other._handle) {
  other._handle = nullptr;
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
  // `other` closes the previous handle
  std::swap(_handle, other._handle);
  return *this;
}

SharedLibrary::~SharedLibrary() {
  if (!_handle) return;
#ifdef _WIN32
  FreeLibrary((HMODULE)_handle);
#else
  dlclose(_handle);
#endif
  _handle = nullptr;
}

void* SharedLibrary::symbol(const char* name) const {
  if (!_handle) return nullptr;
#ifdef _WIN32
  return (void*)GetProcAddress((HMODULE)_handle, name);
#else
  return dlsym(_handle, name);
#endif
}

void* SharedLibrary::leak() {
  void* handle = _handle;
  _handle = nullptr;
  return handle;
}

OpenedLibrary GLua::openFirst(const std::vector<std::string>& candidates) {
  std::vector<LibraryOpenError::Attempt> attempts;
  for (auto& path : candidates) {
    try {
      return OpenedLibrary { SharedLibrary::open(path), path };
    }
    catch (LibraryOpenError& e) {
      attempts.insert(attempts.end(), e.attempts().begin(), e.attempts().end());
    }
  }
  throw LibraryOpenError(std::move(attempts));
}

std::vector<std::string> GLua::luaSharedCandidates() {
#if defined(_WIN32) && defined(_WIN64)
  return { "bin/win64/lua_shared.dll" };
#elif defined(_WIN32)
  return { "garrysmod/bin/lua_shared.dll", "bin/lua_shared.dll" };
#elif defined(__APPLE__)
  return { "garrysmod/bin/lua_shared.dylib", "GarrysMod_Signed.app/Contents/MacOS/lua_shared.dylib" };
#elif defined(__LP64__)
  return { "bin/linux64/lua_shared.so" };
#else
  return { "garrysmod/bin/lua_shared_srv.so", "bin/linux32/lua_shared.so" };
#endif
}

std::vector<std::string> GLua::libraryCandidates(const std::string& name, LibraryPriority priority) {
  std::vector<std::string> result;
#if defined(_WIN32) && defined(_WIN64)
  (void)priority;
  result.push_back("bin/win64/" + name + ".dll");
#elif defined(_WIN32)
  (void)priority;
  result.push_back("bin/" + name + ".dll");
  result.push_back("garrysmod/bin/" + name + ".dll");
#elif defined(__APPLE__)
  appendVariants(result, { "GarrysMod_Signed.app/Contents/MacOS/" }, name, ".dylib");
  std::vector<std::string> serverFirst;
  std::vector<std::string> plain;
  appendVariants(serverFirst, { "bin/", "garrysmod/bin/" }, name, "_srv.dylib");
  appendVariants(plain, { "bin/", "garrysmod/bin/" }, name, ".dylib");
  if (priority == LibraryPriority::Client) std::swap(serverFirst, plain);
  result.insert(result.end(), serverFirst.begin(), serverFirst.end());
  result.insert(result.end(), plain.begin(), plain.end());
#elif defined(__LP64__)
  (void)priority;
  appendVariants(result, { "bin/linux64/" }, name, ".so");
#else
  appendVariants(result, { "bin/linux32/" }, name, ".so");
  std::vector<std::string> serverFirst;
  std::vector<std::string> plain;
  appendVariants(serverFirst, { "bin/", "garrysmod/bin/" }, name, "_srv.so");
  appendVariants(plain, { "bin/", "garrysmod/bin/" }, name, ".so");
  if (priority == LibraryPriority::Client) std::swap(serverFirst, plain);
  result.insert(result.end(), serverFirst.begin(), serverFirst.end());
  result.insert(result.end(), plain.begin(), plain.end());
#endif
  result.push_back(name);
  return result;
}

bool GLua::isX86_64() {
#if defined(_WIN64) || defined(__LP64__)
  // 64-bit builds only exist on the x86-64 branch
  return true;
#else
  namespace fs = std::filesystem;
  static const bool x86_64 = [] {
    std::error_code ec;
  #if defined(__APPLE__)
    return fs::is_regular_file("garrysmod/bin/lua_shared.dylib", ec);
  #elif defined(_WIN32)
    return fs::is_regular_file("srcds_win64.exe", ec) || fs::is_directory("bin/win64", ec);
  #else
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
      auto exeName = exe.filename().string();
      if (exeName == "srcds_linux") return false;
      if (exeName == "srcds") return true;
    }
    return fs::is_directory("bin/linux64", ec);
  #endif
  }();
  return x86_64;
#endif
}
