#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace GLua {

/**
 * Failure to open one or more shared libraries. `attempts()` lists every path
 * that was tried with the loader's message for it.
 */
class LibraryOpenError: public std::runtime_error {
public:
  using Attempt = std::pair<std::string, std::string>;

  explicit LibraryOpenError(std::vector<Attempt> attempts);

  const std::vector<Attempt>& attempts() const { return _attempts; }

private:
  static std::string format(const std::vector<Attempt>& attempts);

  std::vector<Attempt> _attempts;
};

/**
 * An opened shared library. Closed on destruction unless `leak()` was called.
 */
class SharedLibrary {
public:
  static SharedLibrary open(const std::string& path);

  SharedLibrary(SharedLibrary&& other) noexcept;
  SharedLibrary& operator=(SharedLibrary&& other) noexcept;
  SharedLibrary(const SharedLibrary&) = delete;
  SharedLibrary& operator=(const SharedLibrary&) = delete;
  ~SharedLibrary();

  /** Address of the exported symbol, or nullptr if it is not exported */
  void* symbol(const char* name) const;

  /** Gives up ownership; the library stays loaded until the process exits. */
  void* leak();

  bool isOpen() const { return _handle != nullptr; }

private:
  explicit SharedLibrary(void* handle) : _handle(handle) {}

  void* _handle;
};

struct OpenedLibrary {
  SharedLibrary library;
  std::string path;
};

/**
 * Opens the first candidate that loads. Throws `LibraryOpenError` carrying
 * every attempt when none does.
 */
OpenedLibrary openFirst(const std::vector<std::string>& candidates);

enum class LibraryPriority {
  Server, // prefer `_srv` builds of a library
  Client,
};

/** Candidate locations of the host's Lua runtime for this platform */
std::vector<std::string> luaSharedCandidates();

/**
 * Candidate locations of a game library (e.g. "engine") for this platform and
 * bitness, in the order they are tried. The bare name is always tried last so
 * that the system loader's own search path applies.
 */
std::vector<std::string> libraryCandidates(const std::string& name, LibraryPriority priority);

/** Whether the host process is running the x86-64 branch of the game */
bool isX86_64();

} // namespace GLua
