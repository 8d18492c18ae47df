#pragma once

#include <string>
#include <string_view>

#include "glua.h"

namespace GLua {

/** Writes the message to stderr and aborts the process. */
[[noreturn]] void fatalError(const std::string& message);

/** Name of a raw VM status code, e.g. "GLUA_ERRRUN" */
std::string describeStatus(int status);

/**
 * Decodes `bytes` as UTF-8, replacing every maximal ill-formed subsequence
 * with U+FFFD.
 */
std::string toUtf8Lossy(std::string_view bytes);

} // namespace GLua
