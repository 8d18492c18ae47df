#include "misc.hh"

#include <cstdio>
#include <cstdlib>
#include <map>

namespace {

std::map<int, std::string> statusDescriptions = {
  { GLUA_OK, "GLUA_OK" },
  { GLUA_YIELD, "GLUA_YIELD" },
  { GLUA_ERRRUN, "GLUA_ERRRUN" },
  { GLUA_ERRSYNTAX, "GLUA_ERRSYNTAX" },
  { GLUA_ERRMEM, "GLUA_ERRMEM" },
  { GLUA_ERRERR, "GLUA_ERRERR" },
  { GLUA_ERRFILE, "GLUA_ERRFILE" },
};

const char replacementCharacter[] = "\xEF\xBF\xBD";

// Number of bytes of a well-formed sequence starting at `bytes[i]`, or the
// length of the ill-formed prefix (at least 1) negated.
int sequenceLength(std::string_view bytes, size_t i) {
  auto at = [&](size_t k) -> unsigned { return (unsigned char)bytes[k]; };
  unsigned lead = at(i);
  if (lead < 0x80) return 1;

  int length;
  unsigned lower = 0x80;
  unsigned upper = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) lower = 0xA0;
    if (lead == 0xED) upper = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) lower = 0x90;
    if (lead == 0xF4) upper = 0x8F;
  } else {
    return -1;
  }

  for (int k = 1; k < length; k++) {
    if (i + k >= bytes.size()) return -k;
    unsigned b = at(i + k);
    unsigned lo = (k == 1) ? lower : 0x80;
    unsigned hi = (k == 1) ? upper : 0xBF;
    if (b < lo || b > hi) return -k;
  }
  return length;
}

} // namespace

void GLua::fatalError(const std::string& message) {
  fprintf(stderr, "glua-bridge fatal error: %s\n", message.c_str());
  fflush(stderr);
  std::abort();
}

std::string GLua::describeStatus(int status) {
  auto description = statusDescriptions.find(status);
  if (description != statusDescriptions.end()) {
    return description->second;
  }
  return std::string("VM status code: ") + std::to_string(status);
}

std::string GLua::toUtf8Lossy(std::string_view bytes) {
  std::string result;
  result.reserve(bytes.size());
  size_t i = 0;
  while (i < bytes.size()) {
    int length = sequenceLength(bytes, i);
    if (length > 0) {
      result.append(bytes.data() + i, length);
      i += length;
    } else {
      result.append(replacementCharacter);
      i += -length;
    }
  }
  return result;
}
