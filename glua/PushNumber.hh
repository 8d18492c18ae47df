#pragma once

#include <algorithm>
#include <string>
#include <type_traits>

#include "glua.h"

namespace GLua {

/**
 * Integral types accepted by `State::pushNumber`. `bool` is excluded; push it
 * with `pushBoolean`.
 */
template <typename T>
struct IsPushableInteger: std::integral_constant<bool,
  std::is_integral<T>::value && !std::is_same<T, bool>::value> {};

#ifdef __SIZEOF_INT128__
template <> struct IsPushableInteger<__int128>: std::true_type {};
template <> struct IsPushableInteger<unsigned __int128>: std::true_type {};
#endif

/**
 * Whether the VM's double-precision number represents `value` exactly, i.e.
 * `|value| <= GLUA_MAX_SAFE_INTEGER`.
 */
template <typename T>
constexpr bool isSafeInteger(T value) {
  // Types narrower than 64 bits always fit, and the bound would not fit them
  if constexpr (sizeof(T) < 8) {
    return true;
  } else {
    constexpr bool isSigned = T(-1) < T(0);
    if (isSigned && value < T(0)) {
      return value >= T(-GLUA_MAX_SAFE_INTEGER);
    }
    return value <= T(GLUA_MAX_SAFE_INTEGER);
  }
}

/** Base-10 rendering that also covers 128-bit types */
template <typename T>
std::string integerToString(T value) {
  constexpr bool isSigned = T(-1) < T(0);
  bool negative = isSigned && value < T(0);
  std::string digits;
  do {
    int digit = int(value % T(10));
    digits.push_back(char('0' + (negative ? -digit : digit)));
    value /= T(10);
  } while (value != T(0));
  if (negative) digits.push_back('-');
  std::reverse(digits.begin(), digits.end());
  return digits;
}

} // namespace GLua
