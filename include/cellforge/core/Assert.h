#pragma once

#include <string_view>

namespace cellforge::core {

// Fatal stop for a broken internal invariant: a kernel handed a buffer or cell
// size that validation should already have rejected. Logs at Error, then aborts.
// Configuration mistakes never end up here; they return false with outError set.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace cellforge::core

#define CELLFORGE_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::cellforge::core::panic("invariant violated: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define CELLFORGE_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::cellforge::core::panic((msg), __FILE__, __LINE__); \
    } \
  } while (0)
