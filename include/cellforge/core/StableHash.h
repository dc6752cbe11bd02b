#pragma once

#include "cellforge/core/Types.h"

#include <cstddef>
#include <cstring>

namespace cellforge::core {

// Portable 64-bit FNV-1a hash builder for regression signatures.
//
// Integers are fed in explicit little-endian order and floats by their exact
// IEEE-754 bits, so a signature is stable across runs, platforms and thread counts.
// Not cryptographic.
class StableHash64 {
public:
  static constexpr u64 kOffsetBasis = 14695981039346656037ull;
  static constexpr u64 kPrime       = 1099511628211ull;

  explicit StableHash64(u64 seed = kOffsetBasis) : h_(seed) {}

  u64 value() const { return h_; }

  void addByte(u8 b) {
    h_ ^= static_cast<u64>(b);
    h_ *= kPrime;
  }

  void addU32(u32 v) {
    addByte(static_cast<u8>((v >> 0) & 0xFFu));
    addByte(static_cast<u8>((v >> 8) & 0xFFu));
    addByte(static_cast<u8>((v >> 16) & 0xFFu));
    addByte(static_cast<u8>((v >> 24) & 0xFFu));
  }

  void addFloatBits(float v) {
    static_assert(sizeof(float) == sizeof(u32), "float must be 32-bit");
    u32 bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    addU32(bits);
  }

private:
  u64 h_{kOffsetBasis};
};

} // namespace cellforge::core
