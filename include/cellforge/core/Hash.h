#pragma once
#include "cellforge/core/Types.h"
#include <string_view>

namespace cellforge::core {

// 64-bit FNV-1a hash (stable, fast, good for turning text seeds into numbers).
u64 fnv1a64(std::string_view text);

// 32-bit integer avalanche mix.
//
// Only shifts, xors and wrapping multiplies: the result is identical on every
// platform and compiler, which keeps generated textures reproducible.
inline constexpr u32 hashU32(u32 x) {
  x ^= x >> 16;
  x *= 0x7FEB352Du;
  x ^= x >> 15;
  x *= 0x846CA68Bu;
  x ^= x >> 16;
  return x;
}

// Hash an integer lattice coordinate together with a seed.
inline constexpr u32 hash3(i32 x, i32 y, i32 w, u32 seed) {
  u32 h = seed ^ 0x9E3779B9u;
  h += static_cast<u32>(x) * 0x85EBCA6Bu;
  h += static_cast<u32>(y) * 0xC2B2AE35u;
  h += static_cast<u32>(w) * 0x27D4EB2Du;
  return hashU32(h);
}

// Map a hash to [0,1].
inline float rand01(u32 h) {
  return static_cast<float>(h) / static_cast<float>(0xFFFFFFFFu);
}

// Salts for deriving several independent values from one cell hash:
//   rand01(hashU32(cellHash ^ kSaltJitterX)) etc.
inline constexpr u32 kSaltJitterX = 0xA511E9B3u;
inline constexpr u32 kSaltJitterY = 0x63D83595u;
inline constexpr u32 kSaltJitterW = 0x1F1D8E33u;
inline constexpr u32 kSaltColorR  = 0xB5297A4Du;
inline constexpr u32 kSaltColorG  = 0x68E31DA4u;
inline constexpr u32 kSaltColorB  = 0x1B56C4E9u;

// rand01(hashU32(h ^ salt)) in one call.
inline float saltedUnit(u32 h, u32 salt) { return rand01(hashU32(h ^ salt)); }

} // namespace cellforge::core
