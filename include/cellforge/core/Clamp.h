#pragma once

#include <cmath>

namespace cellforge::core {

// Branchy clamp that keeps the argument type (no std::common_type games).
template <class T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

inline float clamp01(float v) { return clamp(v, 0.0f, 1.0f); }

// Replace NaN/Inf with a fallback value.
inline float finiteOr(float v, float fallback) { return std::isfinite(v) ? v : fallback; }

} // namespace cellforge::core
