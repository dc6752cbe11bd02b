#pragma once

#include "cellforge/core/Types.h"

#include <cmath>
#include <string_view>

namespace cellforge::tex {

enum class DistanceMetricKind : core::u8 {
  Euclidean = 0,
  Manhattan,
  Chebyshev,
  Minkowski
};

struct DistanceMetric {
  // Exponents below this are floored to it (smaller values blow up to Inf/NaN).
  static constexpr float kMinExponent = 0.1f;

  DistanceMetricKind kind{DistanceMetricKind::Euclidean};
  float exponent{2.0f}; // Minkowski only

  static DistanceMetric euclidean() { return {DistanceMetricKind::Euclidean, 2.0f}; }
  static DistanceMetric manhattan() { return {DistanceMetricKind::Manhattan, 1.0f}; }
  static DistanceMetric chebyshev() { return {DistanceMetricKind::Chebyshev, 2.0f}; }
  static DistanceMetric minkowski(float p) { return {DistanceMetricKind::Minkowski, p}; }
};

// Minkowski exponent actually used: NaN and anything below kMinExponent map to kMinExponent.
inline float effectiveExponent(float p) {
  return (p >= DistanceMetric::kMinExponent) ? p : DistanceMetric::kMinExponent;
}

// Per-metric functors. The field generator picks one per frame and is
// instantiated for it, so the metric is not re-decoded for every candidate site.
struct EuclideanDistance {
  float operator()(float dx, float dy, float dw) const { return std::sqrt(dx * dx + dy * dy + dw * dw); }
};

struct ManhattanDistance {
  float operator()(float dx, float dy, float dw) const { return std::abs(dx) + std::abs(dy) + std::abs(dw); }
};

struct ChebyshevDistance {
  float operator()(float dx, float dy, float dw) const {
    const float ax = std::abs(dx);
    const float ay = std::abs(dy);
    const float aw = std::abs(dw);
    const float m = ax > ay ? ax : ay;
    return m > aw ? m : aw;
  }
};

struct MinkowskiDistance {
  float p{2.0f}; // already floored

  float operator()(float dx, float dy, float dw) const {
    const float s = std::pow(std::abs(dx), p) + std::pow(std::abs(dy), p) + std::pow(std::abs(dw), p);
    return std::pow(s, 1.0f / p);
  }
};

// Distance of the offset (dx,dy,dw) under `metric`. Never negative for finite input.
float metricDistance(float dx, float dy, float dw, const DistanceMetric& metric);

const char* distanceMetricName(DistanceMetricKind kind);

// Accepts "euclidean", "manhattan", "chebyshev", "minkowski" (alias "lp").
bool parseDistanceMetric(std::string_view text, DistanceMetricKind& out);

} // namespace cellforge::tex
