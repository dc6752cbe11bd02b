#pragma once
#include <cmath>

namespace cellforge::math {

// Lattice-space vector. The third component is the "w" noise axis.
struct Vec3f {
  float x{0}, y{0}, w{0};

  constexpr Vec3f() = default;
  constexpr Vec3f(float x_, float y_, float w_) : x(x_), y(y_), w(w_) {}

  Vec3f operator+(const Vec3f& o) const { return {x + o.x, y + o.y, w + o.w}; }
  Vec3f operator-(const Vec3f& o) const { return {x - o.x, y - o.y, w - o.w}; }
  Vec3f operator*(float s) const { return {x * s, y * s, w * s}; }

  bool allFinite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(w); }
};

} // namespace cellforge::math
