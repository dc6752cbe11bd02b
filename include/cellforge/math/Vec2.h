#pragma once

namespace cellforge::math {

struct Vec2f {
  float x{0}, y{0};

  constexpr Vec2f() = default;
  constexpr Vec2f(float x_, float y_) : x(x_), y(y_) {}

  Vec2f operator+(const Vec2f& o) const { return {x + o.x, y + o.y}; }
  Vec2f operator-(const Vec2f& o) const { return {x - o.x, y - o.y}; }
  Vec2f operator*(float s) const { return {x * s, y * s}; }
};

} // namespace cellforge::math
