#pragma once

#include "cellforge/core/Types.h"

#include <cstddef>
#include <vector>

namespace cellforge::tex {

// One RGBA pixel in linear float. Channels are nominally [0,1] but kernels
// running with an Identity response may produce anything finite.
struct PixelF32 {
  float r{0.0f};
  float g{0.0f};
  float b{0.0f};
  float a{0.0f};

  bool operator==(const PixelF32& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
  bool operator!=(const PixelF32& o) const { return !(*this == o); }
};

// Dense row-major RGBA float raster. Row 0 is the top of the image.
//
// Owned by the caller; kernels fill it and keep no reference afterwards.
struct PixelBuffer {
  core::u32 width{0};
  core::u32 height{0};
  std::vector<PixelF32> pixels; // size = width*height

  PixelBuffer() = default;
  PixelBuffer(core::u32 w, core::u32 h, PixelF32 fill = PixelF32{})
    : width(w), height(h), pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), fill) {}

  bool empty() const { return width == 0 || height == 0; }

  // True when the pixel vector matches the declared dimensions.
  bool consistent() const { return pixels.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height); }

  std::size_t index(core::u32 x, core::u32 y) const {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  }

  PixelF32& at(core::u32 x, core::u32 y) { return pixels[index(x, y)]; }
  const PixelF32& at(core::u32 x, core::u32 y) const { return pixels[index(x, y)]; }
};

// Quantize to interleaved RGBA8 / RGBA16: clamp to [0,1], scale, truncate.
// Non-finite channels become 0.
std::vector<core::u8> toRGBA8(const PixelBuffer& img);
std::vector<core::u16> toRGBA16(const PixelBuffer& img);

// Interleaved float RGB for Radiance HDR export. RGBE has no sign, so channels
// are clamped to [0, inf) and non-finite values become 0. Alpha is dropped.
std::vector<float> toRGBF32NonNegative(const PixelBuffer& img);

// Expand interleaved RGBA8 (size = w*h*4) into a float buffer.
PixelBuffer fromRGBA8(const core::u8* rgba, core::u32 w, core::u32 h);

// Stable 64-bit signature over dimensions and exact channel bits.
// Two buffers with equal signatures are (with overwhelming probability) bit-identical.
core::u64 signature(const PixelBuffer& img);

} // namespace cellforge::tex
