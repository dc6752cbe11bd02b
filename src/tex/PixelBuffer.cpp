#include "cellforge/tex/PixelBuffer.h"

#include "cellforge/core/Clamp.h"
#include "cellforge/core/StableHash.h"

#include <algorithm>

namespace cellforge::tex {

namespace {

template <class Out>
Out quantize(float v, float maxValue) {
  const float c = core::clamp01(core::finiteOr(v, 0.0f));
  return static_cast<Out>(c * maxValue);
}

template <class Out>
std::vector<Out> quantizeAll(const PixelBuffer& img, float maxValue) {
  std::vector<Out> out;
  out.reserve(img.pixels.size() * 4);
  for (const PixelF32& p : img.pixels) {
    out.push_back(quantize<Out>(p.r, maxValue));
    out.push_back(quantize<Out>(p.g, maxValue));
    out.push_back(quantize<Out>(p.b, maxValue));
    out.push_back(quantize<Out>(p.a, maxValue));
  }
  return out;
}

} // namespace

std::vector<core::u8> toRGBA8(const PixelBuffer& img) {
  return quantizeAll<core::u8>(img, 255.0f);
}

std::vector<core::u16> toRGBA16(const PixelBuffer& img) {
  return quantizeAll<core::u16>(img, 65535.0f);
}

std::vector<float> toRGBF32NonNegative(const PixelBuffer& img) {
  std::vector<float> out;
  out.reserve(img.pixels.size() * 3);
  for (const PixelF32& p : img.pixels) {
    out.push_back(std::max(core::finiteOr(p.r, 0.0f), 0.0f));
    out.push_back(std::max(core::finiteOr(p.g, 0.0f), 0.0f));
    out.push_back(std::max(core::finiteOr(p.b, 0.0f), 0.0f));
  }
  return out;
}

PixelBuffer fromRGBA8(const core::u8* rgba, core::u32 w, core::u32 h) {
  PixelBuffer img(w, h);
  if (!rgba) return img;

  constexpr float inv = 1.0f / 255.0f;
  for (std::size_t i = 0; i < img.pixels.size(); ++i) {
    const core::u8* p = rgba + i * 4;
    img.pixels[i] = PixelF32{p[0] * inv, p[1] * inv, p[2] * inv, p[3] * inv};
  }
  return img;
}

core::u64 signature(const PixelBuffer& img) {
  core::StableHash64 h;
  h.addU32(img.width);
  h.addU32(img.height);
  for (const PixelF32& p : img.pixels) {
    h.addFloatBits(p.r);
    h.addFloatBits(p.g);
    h.addFloatBits(p.b);
    h.addFloatBits(p.a);
  }
  return h.value();
}

} // namespace cellforge::tex
