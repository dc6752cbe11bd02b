#include "cellforge/tex/FieldGenerator.h"

#include "cellforge/core/Assert.h"
#include "cellforge/core/Clamp.h"
#include "cellforge/core/Hash.h"
#include "cellforge/core/Log.h"
#include "cellforge/tex/RasterExecutor.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace cellforge::tex {

namespace {

constexpr float kMinScale = 1.0e-3f;
constexpr float kMinGridExtent = 1.0e-6f;

// Keeps floor() results inside i32 with room for the +-1 neighbourhood.
constexpr float kCellIndexLimit = 1.0e9f;

core::i32 cellIndex(float v) {
  const float f = std::floor(v);
  if (!(f > -kCellIndexLimit)) return static_cast<core::i32>(-kCellIndexLimit);
  if (!(f < kCellIndexLimit)) return static_cast<core::i32>(kCellIndexLimit);
  return static_cast<core::i32>(f);
}

float smoothstep01(float x) {
  x = core::clamp01(x);
  return x * x * (3.0f - 2.0f * x);
}

float lerp(float a, float b, float t) { return a + (b - a) * t; }

float jitter(core::u32 h, core::u32 salt, float randomness) {
  return 0.5f + (core::saltedUnit(h, salt) - 0.5f) * randomness;
}

bool fail(std::string* outError, const std::string& msg) {
  if (outError) *outError = msg;
  return false;
}

} // namespace

math::Vec3f cellSizeFromScale(float cellPx, float scaleX, float scaleY, float scaleW) {
  const float cell = std::max(cellPx, kMinScale);
  return {cell / std::max(scaleX, kMinScale),
          cell / std::max(scaleY, kMinScale),
          cell / std::max(scaleW, kMinScale)};
}

LatticeSite latticeSite(core::i32 cx, core::i32 cy, core::i32 cw, float randomness, core::u32 seed) {
  const core::u32 h = core::hash3(cx, cy, cw, seed);

  LatticeSite site;
  site.position = {static_cast<float>(cx) + jitter(h, core::kSaltJitterX, randomness),
                   static_cast<float>(cy) + jitter(h, core::kSaltJitterY, randomness),
                   static_cast<float>(cw) + jitter(h, core::kSaltJitterW, randomness)};
  site.hash = h;
  return site;
}

PixelF32 siteColor(core::u32 siteHash) {
  return PixelF32{core::saltedUnit(siteHash, core::kSaltColorR),
                  core::saltedUnit(siteHash, core::kSaltColorG),
                  core::saltedUnit(siteHash, core::kSaltColorB),
                  1.0f};
}

float smoothBlend(float d1, float d2, float smoothness) {
  if (!(smoothness > 0.0f) || !std::isfinite(d1) || !std::isfinite(d2)) return 0.0f;
  const float t = core::clamp01((d2 - d1) / smoothness);
  return 0.5f * (1.0f - smoothstep01(t));
}

bool validateFieldParams(const FieldParams& params, std::string* outError) {
  if (params.width == 0 || params.height == 0) {
    std::ostringstream oss;
    oss << "configuration error: output size " << params.width << "x" << params.height << " has a zero-length axis";
    return fail(outError, oss.str());
  }

  const math::Vec3f& c = params.cellSize;
  if (!c.allFinite() || !(c.x > 0.0f) || !(c.y > 0.0f) || !(c.w > 0.0f)) {
    std::ostringstream oss;
    oss << "configuration error: cell size (" << c.x << ", " << c.y << ", " << c.w << ") must be positive and finite";
    return fail(outError, oss.str());
  }

  if (!std::isfinite(params.randomness)) return fail(outError, "configuration error: randomness is not finite");
  if (!std::isfinite(params.smoothness)) return fail(outError, "configuration error: smoothness is not finite");
  if (!std::isfinite(params.wValue)) return fail(outError, "configuration error: w is not finite");
  if (!std::isfinite(params.offset.x) || !std::isfinite(params.offset.y)) {
    return fail(outError, "configuration error: offset is not finite");
  }
  return true;
}

FieldKernel::FieldKernel(const FieldParams& params)
  : params_(params) {
  CELLFORGE_ASSERT(params.cellSize.x > 0.0f && params.cellSize.y > 0.0f && params.cellSize.w > 0.0f);
  invCell_ = {1.0f / params.cellSize.x, 1.0f / params.cellSize.y, 1.0f / params.cellSize.w};
  randomness_ = core::clamp01(params.randomness);
  smoothness_ = params.smoothness > 0.0f ? params.smoothness : 0.0f;
  gridW_ = std::max(static_cast<float>(params.width) * invCell_.x, kMinGridExtent);
  gridH_ = std::max(static_cast<float>(params.height) * invCell_.y, kMinGridExtent);
}

math::Vec3f FieldKernel::latticePoint(core::u32 x, core::u32 y) const {
  return {(static_cast<float>(x) + 0.5f - params_.offset.x) * invCell_.x,
          (static_cast<float>(y) + 0.5f - params_.offset.y) * invCell_.y,
          params_.wValue * invCell_.w};
}

template <class Metric>
FieldSample FieldKernel::sampleWith(const Metric& metric, const math::Vec3f& p) const {
  const core::i32 cx = cellIndex(p.x);
  const core::i32 cy = cellIndex(p.y);
  const core::i32 cw = cellIndex(p.w);

  FieldSample s;
  s.d1 = std::numeric_limits<float>::infinity();
  s.d2 = std::numeric_limits<float>::infinity();

  // A site never leaves its own cell, so the 27 cells around p always hold
  // both the nearest and the second-nearest site.
  for (core::i32 nw = cw - 1; nw <= cw + 1; ++nw) {
    for (core::i32 ny = cy - 1; ny <= cy + 1; ++ny) {
      for (core::i32 nx = cx - 1; nx <= cx + 1; ++nx) {
        const LatticeSite site = latticeSite(nx, ny, nw, randomness_, params_.seed);
        const float d = metric(p.x - site.position.x, p.y - site.position.y, p.w - site.position.w);

        if (d < s.d1) {
          s.d2 = s.d1;
          s.second = s.nearest;
          s.d1 = d;
          s.nearest = site;
        } else if (d < s.d2) {
          s.d2 = d;
          s.second = site;
        }
      }
    }
  }

  if (!std::isfinite(s.d1)) s.d1 = 0.0f;
  if (!std::isfinite(s.d2)) {
    s.d2 = s.d1;
    s.second = s.nearest;
  }
  if (s.d2 < s.d1) {
    std::swap(s.d1, s.d2);
    std::swap(s.nearest, s.second);
  }

  s.blend = smoothBlend(s.d1, s.d2, smoothness_);
  return s;
}

FieldSample FieldKernel::sample(const math::Vec3f& p) const {
  const DistanceMetric& m = params_.metric;
  switch (m.kind) {
    case DistanceMetricKind::Euclidean: return sampleWith(EuclideanDistance{}, p);
    case DistanceMetricKind::Manhattan: return sampleWith(ManhattanDistance{}, p);
    case DistanceMetricKind::Chebyshev: return sampleWith(ChebyshevDistance{}, p);
    case DistanceMetricKind::Minkowski: return sampleWith(MinkowskiDistance{effectiveExponent(m.exponent)}, p);
  }
  return sampleWith(EuclideanDistance{}, p);
}

float FieldKernel::sanitize(float v) const {
  v = core::finiteOr(v, 0.0f);
  return params_.clampOutput ? core::clamp01(v) : v;
}

PixelF32 FieldKernel::shade(const FieldSample& s) const {
  switch (params_.renderMode) {
    case RenderMode::Color: {
      const PixelF32 c1 = siteColor(s.nearest.hash);
      const PixelF32 c2 = siteColor(s.second.hash);
      return PixelF32{lerp(c1.r, c2.r, s.blend), lerp(c1.g, c2.g, s.blend), lerp(c1.b, c2.b, s.blend), 1.0f};
    }
    case RenderMode::Position:
      return PixelF32{sanitize(s.nearest.position.x / gridW_), sanitize(s.nearest.position.y / gridH_), 0.0f, 1.0f};
    case RenderMode::SmoothDistance: {
      const float v = sanitize(lerp(s.d1, s.d2, s.blend));
      return PixelF32{v, v, v, 1.0f};
    }
    case RenderMode::NearestDistance: {
      const float v = sanitize(s.d1);
      return PixelF32{v, v, v, 1.0f};
    }
    case RenderMode::DistanceGap: {
      const float v = sanitize(std::max(s.d2 - s.d1, 0.0f));
      return PixelF32{v, v, v, 1.0f};
    }
  }
  return PixelF32{0.0f, 0.0f, 0.0f, 1.0f};
}

PixelF32 FieldKernel::evaluate(core::u32 x, core::u32 y) const {
  return shade(sample(latticePoint(x, y)));
}

template <class Metric>
void FieldKernel::renderWith(const Metric& metric, PixelBuffer& out, RasterExecutor& exec) const {
  mapPixels(exec, out, [&](core::u32 x, core::u32 y) {
    return shade(sampleWith(metric, latticePoint(x, y)));
  });
}

void FieldKernel::render(PixelBuffer& out, RasterExecutor& exec) const {
  const DistanceMetric& m = params_.metric;
  switch (m.kind) {
    case DistanceMetricKind::Euclidean: renderWith(EuclideanDistance{}, out, exec); return;
    case DistanceMetricKind::Manhattan: renderWith(ManhattanDistance{}, out, exec); return;
    case DistanceMetricKind::Chebyshev: renderWith(ChebyshevDistance{}, out, exec); return;
    case DistanceMetricKind::Minkowski: renderWith(MinkowskiDistance{effectiveExponent(m.exponent)}, out, exec); return;
  }
  renderWith(EuclideanDistance{}, out, exec);
}

FieldSample sampleField(const FieldParams& params, const math::Vec3f& p) {
  return FieldKernel(params).sample(p);
}

bool generateField(const FieldParams& params, PixelBuffer& out, std::string* outError,
                   RasterExecutor* executor, const PixelBuffer* alphaSource) {
  std::string err;
  if (!validateFieldParams(params, &err)) {
    CELLFORGE_LOG_WARN("field: " + err);
    if (outError) *outError = err;
    return false;
  }
  if (alphaSource &&
      (!alphaSource->consistent() || alphaSource->width != params.width || alphaSource->height != params.height)) {
    std::ostringstream oss;
    oss << "configuration error: alpha source is " << alphaSource->width << "x" << alphaSource->height
        << ", frame is " << params.width << "x" << params.height;
    CELLFORGE_LOG_WARN("field: " + oss.str());
    if (outError) *outError = oss.str();
    return false;
  }

  RasterExecutor& exec = executor ? *executor : serialExecutor();

  {
    std::ostringstream oss;
    oss << "field: " << params.width << "x" << params.height
        << " metric=" << distanceMetricName(params.metric.kind)
        << " mode=" << renderModeName(params.renderMode)
        << " seed=" << params.seed << " exec=" << exec.name();
    CELLFORGE_LOG_DEBUG(oss.str());
  }

  const FieldKernel kernel(params);
  out = PixelBuffer(params.width, params.height);
  kernel.render(out, exec);

  if (alphaSource) {
    mapPixels(exec, out, [&](core::u32 x, core::u32 y) {
      PixelF32 p = out.at(x, y);
      const float a = core::clamp01(core::finiteOr(alphaSource->at(x, y).a, 0.0f));
      p.r *= a;
      p.g *= a;
      p.b *= a;
      p.a = a;
      return p;
    });
  }
  return true;
}

const char* renderModeName(RenderMode mode) {
  switch (mode) {
    case RenderMode::Color: return "color";
    case RenderMode::Position: return "position";
    case RenderMode::SmoothDistance: return "smooth";
    case RenderMode::NearestDistance: return "nearest";
    case RenderMode::DistanceGap: return "gap";
  }
  return "color";
}

bool parseRenderMode(std::string_view text, RenderMode& out) {
  if (text == "color") out = RenderMode::Color;
  else if (text == "position") out = RenderMode::Position;
  else if (text == "smooth") out = RenderMode::SmoothDistance;
  else if (text == "nearest") out = RenderMode::NearestDistance;
  else if (text == "gap") out = RenderMode::DistanceGap;
  else return false;
  return true;
}

} // namespace cellforge::tex
