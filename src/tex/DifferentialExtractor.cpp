#include "cellforge/tex/DifferentialExtractor.h"

#include "cellforge/core/Assert.h"
#include "cellforge/core/Clamp.h"
#include "cellforge/core/Log.h"
#include "cellforge/tex/RasterExecutor.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace cellforge::tex {

namespace {

PixelF32 halfDiff(const PixelF32& a, const PixelF32& b) {
  return PixelF32{0.5f * (a.r - b.r), 0.5f * (a.g - b.g), 0.5f * (a.b - b.b), 0.5f * (a.a - b.a)};
}

float length2(float x, float y) { return std::sqrt(x * x + y * y); }

RemapSettings remapFor(const DiffParams& params) {
  RemapSettings s;
  s.offset = params.mapOffset;
  s.scale = params.mapScale;
  s.rawOutput = params.rawOutput;
  s.mode = params.responseMode;
  return s;
}

PixelF32 mapPixel(const PixelBuffer& src, const DiffParams& params, const RemapSettings& remap,
                  core::u32 x, core::u32 y) {
  const PixelF32 d = rawDifferential(src, x, y, params.axis, params.edgeMode);

  PixelF32 out;
  out.r = remapDifferential(d.r, remap);
  out.g = remapDifferential(d.g, remap);
  out.b = remapDifferential(d.b, remap);
  out.a = params.alphaPassthrough ? core::finiteOr(src.at(x, y).a, 0.0f) : remapDifferential(d.a, remap);
  return out;
}

} // namespace

bool validateDiffParams(const PixelBuffer& src, const DiffParams& params, std::string* outError) {
  std::ostringstream oss;
  if (src.empty()) {
    oss << "configuration error: source " << src.width << "x" << src.height << " has a zero-length axis";
  } else if (!src.consistent()) {
    oss << "configuration error: source holds " << src.pixels.size() << " pixels, expected "
        << src.width << "x" << src.height;
  } else if ((params.width != 0 || params.height != 0) &&
             (params.width != src.width || params.height != src.height)) {
    oss << "configuration error: output size " << params.width << "x" << params.height
        << " differs from source " << src.width << "x" << src.height;
  } else {
    return true;
  }

  if (outError) *outError = oss.str();
  return false;
}

PixelF32 sampleEdge(const PixelBuffer& src, core::i64 x, core::i64 y, EdgeMode mode) {
  const auto xx = resolveCoord(x, src.width, mode);
  const auto yy = resolveCoord(y, src.height, mode);
  if (!xx || !yy) return PixelF32{};
  return src.at(*xx, *yy);
}

PixelF32 rawDifferential(const PixelBuffer& src, core::u32 x, core::u32 y, DiffAxis axis, EdgeMode mode) {
  const core::i64 ix = x;
  const core::i64 iy = y;

  switch (axis) {
    case DiffAxis::X:
      return halfDiff(sampleEdge(src, ix + 1, iy, mode), sampleEdge(src, ix - 1, iy, mode));
    case DiffAxis::Y:
      return halfDiff(sampleEdge(src, ix, iy + 1, mode), sampleEdge(src, ix, iy - 1, mode));
    case DiffAxis::Magnitude: {
      const PixelF32 gx = halfDiff(sampleEdge(src, ix + 1, iy, mode), sampleEdge(src, ix - 1, iy, mode));
      const PixelF32 gy = halfDiff(sampleEdge(src, ix, iy + 1, mode), sampleEdge(src, ix, iy - 1, mode));
      return PixelF32{length2(gx.r, gy.r), length2(gx.g, gy.g), length2(gx.b, gy.b), length2(gx.a, gy.a)};
    }
  }
  return PixelF32{};
}

PixelF32 differentiatePixel(const PixelBuffer& src, const DiffParams& params, core::u32 x, core::u32 y) {
  CELLFORGE_ASSERT_MSG(x < src.width && y < src.height && src.consistent(), "differentiatePixel: coordinate outside source");
  return mapPixel(src, params, remapFor(params), x, y);
}

bool extractDifferential(const PixelBuffer& src, const DiffParams& params, PixelBuffer& out,
                         std::string* outError, RasterExecutor* executor) {
  std::string err;
  if (!validateDiffParams(src, params, &err)) {
    CELLFORGE_LOG_WARN("diff: " + err);
    if (outError) *outError = err;
    return false;
  }

  RasterExecutor& exec = executor ? *executor : serialExecutor();

  {
    std::ostringstream oss;
    oss << "diff: " << src.width << "x" << src.height
        << " axis=" << diffAxisName(params.axis)
        << " edge=" << edgeModeName(params.edgeMode)
        << " response=" << responseModeName(params.responseMode)
        << (params.rawOutput ? " raw" : "")
        << " exec=" << exec.name();
    CELLFORGE_LOG_DEBUG(oss.str());
  }

  // `out` may alias `src`; render into a fresh buffer first.
  PixelBuffer result(src.width, src.height);
  const RemapSettings remap = remapFor(params);
  mapPixels(exec, result, [&](core::u32 x, core::u32 y) { return mapPixel(src, params, remap, x, y); });
  out = std::move(result);
  return true;
}

const char* diffAxisName(DiffAxis axis) {
  switch (axis) {
    case DiffAxis::X: return "x";
    case DiffAxis::Y: return "y";
    case DiffAxis::Magnitude: return "magnitude";
  }
  return "x";
}

bool parseDiffAxis(std::string_view text, DiffAxis& out) {
  if (text == "x") out = DiffAxis::X;
  else if (text == "y") out = DiffAxis::Y;
  else if (text == "magnitude" || text == "mag") out = DiffAxis::Magnitude;
  else return false;
  return true;
}

} // namespace cellforge::tex
