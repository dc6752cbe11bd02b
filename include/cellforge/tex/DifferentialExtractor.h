#pragma once

#include "cellforge/core/Types.h"
#include "cellforge/tex/BoundaryResolver.h"
#include "cellforge/tex/PixelBuffer.h"
#include "cellforge/tex/ResponseCurve.h"

#include <string>
#include <string_view>

namespace cellforge::tex {

class RasterExecutor;

// Differential (gradient) maps of an RGBA raster.
//
// Every channel is differentiated on its own with central differences over the
// 4-neighbour stencil; the raw derivative is then offset, scaled and folded
// into range by a ResponseCurve. Typical uses are edge detection and
// height-to-normal style maps.

enum class DiffAxis : core::u8 {
  X = 0,    // (right - left) / 2
  Y,        // (down - up) / 2, row 0 at the top
  Magnitude // sqrt(gx^2 + gy^2), per channel
};

struct DiffParams {
  // Expected output size; {0,0} means "same as the source".
  core::u32 width{0};
  core::u32 height{0};

  DiffAxis axis{DiffAxis::X};
  EdgeMode edgeMode{EdgeMode::Repeat};
  ResponseMode responseMode{ResponseMode::Clamp};

  // See RemapSettings::rawOutput.
  bool rawOutput{false};

  // Copy the source alpha instead of differentiating it.
  bool alphaPassthrough{false};

  float mapOffset{0.5f};
  float mapScale{1.0f};
};

// Rejects empty or malformed sources and an explicit size that differs from the source.
bool validateDiffParams(const PixelBuffer& src, const DiffParams& params, std::string* outError = nullptr);

// Source pixel at (x, y) after edge resolution; transparent black when the
// edge mode yields no sample.
PixelF32 sampleEdge(const PixelBuffer& src, core::i64 x, core::i64 y, EdgeMode mode);

// Raw (unmapped) per-channel derivative at (x, y).
PixelF32 rawDifferential(const PixelBuffer& src, core::u32 x, core::u32 y, DiffAxis axis, EdgeMode mode);

// Fully mapped output pixel at (x, y). `src` and `params` must be valid.
PixelF32 differentiatePixel(const PixelBuffer& src, const DiffParams& params, core::u32 x, core::u32 y);

// Differentiate the whole source into `out` (reallocated to the source size).
// On invalid input nothing is written and false is returned.
bool extractDifferential(const PixelBuffer& src, const DiffParams& params, PixelBuffer& out,
                         std::string* outError = nullptr, RasterExecutor* executor = nullptr);

const char* diffAxisName(DiffAxis axis);

// Accepts "x", "y", "magnitude".
bool parseDiffAxis(std::string_view text, DiffAxis& out);

} // namespace cellforge::tex
