#pragma once

#include "cellforge/core/Types.h"
#include "cellforge/math/Vec2.h"
#include "cellforge/math/Vec3.h"
#include "cellforge/tex/DistanceMetric.h"
#include "cellforge/tex/PixelBuffer.h"

#include <string>
#include <string_view>

namespace cellforge::tex {

class RasterExecutor;

// Cellular (Voronoi / Worley style) field generator.
//
// Space is split into a 3-D lattice of cells (x, y and a "w" axis usually
// driven by animation time). Every cell owns one site, jittered inside the
// cell by a hash of (cell, seed). Each output pixel finds its nearest and
// second-nearest site among the 27 cells around it and renders one of the
// RenderMode outputs.
//
// All distances are measured in lattice units (one cell == 1.0 on every axis).

enum class RenderMode : core::u8 {
  Color = 0,       // per-site random RGB, blended towards the second site
  Position,        // nearest site x/y over the frame's lattice extent, in r/g
  SmoothDistance,  // lerp(d1, d2, blend)
  NearestDistance, // d1
  DistanceGap      // max(d2 - d1, 0): bright on cell borders
};

struct LatticeSite {
  math::Vec3f position{}; // lattice space
  core::u32 hash{0};      // identity hash of the owning cell
};

struct FieldParams {
  core::u32 width{0};
  core::u32 height{0};

  core::u32 seed{0};
  DistanceMetric metric{};

  // 0 = regular grid of cell centres, 1 = sites anywhere inside their cell.
  // Clamped to [0,1].
  float randomness{1.0f};

  // Width of the soft band around cell borders (lattice units). <= 0 gives hard borders.
  float smoothness{0.0f};

  // Position along the w axis, in the same units as cellSize.w.
  float wValue{0.0f};

  // Cell extent per axis: pixels for x/y, w units for w. Must be > 0.
  math::Vec3f cellSize{128.0f, 128.0f, 1.28f};

  // Pixel-space translation of the pattern.
  math::Vec2f offset{};

  RenderMode renderMode{RenderMode::Color};

  // Clamp scalar/position outputs to [0,1]. Colour output is always in range.
  bool clampOutput{false};
};

// Per-axis cell size from one base size and per-axis zoom factors (cell = base/scale).
// Base and scales are floored at 1e-3.
math::Vec3f cellSizeFromScale(float cellPx, float scaleX, float scaleY, float scaleW);

// Site of integer cell (cx,cy,cw). Each axis is jittered to
// 0.5 + (r - 0.5) * randomness of the cell, r drawn from the cell hash.
LatticeSite latticeSite(core::i32 cx, core::i32 cy, core::i32 cw, float randomness, core::u32 seed);

// Pseudo-random colour (alpha = 1) derived from a site hash.
PixelF32 siteColor(core::u32 siteHash);

// Weight of the second site: 0.5 on the border (d1 == d2), falling to 0 once
// d2 - d1 reaches `smoothness`. Always 0 when smoothness <= 0.
float smoothBlend(float d1, float d2, float smoothness);

// Nearest/second-nearest search result for one lattice-space point.
// Invariant: 0 <= d1 <= d2.
struct FieldSample {
  float d1{0.0f};
  float d2{0.0f};
  LatticeSite nearest{};
  LatticeSite second{};
  float blend{0.0f};
};

// Rejects empty frames, non-positive or non-finite cell sizes and non-finite
// scalar parameters. A too-small Minkowski exponent is not an error; it is floored.
bool validateFieldParams(const FieldParams& params, std::string* outError = nullptr);

// Per-frame evaluator: derived constants are computed once in the constructor.
// Construct only from parameters that passed validateFieldParams().
class FieldKernel {
public:
  explicit FieldKernel(const FieldParams& params);

  const FieldParams& params() const { return params_; }

  // Lattice-space position of the centre of pixel (x, y).
  math::Vec3f latticePoint(core::u32 x, core::u32 y) const;

  // Nearest/second-nearest search around `p`.
  FieldSample sample(const math::Vec3f& p) const;

  // Render one search result in the configured mode (alpha = 1).
  PixelF32 shade(const FieldSample& s) const;

  // shade(sample(latticePoint(x, y))).
  PixelF32 evaluate(core::u32 x, core::u32 y) const;

  // Fill `out` (already sized width x height) through `exec`.
  void render(PixelBuffer& out, RasterExecutor& exec) const;

private:
  template <class Metric>
  FieldSample sampleWith(const Metric& metric, const math::Vec3f& p) const;

  template <class Metric>
  void renderWith(const Metric& metric, PixelBuffer& out, RasterExecutor& exec) const;

  float sanitize(float v) const;

  FieldParams params_;
  math::Vec3f invCell_{};
  float randomness_{1.0f};
  float smoothness_{0.0f};
  float gridW_{1.0f};
  float gridH_{1.0f};
};

// One-off nearest/second-nearest query at lattice-space point `p`.
// `params` must be valid; width/height only matter for Position normalisation.
FieldSample sampleField(const FieldParams& params, const math::Vec3f& p);

// Render a full frame into `out` (reallocated to width x height).
//
// alphaSource, if given, must match the frame size: its alpha (clamped to
// [0,1], non-finite -> 0) becomes the output alpha and premultiplies RGB.
//
// On invalid parameters nothing is written, false is returned and the reason
// goes to outError.
bool generateField(const FieldParams& params, PixelBuffer& out, std::string* outError = nullptr,
                   RasterExecutor* executor = nullptr, const PixelBuffer* alphaSource = nullptr);

const char* renderModeName(RenderMode mode);

// Accepts "color", "position", "smooth", "nearest", "gap".
bool parseRenderMode(std::string_view text, RenderMode& out);

} // namespace cellforge::tex
