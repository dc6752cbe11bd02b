#include "cellforge/tex/DifferentialExtractor.h"

#include "test_harness.h"

#include <cmath>
#include <limits>
#include <string>

namespace {

using namespace cellforge::tex;

bool near(float a, float b, float eps = 1e-6f) { return std::abs(a - b) <= eps; }

// 4x3 source: red ramps along x, green ramps along y, blue constant, alpha varies.
PixelBuffer rampImage() {
  PixelBuffer img(4, 3);
  for (cellforge::core::u32 y = 0; y < img.height; ++y) {
    for (cellforge::core::u32 x = 0; x < img.width; ++x) {
      img.at(x, y) = PixelF32{0.1f + 0.2f * x, 0.25f * y, 0.6f, 0.1f * (x + y)};
    }
  }
  return img;
}

DiffParams identityParams(DiffAxis axis, EdgeMode edge) {
  DiffParams p;
  p.axis = axis;
  p.edgeMode = edge;
  p.responseMode = ResponseMode::Identity;
  p.mapOffset = 0.0f;
  return p;
}

} // namespace

int test_differential() {
  int failures = 0;

  const PixelBuffer src = rampImage();

  // ---- Central differences ----
  {
    const DiffParams p = identityParams(DiffAxis::X, EdgeMode::Repeat);
    const PixelF32 d = differentiatePixel(src, p, 1, 1);
    CHECK(near(d.r, 0.2f));
    CHECK(d.g == 0.0f);
    CHECK(d.b == 0.0f);
    CHECK(near(d.a, 0.1f));

    const PixelF32 dy = differentiatePixel(src, identityParams(DiffAxis::Y, EdgeMode::Repeat), 1, 1);
    CHECK(dy.r == 0.0f);
    CHECK(near(dy.g, 0.25f));

    // Magnitude is per channel.
    const PixelF32 m = differentiatePixel(src, identityParams(DiffAxis::Magnitude, EdgeMode::Repeat), 1, 1);
    CHECK(near(m.r, 0.2f));
    CHECK(near(m.g, 0.25f));
    CHECK(m.b == 0.0f);
    CHECK(near(m.a, std::sqrt(0.1f * 0.1f + 0.1f * 0.1f)));
  }

  // ---- Edge modes at x = 0 ----
  {
    // Row 0 red values: 0.1 0.3 0.5 0.7
    CHECK(near(differentiatePixel(src, identityParams(DiffAxis::X, EdgeMode::None), 0, 0).r, 0.15f));
    CHECK(near(differentiatePixel(src, identityParams(DiffAxis::X, EdgeMode::Repeat), 0, 0).r, 0.1f));
    CHECK(near(differentiatePixel(src, identityParams(DiffAxis::X, EdgeMode::Tile), 0, 0).r, -0.2f));
    CHECK(differentiatePixel(src, identityParams(DiffAxis::X, EdgeMode::Mirror), 0, 0).r == 0.0f);

    CHECK(near(differentiatePixel(src, identityParams(DiffAxis::X, EdgeMode::None), 3, 0).r, -0.25f));
    CHECK(differentiatePixel(src, identityParams(DiffAxis::X, EdgeMode::Mirror), 3, 0).r == 0.0f);

    CHECK(sampleEdge(src, -1, 0, EdgeMode::None) == PixelF32{});
    CHECK(sampleEdge(src, -1, 0, EdgeMode::Mirror) == src.at(1, 0));
  }

  // ---- Remap ----
  {
    DiffParams p;
    p.axis = DiffAxis::X;
    CHECK(near(differentiatePixel(src, p, 1, 1).r, 0.7f));
    CHECK(differentiatePixel(src, p, 1, 1).g == 0.5f);

    p.mapScale = 10.0f;
    CHECK(differentiatePixel(src, p, 1, 1).r == 1.0f);

    p.mapScale = 1.0f;
    p.rawOutput = true;
    p.responseMode = ResponseMode::Identity;
    CHECK(differentiatePixel(src, p, 1, 1).g == 0.0f);
  }

  // ---- Alpha passthrough ----
  {
    DiffParams p;
    p.alphaPassthrough = true;
    p.axis = DiffAxis::Magnitude;
    PixelBuffer out;
    CHECK(extractDifferential(src, p, out));
    bool ok = true;
    for (cellforge::core::u32 y = 0; y < src.height; ++y) {
      for (cellforge::core::u32 x = 0; x < src.width; ++x) {
        if (out.at(x, y).a != src.at(x, y).a) ok = false;
      }
    }
    CHECK(ok);
  }

  // ---- Non-finite source values become 0 before the response ----
  {
    PixelBuffer img(3, 1, PixelF32{0.5f, 0.5f, 0.5f, 1.0f});
    img.at(2, 0).r = std::numeric_limits<float>::infinity();
    DiffParams p;
    p.responseMode = ResponseMode::SoftClamp;
    PixelBuffer out;
    CHECK(extractDifferential(img, p, out));
    CHECK(out.at(1, 0).r == softClamp01(0.0f));
    CHECK(out.at(1, 0).g == softClamp01(0.5f));
  }

  // ---- Passed-through alpha is sanitised too ----
  {
    PixelBuffer img(3, 3, PixelF32{0.2f, 0.4f, 0.6f, 0.5f});
    img.at(1, 1).a = std::numeric_limits<float>::quiet_NaN();
    img.at(0, 0).a = std::numeric_limits<float>::infinity();
    DiffParams p;
    p.alphaPassthrough = true;
    PixelBuffer out;
    CHECK(extractDifferential(img, p, out));
    CHECK(out.at(1, 1).a == 0.0f);
    CHECK(out.at(0, 0).a == 0.0f);
    CHECK(out.at(2, 2).a == 0.5f);

    bool allFinite = true;
    for (const PixelF32& px : out.pixels) {
      if (!std::isfinite(px.r) || !std::isfinite(px.g) || !std::isfinite(px.b) || !std::isfinite(px.a)) {
        allFinite = false;
      }
    }
    CHECK(allFinite);
  }

  // ---- Whole-frame extraction ----
  {
    DiffParams p = identityParams(DiffAxis::Y, EdgeMode::Tile);
    PixelBuffer out;
    CHECK(extractDifferential(src, p, out));
    CHECK(out.width == src.width && out.height == src.height);
    CHECK(out.at(2, 1) == differentiatePixel(src, p, 2, 1));

    // Source and output may be the same buffer.
    PixelBuffer inPlace = src;
    CHECK(extractDifferential(inPlace, p, inPlace));
    CHECK(signature(inPlace) == signature(out));
  }

  // ---- Validation ----
  {
    std::string err;
    DiffParams p;

    p.width = src.width;
    p.height = src.height;
    CHECK(validateDiffParams(src, p, &err));

    p.width = 8;
    PixelBuffer out(1, 1, PixelF32{0.25f, 0.25f, 0.25f, 0.25f});
    CHECK(!extractDifferential(src, p, out, &err));
    CHECK(err.find("differs from source") != std::string::npos);
    CHECK(out.width == 1u && out.at(0, 0).r == 0.25f);

    p = DiffParams{};
    CHECK(!extractDifferential(PixelBuffer(0, 3), p, out, &err));

    PixelBuffer broken = src;
    broken.pixels.resize(5);
    CHECK(!validateDiffParams(broken, p, &err));
  }

  // ---- Names ----
  {
    DiffAxis a = DiffAxis::X;
    CHECK(parseDiffAxis("magnitude", a) && a == DiffAxis::Magnitude);
    CHECK(parseDiffAxis("y", a) && a == DiffAxis::Y);
    CHECK(!parseDiffAxis("z", a));
    CHECK(std::string(diffAxisName(DiffAxis::X)) == "x");
  }

  return failures;
}
