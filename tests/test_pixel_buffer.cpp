#include "cellforge/tex/PixelBuffer.h"

#include "test_harness.h"

#include <cmath>
#include <limits>

int test_pixel_buffer() {
  int failures = 0;

  using namespace cellforge::tex;
  using cellforge::core::u8;

  // ---- Layout ----
  {
    PixelBuffer img(3, 2);
    CHECK(img.pixels.size() == 6u);
    CHECK(img.consistent());
    CHECK(!img.empty());
    CHECK(img.index(2, 1) == 5u);

    img.at(1, 1) = PixelF32{1.0f, 0.5f, 0.25f, 1.0f};
    CHECK(img.pixels[4].g == 0.5f);

    CHECK(PixelBuffer(0, 4).empty());

    PixelBuffer broken(2, 2);
    broken.pixels.pop_back();
    CHECK(!broken.consistent());
  }

  // ---- 8/16-bit quantisation ----
  {
    PixelBuffer img(2, 1);
    img.at(0, 0) = PixelF32{-1.0f, 0.5f, 1.0f, 2.0f};
    img.at(1, 0) = PixelF32{std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity(), 0.999f, 1.0f};

    const auto q8 = toRGBA8(img);
    CHECK(q8.size() == 8u);
    CHECK(q8[0] == 0);
    CHECK(q8[1] == 127); // truncation, not rounding
    CHECK(q8[2] == 255);
    CHECK(q8[3] == 255);
    CHECK(q8[4] == 0);
    CHECK(q8[5] == 0);
    CHECK(q8[6] == 254);

    const auto q16 = toRGBA16(img);
    CHECK(q16.size() == 8u);
    CHECK(q16[1] == 32767);
    CHECK(q16[2] == 65535);
  }

  // ---- Float RGB for HDR export ----
  {
    PixelBuffer img(2, 1);
    img.at(0, 0) = PixelF32{-0.1f, 0.3f, 4.5f, 0.25f};
    img.at(1, 0) = PixelF32{std::numeric_limits<float>::quiet_NaN(), -std::numeric_limits<float>::infinity(),
                            std::numeric_limits<float>::infinity(), 1.0f};

    const auto rgb = toRGBF32NonNegative(img);
    CHECK(rgb.size() == 6u);
    CHECK(rgb[0] == 0.0f);
    CHECK(rgb[1] == 0.3f);
    CHECK(rgb[2] == 4.5f); // unbounded above
    CHECK(rgb[3] == 0.0f);
    CHECK(rgb[4] == 0.0f);
    CHECK(rgb[5] == 0.0f);
    for (float v : rgb) CHECK(std::isfinite(v) && v >= 0.0f);
  }

  // ---- fromRGBA8 ----
  {
    const u8 rgba[8] = {0, 255, 51, 255, 255, 0, 0, 0};
    const PixelBuffer img = fromRGBA8(rgba, 2, 1);
    CHECK(img.width == 2u && img.height == 1u);
    CHECK(img.at(0, 0).r == 0.0f);
    CHECK(std::abs(img.at(0, 0).g - 1.0f) < 1e-6f);
    CHECK(std::abs(img.at(0, 0).b - 0.2f) < 1e-6f);
    CHECK(img.at(1, 0).a == 0.0f);
  }

  // ---- signature ----
  {
    PixelBuffer a(4, 4, PixelF32{0.25f, 0.5f, 0.75f, 1.0f});
    PixelBuffer b = a;
    CHECK(signature(a) == signature(b));

    b.at(3, 3).b = 0.7500001f;
    CHECK(signature(a) != signature(b));

    // Same pixel data, different shape.
    PixelBuffer c(2, 8, PixelF32{0.25f, 0.5f, 0.75f, 1.0f});
    CHECK(signature(a) != signature(c));
  }

  return failures;
}
