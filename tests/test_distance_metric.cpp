#include "cellforge/tex/DistanceMetric.h"

#include "test_harness.h"

#include <cmath>
#include <limits>
#include <string>

int test_distance_metric() {
  int failures = 0;

  using namespace cellforge::tex;

  const DistanceMetric euclid = DistanceMetric::euclidean();
  const DistanceMetric manhattan = DistanceMetric::manhattan();
  const DistanceMetric chebyshev = DistanceMetric::chebyshev();

  // ---- Basic metrics ----
  CHECK(metricDistance(3.0f, 4.0f, 0.0f, euclid) == 5.0f);
  CHECK(metricDistance(-3.0f, 4.0f, -12.0f, euclid) == 13.0f);
  CHECK(metricDistance(1.0f, -2.0f, 3.0f, manhattan) == 6.0f);
  CHECK(metricDistance(1.0f, -5.0f, 3.0f, chebyshev) == 5.0f);
  CHECK(metricDistance(0.0f, 0.0f, 0.0f, euclid) == 0.0f);

  // ---- Minkowski ----
  {
    // p = 1 is Manhattan, p = 2 is Euclidean.
    CHECK(metricDistance(1.0f, -2.0f, 3.0f, DistanceMetric::minkowski(1.0f)) == 6.0f);
    CHECK(std::abs(metricDistance(3.0f, 4.0f, 0.0f, DistanceMetric::minkowski(2.0f)) - 5.0f) < 1e-5f);

    // Large p approaches Chebyshev.
    const float d = metricDistance(0.3f, 0.9f, 0.1f, DistanceMetric::minkowski(64.0f));
    CHECK(std::abs(d - 0.9f) < 0.01f);

    // Exponent floor: 0, negative and NaN exponents are treated as 0.1.
    CHECK(effectiveExponent(0.0f) == DistanceMetric::kMinExponent);
    CHECK(effectiveExponent(-3.0f) == DistanceMetric::kMinExponent);
    CHECK(effectiveExponent(std::numeric_limits<float>::quiet_NaN()) == DistanceMetric::kMinExponent);
    CHECK(effectiveExponent(3.0f) == 3.0f);

    const float floored = metricDistance(0.25f, 0.5f, 0.75f, DistanceMetric::minkowski(-1.0f));
    const float atMin = metricDistance(0.25f, 0.5f, 0.75f, DistanceMetric::minkowski(0.1f));
    CHECK(std::isfinite(floored));
    CHECK(floored == atMin);
  }

  // ---- Non-negative for every kind ----
  {
    const DistanceMetric all[] = {euclid, manhattan, chebyshev, DistanceMetric::minkowski(0.5f)};
    bool ok = true;
    for (const DistanceMetric& m : all) {
      for (float dx = -1.5f; dx <= 1.5f; dx += 0.5f) {
        for (float dw = -1.0f; dw <= 1.0f; dw += 0.5f) {
          if (!(metricDistance(dx, -dx * 0.5f, dw, m) >= 0.0f)) ok = false;
        }
      }
    }
    CHECK(ok);
  }

  // ---- Names ----
  {
    DistanceMetricKind k = DistanceMetricKind::Euclidean;
    CHECK(parseDistanceMetric("chebyshev", k) && k == DistanceMetricKind::Chebyshev);
    CHECK(parseDistanceMetric("lp", k) && k == DistanceMetricKind::Minkowski);
    CHECK(!parseDistanceMetric("taxicab", k));
    CHECK(k == DistanceMetricKind::Minkowski);
    CHECK(std::string(distanceMetricName(DistanceMetricKind::Manhattan)) == "manhattan");
  }

  return failures;
}
