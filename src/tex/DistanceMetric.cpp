#include "cellforge/tex/DistanceMetric.h"

namespace cellforge::tex {

float metricDistance(float dx, float dy, float dw, const DistanceMetric& metric) {
  switch (metric.kind) {
    case DistanceMetricKind::Euclidean: return EuclideanDistance{}(dx, dy, dw);
    case DistanceMetricKind::Manhattan: return ManhattanDistance{}(dx, dy, dw);
    case DistanceMetricKind::Chebyshev: return ChebyshevDistance{}(dx, dy, dw);
    case DistanceMetricKind::Minkowski: return MinkowskiDistance{effectiveExponent(metric.exponent)}(dx, dy, dw);
  }
  return EuclideanDistance{}(dx, dy, dw);
}

const char* distanceMetricName(DistanceMetricKind kind) {
  switch (kind) {
    case DistanceMetricKind::Euclidean: return "euclidean";
    case DistanceMetricKind::Manhattan: return "manhattan";
    case DistanceMetricKind::Chebyshev: return "chebyshev";
    case DistanceMetricKind::Minkowski: return "minkowski";
  }
  return "euclidean";
}

bool parseDistanceMetric(std::string_view text, DistanceMetricKind& out) {
  if (text == "euclidean") out = DistanceMetricKind::Euclidean;
  else if (text == "manhattan") out = DistanceMetricKind::Manhattan;
  else if (text == "chebyshev") out = DistanceMetricKind::Chebyshev;
  else if (text == "minkowski" || text == "lp") out = DistanceMetricKind::Minkowski;
  else return false;
  return true;
}

} // namespace cellforge::tex
