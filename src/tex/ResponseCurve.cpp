#include "cellforge/tex/ResponseCurve.h"

#include "cellforge/core/Clamp.h"

#include <cmath>
#include <limits>

namespace cellforge::tex {

float softClamp01(float v) {
  const float c = v - 0.5f;
  const float s = 0.5f + 0.5f * (c / (1.0f + std::abs(c)));
  // Float rounding saturates to exactly 0 or 1 once |c| passes ~2^24.
  constexpr float lo = std::numeric_limits<float>::min();
  constexpr float hi = 1.0f - std::numeric_limits<float>::epsilon() * 0.5f;
  return core::clamp(s, lo, hi);
}

float wrap01(float v) {
  float t = std::fmod(v, 1.0f);
  if (t < 0.0f) t += 1.0f;
  // -tiny + 1 rounds to exactly 1 in float.
  if (t >= 1.0f) t = 0.0f;
  return t;
}

float mirror01(float v) {
  float t = std::fmod(v, 2.0f);
  if (t < 0.0f) t += 2.0f;
  if (t >= 2.0f) t = 0.0f;
  return t <= 1.0f ? t : 2.0f - t;
}

float applyResponse(float v, ResponseMode mode) {
  switch (mode) {
    case ResponseMode::Clamp: return core::clamp01(v);
    case ResponseMode::SoftClamp: return softClamp01(v);
    case ResponseMode::Mirror: return mirror01(v);
    case ResponseMode::Wrap: return wrap01(v);
    case ResponseMode::Identity: return v;
  }
  return v;
}

float remapDifferential(float diff, const RemapSettings& settings) {
  const float base = settings.rawOutput ? settings.offset - 0.5f : settings.offset;
  const float v = core::finiteOr(base + diff * settings.scale, 0.0f);
  return applyResponse(v, settings.mode);
}

const char* responseModeName(ResponseMode mode) {
  switch (mode) {
    case ResponseMode::Clamp: return "clamp";
    case ResponseMode::SoftClamp: return "softclamp";
    case ResponseMode::Mirror: return "mirror";
    case ResponseMode::Wrap: return "wrap";
    case ResponseMode::Identity: return "identity";
  }
  return "clamp";
}

bool parseResponseMode(std::string_view text, ResponseMode& out) {
  if (text == "clamp") out = ResponseMode::Clamp;
  else if (text == "softclamp") out = ResponseMode::SoftClamp;
  else if (text == "mirror") out = ResponseMode::Mirror;
  else if (text == "wrap") out = ResponseMode::Wrap;
  else if (text == "identity" || text == "passthrough") out = ResponseMode::Identity;
  else return false;
  return true;
}

} // namespace cellforge::tex
