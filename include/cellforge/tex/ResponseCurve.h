#pragma once

#include "cellforge/core/Types.h"

#include <string_view>

namespace cellforge::tex {

// How an unbounded value is folded into the output range.
enum class ResponseMode : core::u8 {
  Clamp = 0, // hard clip to [0,1]
  SoftClamp, // 0.5 + 0.5*c/(1+|c|), c = v-0.5; approaches but never reaches 0 or 1
  Mirror,    // period-2 triangle wave into [0,1]
  Wrap,      // fractional part, [0,1)
  Identity   // unchanged
};

float softClamp01(float v);
float mirror01(float v);
float wrap01(float v);

float applyResponse(float v, ResponseMode mode);

// Offset/scale/response applied to every differential channel.
struct RemapSettings {
  float offset{0.5f};
  float scale{1.0f};
  // Raw output treats `offset` as a signed value centred on 0.5, i.e. the
  // base becomes offset-0.5. The response curve still applies.
  bool rawOutput{false};
  ResponseMode mode{ResponseMode::Clamp};
};

// (base + diff*scale) -> non-finite to 0 -> response curve.
float remapDifferential(float diff, const RemapSettings& settings);

const char* responseModeName(ResponseMode mode);

// Accepts "clamp", "softclamp", "mirror", "wrap", "identity" (alias "passthrough").
bool parseResponseMode(std::string_view text, ResponseMode& out);

} // namespace cellforge::tex
