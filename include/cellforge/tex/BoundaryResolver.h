#pragma once

#include "cellforge/core/Types.h"

#include <optional>
#include <string_view>

namespace cellforge::tex {

// What a neighbour lookup does when it falls outside the image.
enum class EdgeMode : core::u8 {
  None = 0, // no sample: the caller substitutes a transparent black pixel
  Repeat,   // clamp to the nearest edge pixel
  Tile,     // wrap around with period len
  Mirror    // reflect with period 2*len-2; edge pixels are not duplicated
};

// Map a 1-D coordinate onto [0, len) under `mode`.
// Returns nullopt for EdgeMode::None out of range, and for len == 0.
std::optional<core::u32> resolveCoord(core::i64 coord, core::u32 len, EdgeMode mode);

// Reflected index for Mirror mode. len <= 1 always maps to 0.
core::i64 mirrorIndex(core::i64 coord, core::i64 len);

const char* edgeModeName(EdgeMode mode);

// Accepts "none", "repeat", "tile", "mirror".
bool parseEdgeMode(std::string_view text, EdgeMode& out);

} // namespace cellforge::tex
