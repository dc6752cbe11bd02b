#include "cellforge/tex/BoundaryResolver.h"

namespace cellforge::tex {

static core::i64 euclidMod(core::i64 a, core::i64 m) {
  const core::i64 r = a % m;
  return r < 0 ? r + m : r;
}

core::i64 mirrorIndex(core::i64 coord, core::i64 len) {
  if (len <= 1) return 0;
  const core::i64 period = 2 * len - 2;
  const core::i64 t = euclidMod(coord, period);
  return t < len ? t : period - t;
}

std::optional<core::u32> resolveCoord(core::i64 coord, core::u32 len, EdgeMode mode) {
  if (len == 0) return std::nullopt;
  const core::i64 n = static_cast<core::i64>(len);

  switch (mode) {
    case EdgeMode::None:
      if (coord < 0 || coord >= n) return std::nullopt;
      return static_cast<core::u32>(coord);
    case EdgeMode::Repeat:
      if (coord < 0) return 0u;
      if (coord >= n) return static_cast<core::u32>(n - 1);
      return static_cast<core::u32>(coord);
    case EdgeMode::Tile:
      return static_cast<core::u32>(euclidMod(coord, n));
    case EdgeMode::Mirror:
      return static_cast<core::u32>(mirrorIndex(coord, n));
  }
  return std::nullopt;
}

const char* edgeModeName(EdgeMode mode) {
  switch (mode) {
    case EdgeMode::None: return "none";
    case EdgeMode::Repeat: return "repeat";
    case EdgeMode::Tile: return "tile";
    case EdgeMode::Mirror: return "mirror";
  }
  return "none";
}

bool parseEdgeMode(std::string_view text, EdgeMode& out) {
  if (text == "none") out = EdgeMode::None;
  else if (text == "repeat") out = EdgeMode::Repeat;
  else if (text == "tile") out = EdgeMode::Tile;
  else if (text == "mirror") out = EdgeMode::Mirror;
  else return false;
  return true;
}

} // namespace cellforge::tex
