#pragma once

#include "cellforge/core/CVar.h"
#include "cellforge/core/Types.h"
#include "cellforge/tex/DifferentialExtractor.h"
#include "cellforge/tex/FieldGenerator.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace cellforge::tex {

// Bridges the CVar registry and the typed kernel parameter blocks.
//
// Field variables ("field.*"):
//   width height seed metric minkowski_p randomness smoothness w
//   cell_size scale_x scale_y scale_w offset_x offset_y mode clamp
// Differential variables ("diff.*"):
//   axis edge_mode response raw_output alpha_passthrough offset scale

// "42" / "0x2A" -> that value (truncated to 32 bits); anything else is hashed as text.
// Returns false only for an empty string.
bool parseSeed(std::string_view text, core::u32& out);

void defineFieldVars(core::CVarRegistry& vars);
void defineDiffVars(core::CVarRegistry& vars);

// Read the variables into a parameter block. Unknown enum names and
// out-of-range sizes are reported; the parameter block is only written on success.
bool resolveFieldParams(const core::CVarRegistry& vars, FieldParams& out, std::string* outError = nullptr);
bool resolveDiffParams(const core::CVarRegistry& vars, DiffParams& out, std::string* outError = nullptr);

// Call once every variable is defined. Logs a warning for each preset entry
// that matched no variable (usually a misspelled name) and returns how many.
std::size_t warnUnmatchedVars(const core::CVarRegistry& vars);

} // namespace cellforge::tex
