#include "cellforge/tex/KernelConfig.h"

#include "cellforge/core/Log.h"
#include "cellforge/core/Random.h"

#include <cstdlib>
#include <limits>

namespace cellforge::tex {

namespace {

bool fail(std::string* outError, const std::string& msg) {
  if (outError) *outError = msg;
  return false;
}

bool readSize(const core::CVarRegistry& vars, std::string_view name, core::u32& out, std::string* outError) {
  const std::int64_t v = vars.getInt(name, 0);
  if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<core::u32>::max())) {
    return fail(outError, std::string(name) + " out of range: " + std::to_string(v));
  }
  out = static_cast<core::u32>(v);
  return true;
}

float readFloat(const core::CVarRegistry& vars, std::string_view name, double fallback) {
  return static_cast<float>(vars.getFloat(name, fallback));
}

} // namespace

bool parseSeed(std::string_view text, core::u32& out) {
  if (text.empty()) return false;

  const std::string tmp(text);
  char* end = nullptr;
  const unsigned long long v = std::strtoull(tmp.c_str(), &end, 0);
  if (tmp[0] != '-' && end && *end == '\0') {
    out = static_cast<core::u32>(v);
    return true;
  }
  out = core::seedFromText(text);
  return true;
}

void defineFieldVars(core::CVarRegistry& vars) {
  vars.defineInt("field.width", 512, core::CVar_Archive, "Output width in pixels");
  vars.defineInt("field.height", 512, core::CVar_Archive, "Output height in pixels");
  vars.defineString("field.seed", "0", core::CVar_Archive, "Seed: integer or any text");
  vars.defineString("field.metric", "euclidean", core::CVar_Archive, "euclidean | manhattan | chebyshev | minkowski");
  vars.defineFloat("field.minkowski_p", 2.0, core::CVar_Archive, "Minkowski exponent (floored at 0.1)");
  vars.defineFloat("field.randomness", 1.0, core::CVar_Archive, "Site jitter, 0 = regular grid");
  vars.defineFloat("field.smoothness", 0.0, core::CVar_Archive, "Soft border width in cells");
  vars.defineFloat("field.w", 0.0, core::CVar_Archive, "Position along the w axis");
  vars.defineFloat("field.cell_size", 128.0, core::CVar_Archive, "Base cell size in pixels");
  vars.defineFloat("field.scale_x", 1.0, core::CVar_Archive, "Horizontal zoom");
  vars.defineFloat("field.scale_y", 1.0, core::CVar_Archive, "Vertical zoom");
  vars.defineFloat("field.scale_w", 100.0, core::CVar_Archive, "w axis zoom");
  vars.defineFloat("field.offset_x", 0.0, core::CVar_Archive, "Horizontal offset in pixels");
  vars.defineFloat("field.offset_y", 0.0, core::CVar_Archive, "Vertical offset in pixels");
  vars.defineString("field.mode", "color", core::CVar_Archive, "color | position | smooth | nearest | gap");
  vars.defineBool("field.clamp", false, core::CVar_Archive, "Clamp scalar outputs to [0,1]");
}

void defineDiffVars(core::CVarRegistry& vars) {
  vars.defineString("diff.axis", "x", core::CVar_Archive, "x | y | magnitude");
  vars.defineString("diff.edge_mode", "repeat", core::CVar_Archive, "none | repeat | tile | mirror");
  vars.defineString("diff.response", "clamp", core::CVar_Archive, "clamp | softclamp | mirror | wrap | identity");
  vars.defineBool("diff.raw_output", false, core::CVar_Archive, "Treat offset as a signed, unmapped base");
  vars.defineBool("diff.alpha_passthrough", false, core::CVar_Archive, "Copy source alpha");
  vars.defineFloat("diff.offset", 0.5, core::CVar_Archive, "Output value for a zero derivative");
  vars.defineFloat("diff.scale", 1.0, core::CVar_Archive, "Derivative gain");
}

bool resolveFieldParams(const core::CVarRegistry& vars, FieldParams& out, std::string* outError) {
  FieldParams p;

  if (!readSize(vars, "field.width", p.width, outError)) return false;
  if (!readSize(vars, "field.height", p.height, outError)) return false;

  const std::string seedText = vars.getString("field.seed", "0");
  if (!parseSeed(seedText, p.seed)) return fail(outError, "field.seed is empty");

  const std::string metric = vars.getString("field.metric", "euclidean");
  if (!parseDistanceMetric(metric, p.metric.kind)) return fail(outError, "Unknown field.metric: " + metric);
  p.metric.exponent = readFloat(vars, "field.minkowski_p", 2.0);

  const std::string mode = vars.getString("field.mode", "color");
  if (!parseRenderMode(mode, p.renderMode)) return fail(outError, "Unknown field.mode: " + mode);

  p.randomness = readFloat(vars, "field.randomness", 1.0);
  p.smoothness = readFloat(vars, "field.smoothness", 0.0);
  p.wValue = readFloat(vars, "field.w", 0.0);
  p.cellSize = cellSizeFromScale(readFloat(vars, "field.cell_size", 128.0),
                                 readFloat(vars, "field.scale_x", 1.0),
                                 readFloat(vars, "field.scale_y", 1.0),
                                 readFloat(vars, "field.scale_w", 100.0));
  p.offset = {readFloat(vars, "field.offset_x", 0.0), readFloat(vars, "field.offset_y", 0.0)};
  p.clampOutput = vars.getBool("field.clamp", false);

  out = p;
  return true;
}

bool resolveDiffParams(const core::CVarRegistry& vars, DiffParams& out, std::string* outError) {
  DiffParams p;

  const std::string axis = vars.getString("diff.axis", "x");
  if (!parseDiffAxis(axis, p.axis)) return fail(outError, "Unknown diff.axis: " + axis);

  const std::string edge = vars.getString("diff.edge_mode", "repeat");
  if (!parseEdgeMode(edge, p.edgeMode)) return fail(outError, "Unknown diff.edge_mode: " + edge);

  const std::string response = vars.getString("diff.response", "clamp");
  if (!parseResponseMode(response, p.responseMode)) return fail(outError, "Unknown diff.response: " + response);

  p.rawOutput = vars.getBool("diff.raw_output", false);
  p.alphaPassthrough = vars.getBool("diff.alpha_passthrough", false);
  p.mapOffset = readFloat(vars, "diff.offset", 0.5);
  p.mapScale = readFloat(vars, "diff.scale", 1.0);

  out = p;
  return true;
}

std::size_t warnUnmatchedVars(const core::CVarRegistry& vars) {
  const std::vector<std::string> names = vars.pendingNames();
  for (const std::string& name : names) {
    CELLFORGE_LOG_WARN("config: unknown variable '" + name + "' ignored");
  }
  return names.size();
}

} // namespace cellforge::tex
