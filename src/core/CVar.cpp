#include "cellforge/core/CVar.h"

#include "cellforge/core/Log.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cellforge::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s.size(), '\0');
  for (std::size_t i = 0; i < s.size(); ++i) out[i] = (char)std::tolower((unsigned char)s[i]);
  return out;
}

static bool parseBool(std::string_view s, bool& out) {
  const std::string k = lowerAscii(trimView(s));
  if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
  if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
  return false;
}

static bool parseInt(std::string_view s, std::int64_t& out) {
  s = trimView(s);
  if (s.empty()) return false;
  std::int64_t v = 0;
  const auto res = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return false;
  out = v;
  return true;
}

static bool parseFloat(std::string_view s, double& out) {
  s = trimView(s);
  if (s.empty()) return false;
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
  out = v;
  return true;
}

static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
  return std::string(s);
}

static std::string quoteIfNeeded(std::string_view s) {
  for (char c : s) {
    if (std::isspace((unsigned char)c) || c == '#' || c == '=') {
      return "\"" + std::string(s) + "\"";
    }
  }
  return std::string(s);
}

// Strip a trailing "# comment" that is not inside quotes.
static std::string_view stripComment(std::string_view s) {
  char quote = '\0';
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (quote) {
      if (c == quote) quote = '\0';
      continue;
    }
    if (c == '"' || c == '\'') quote = c;
    else if (c == '#') return s.substr(0, i);
  }
  return s;
}

const CVar* CVarRegistry::find(std::string_view name) const {
  const auto it = vars_.find(name);
  return it == vars_.end() ? nullptr : &it->second;
}

CVar* CVarRegistry::defineImpl(std::string_view name, CVarType type, CVarValue def,
                               std::uint32_t flags, std::string_view help) {
  if (name.empty()) return nullptr;

  if (auto it = vars_.find(name); it != vars_.end()) {
    return it->second.type == type ? &it->second : nullptr;
  }

  CVar v;
  v.name = std::string(name);
  v.help = std::string(help);
  v.type = type;
  v.flags = flags;
  v.value = def;
  v.defaultValue = std::move(def);

  auto [it, inserted] = vars_.emplace(v.name, std::move(v));
  (void)inserted;

  if (auto pit = pending_.find(name); pit != pending_.end()) {
    const std::string pendingVal = pit->second;
    pending_.erase(pit);
    // A bad pending value leaves the default in place.
    std::string err;
    const std::uint32_t saved = it->second.flags;
    it->second.flags &= ~static_cast<std::uint32_t>(CVar_ReadOnly);
    if (!setFromString(name, pendingVal, &err)) {
      CELLFORGE_LOG_WARN("config: ignoring pending value for " + it->second.name + ": " + err);
    }
    it->second.flags = saved;
  }
  return &it->second;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue, std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Bool, defaultValue, flags, help);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Int, defaultValue, flags, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue, std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::Float, defaultValue, flags, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue, std::uint32_t flags, std::string_view help) {
  return defineImpl(name, CVarType::String, std::move(defaultValue), flags, help);
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  const CVar* v = find(name);
  if (!v || !std::holds_alternative<bool>(v->value)) return fallback;
  return std::get<bool>(v->value);
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  const CVar* v = find(name);
  if (!v || !std::holds_alternative<std::int64_t>(v->value)) return fallback;
  return std::get<std::int64_t>(v->value);
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  const CVar* v = find(name);
  if (!v || !std::holds_alternative<double>(v->value)) return fallback;
  return std::get<double>(v->value);
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  const CVar* v = find(name);
  if (!v || !std::holds_alternative<std::string>(v->value)) return std::string(fallback);
  return std::get<std::string>(v->value);
}

bool CVarRegistry::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  CVar& var = it->second;
  if (var.flags & CVar_ReadOnly) {
    if (outError) *outError = "CVar is read-only: " + var.name;
    return false;
  }

  switch (var.type) {
    case CVarType::Bool: {
      bool b = false;
      if (!parseBool(value, b)) {
        if (outError) *outError = "Expected bool for " + var.name + " (true/false/1/0/on/off)";
        return false;
      }
      var.value = b;
      return true;
    }
    case CVarType::Int: {
      std::int64_t i = 0;
      if (!parseInt(value, i)) {
        if (outError) *outError = "Expected integer for " + var.name;
        return false;
      }
      var.value = i;
      return true;
    }
    case CVarType::Float: {
      double f = 0.0;
      if (!parseFloat(value, f)) {
        if (outError) *outError = "Expected number for " + var.name;
        return false;
      }
      var.value = f;
      return true;
    }
    case CVarType::String:
      var.value = unquote(value);
      return true;
  }
  if (outError) *outError = "Unknown cvar type.";
  return false;
}

bool CVarRegistry::assign(std::string_view assignment, std::string* outError) {
  const std::size_t eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    if (outError) *outError = "Expected name=value, got: " + std::string(assignment);
    return false;
  }
  const std::string_view name = trimView(assignment.substr(0, eq));
  return setFromString(name, trimView(assignment.substr(eq + 1)), outError);
}

bool CVarRegistry::reset(std::string_view name, std::string* outError) {
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown cvar: " + std::string(name);
    return false;
  }
  it->second.value = it->second.defaultValue;
  return true;
}

std::vector<const CVar*> CVarRegistry::list(std::string_view prefix) const {
  std::vector<const CVar*> out;
  out.reserve(vars_.size());
  for (const auto& kv : vars_) {
    if (!prefix.empty() && kv.first.compare(0, prefix.size(), prefix) != 0) continue;
    out.push_back(&kv.second);
  }
  return out;
}

const char* CVarRegistry::typeName(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

std::string CVarRegistry::valueToString(const CVar& v) {
  switch (v.type) {
    case CVarType::Bool:
      return std::get<bool>(v.value) ? "true" : "false";
    case CVarType::Int:
      return std::to_string(std::get<std::int64_t>(v.value));
    case CVarType::Float: {
      std::ostringstream oss;
      oss.precision(9);
      oss << std::get<double>(v.value);
      return oss.str();
    }
    case CVarType::String:
      return std::get<std::string>(v.value);
  }
  return {};
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "Failed to open config file: " + path;
    return false;
  }

  bool hadErrors = false;
  std::ostringstream errs;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;

    const std::string_view sv = trimView(stripComment(line));
    if (sv.empty()) continue;

    const std::size_t eq = sv.find('=');
    if (eq == std::string_view::npos) {
      hadErrors = true;
      errs << path << ":" << lineNo << ": expected name = value\n";
      continue;
    }

    const std::string_view name = trimView(sv.substr(0, eq));
    const std::string_view val = trimView(sv.substr(eq + 1));
    if (name.empty()) continue;

    if (vars_.find(name) == vars_.end()) {
      pending_[std::string(name)] = std::string(val);
      continue;
    }

    std::string err;
    if (!setFromString(name, val, &err)) {
      hadErrors = true;
      errs << path << ":" << lineNo << ": " << err << "\n";
    }
  }

  if (hadErrors && outError) *outError = errs.str();
  return !hadErrors;
}

bool CVarRegistry::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path);
  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }

  out << "# cellforge preset\n\n";
  for (const auto& kv : vars_) {
    const CVar& v = kv.second;
    if ((v.flags & CVar_Archive) == 0u) continue;
    out << v.name << " = ";
    if (v.type == CVarType::String) out << quoteIfNeeded(std::get<std::string>(v.value));
    else out << valueToString(v);
    out << "\n";
  }

  if (!pending_.empty()) {
    out << "\n# Unknown at save time\n";
    for (const auto& kv : pending_) out << kv.first << " = " << kv.second << "\n";
  }

  if (!out) {
    if (outError) *outError = "Failed to write config file: " + path;
    return false;
  }
  return true;
}

std::vector<std::string> CVarRegistry::pendingNames() const {
  std::vector<std::string> out;
  out.reserve(pending_.size());
  for (const auto& kv : pending_) out.push_back(kv.first);
  return out;
}

std::optional<std::string> CVarRegistry::pendingValue(std::string_view name) const {
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

} // namespace cellforge::core
