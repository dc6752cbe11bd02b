#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cellforge::core {

// Config variables ("CVars"): named, typed settings with defaults.
//
// The command-line tool defines one CVar per kernel parameter ("field.seed",
// "diff.edge_mode", ...), loads an optional preset file on top, then applies
// --set overrides. Iteration order is name-sorted so listings and saved presets
// are stable.
//
// Not synchronized: configure before rendering starts.

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

enum CVarFlags : std::uint32_t {
  CVar_None     = 0u,
  CVar_Archive  = 1u << 0, // written by saveFile()
  CVar_ReadOnly = 1u << 1  // rejects set*() after definition
};

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  std::uint32_t flags{CVar_None};

  CVarValue value{};
  CVarValue defaultValue{};
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Idempotent for the same type; returns nullptr if the name exists with another type.
  // A pending assignment from an earlier loadFile() is applied on definition.
  CVar* defineBool(std::string_view name, bool defaultValue,
                   std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue,
                  std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue,
                    std::uint32_t flags = CVar_Archive, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue,
                     std::uint32_t flags = CVar_Archive, std::string_view help = {});

  bool         getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double       getFloat(std::string_view name, double fallback = 0.0) const;
  std::string  getString(std::string_view name, std::string_view fallback = {}) const;

  // Parse `value` according to the variable's type. Strings may be quoted.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);

  // Parse "name=value" (the --set syntax).
  bool assign(std::string_view assignment, std::string* outError = nullptr);

  bool reset(std::string_view name, std::string* outError = nullptr);

  std::vector<const CVar*> list(std::string_view prefix = {}) const;

  static const char* typeName(CVarType t);
  static std::string valueToString(const CVar& v);

  // Preset file format:
  //   # comment
  //   field.seed      = 42
  //   field.metric    = manhattan   # trailing comment
  //   diff.raw_output = false
  //
  // Unknown names are kept as pending assignments until defined.
  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const { return pending_.find(name) != pending_.end(); }
  std::optional<std::string> pendingValue(std::string_view name) const;
  // Names still waiting for a definition, sorted.
  std::vector<std::string> pendingNames() const;

private:
  CVar* defineImpl(std::string_view name, CVarType type, CVarValue def,
                   std::uint32_t flags, std::string_view help);

  std::map<std::string, CVar, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

} // namespace cellforge::core
