#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cellforge::core {

// Tiny argument parser for the command-line tool.
//
// Supports:
//  - Flags:         --flag   -h
//  - KV args:       --key value   --key=value
//  - Repeated keys: --set a=1 --set b=2   (values() returns both, last() the final one)
//  - Positional:    everything else, and everything after "--"
//
// A token that looks like a number ("-1", "-0.5") is a value, never a switch.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.push_back(std::string(argv[j]));
        }
        break;
      }

      if (a.size() > 2 && a[0] == '-' && a[1] == '-') {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        if (i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].push_back(std::string(argv[++i]));
        } else {
          flags_.push_back(key);
        }
        continue;
      }

      if (a.size() >= 2 && a[0] == '-' && !looksLikeNumber(a.c_str())) {
        // Grouped short flags: -vh == -v -h
        for (std::size_t j = 1; j < a.size(); ++j) {
          if (std::isalnum((unsigned char)a[j])) flags_.push_back(std::string(1, a[j]));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // Typed helpers: true if the key was given and its whole value parsed.
  bool getI64(std::string_view key, long long& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const long long val = std::strtoll(v->c_str(), &end, 0);
    if (!end || *end != '\0') return false;
    out = val;
    return true;
  }

  bool getInt(std::string_view key, int& out) const {
    long long v = 0;
    if (!getI64(key, v)) return false;
    out = static_cast<int>(v);
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const double val = std::strtod(v->c_str(), &end);
    if (!end || *end != '\0') return false;
    out = val;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

  // Accepts -1, -0.25, -.5, 1e-3, -2.0E+4.
  static bool looksLikeNumber(const char* s) {
    if (!s || !*s) return false;

    int i = 0;
    if (s[i] == '+' || s[i] == '-') ++i;
    if (!s[i]) return false;

    bool anyDigit = false;
    bool anyDot = false;
    for (; s[i]; ++i) {
      const unsigned char c = (unsigned char)s[i];
      if (std::isdigit(c)) {
        anyDigit = true;
        continue;
      }
      if (c == '.' && !anyDot) {
        anyDot = true;
        continue;
      }
      if ((c == 'e' || c == 'E') && anyDigit) {
        ++i;
        if (s[i] == '+' || s[i] == '-') ++i;
        bool expDigit = false;
        for (; s[i]; ++i) {
          if (!std::isdigit((unsigned char)s[i])) return false;
          expDigit = true;
        }
        return expDigit;
      }
      return false;
    }
    return anyDigit;
  }

private:
  static bool isSwitch(const char* s) {
    if (!s || s[0] != '-' || s[1] == '\0') return false;
    return !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace cellforge::core
