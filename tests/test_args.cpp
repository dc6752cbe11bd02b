#include "cellforge/core/Args.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static std::vector<char*> makeArgv(std::initializer_list<const char*> items) {
  std::vector<char*> argv;
  argv.reserve(items.size());
  for (const char* s : items) {
    argv.push_back(const_cast<char*>(s));
  }
  return argv;
}

int test_args() {
  int fails = 0;

  using cellforge::core::Args;

  // Typical field invocation: command first, then options.
  {
    auto argv = makeArgv({"cellforge", "field", "--width", "64", "--seed=granite", "--out", "a.png", "--sig"});
    Args args((int)argv.size(), argv.data());

    if (args.program() != "cellforge") {
      std::cerr << "[test_args] expected program name to be kept\n";
      ++fails;
    }
    if (args.positional().size() != 1 || args.positional()[0] != "field") {
      std::cerr << "[test_args] expected 'field' as the only positional arg\n";
      ++fails;
    }
    int width = 0;
    if (!args.getInt("width", width) || width != 64) {
      std::cerr << "[test_args] expected --width 64\n";
      ++fails;
    }
    std::string seed;
    if (!args.getString("seed", seed) || seed != "granite") {
      std::cerr << "[test_args] expected --seed=granite\n";
      ++fails;
    }
    if (!args.hasFlag("sig") || !args.has("out")) {
      std::cerr << "[test_args] expected --sig flag and --out value\n";
      ++fails;
    }
  }

  // Negative numeric values should be accepted as values for --key and not be misread as switches.
  {
    auto argv = makeArgv({"app", "--set", "field.offset_x=-3", "--radius", "-50.5", "--w", "-1e-3"});
    Args args((int)argv.size(), argv.data());

    double radius = 0.0;
    if (!args.getDouble("radius", radius) || std::abs(radius - (-50.5)) > 1e-9) {
      std::cerr << "[test_args] expected --radius -50.5 to parse\n";
      ++fails;
    }
    double w = 0.0;
    if (!args.getDouble("w", w) || std::abs(w - (-1e-3)) > 1e-12) {
      std::cerr << "[test_args] expected --w -1e-3 to parse\n";
      ++fails;
    }
  }

  // Repeated keys keep every value in order; last() returns the final one.
  {
    auto argv = makeArgv({"app", "--set", "a=1", "--set=b=2", "--set", "c=3"});
    Args args((int)argv.size(), argv.data());

    const auto v = args.values("set");
    if (v.size() != 3 || v[0] != "a=1" || v[1] != "b=2" || v[2] != "c=3") {
      std::cerr << "[test_args] expected three --set values in order, got size=" << v.size() << "\n";
      ++fails;
    }
    if (args.last("set").value_or("") != "c=3") {
      std::cerr << "[test_args] expected last --set to be c=3\n";
      ++fails;
    }
  }

  // Typed getters reject partial parses.
  {
    auto argv = makeArgv({"app", "--threads", "4x", "--seed", "0x2A"});
    Args args((int)argv.size(), argv.data());

    int threads = 7;
    if (args.getInt("threads", threads) || threads != 7) {
      std::cerr << "[test_args] expected --threads 4x to be rejected\n";
      ++fails;
    }
    long long seed = 0;
    if (!args.getI64("seed", seed) || seed != 42) {
      std::cerr << "[test_args] expected --seed 0x2A to parse as 42\n";
      ++fails;
    }
  }

  // The end-of-options marker should force everything after it to be positional.
  {
    auto argv = makeArgv({"app", "--flag", "--", "--notAFlag", "-x", "pos"});
    Args args((int)argv.size(), argv.data());

    if (!args.hasFlag("flag")) {
      std::cerr << "[test_args] expected --flag to be recognized\n";
      ++fails;
    }
    if (args.hasFlag("notAFlag") || args.hasFlag("x")) {
      std::cerr << "[test_args] expected tokens after -- to NOT be parsed as flags\n";
      ++fails;
    }
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "--notAFlag" || pos[1] != "-x" || pos[2] != "pos") {
      std::cerr << "[test_args] expected 3 positional args after --, got size=" << pos.size() << "\n";
      ++fails;
    }
  }

  // A single '-' token is a value, not an option introducer.
  {
    auto argv = makeArgv({"app", "--out", "-"});
    Args args((int)argv.size(), argv.data());

    if (args.hasFlag("out")) {
      std::cerr << "[test_args] expected --out - to be parsed as a key/value, not a flag\n";
      ++fails;
    }
    const auto v = args.last("out");
    if (!v || *v != "-") {
      std::cerr << "[test_args] expected --out to have value '-'\n";
      ++fails;
    }
  }

  // Negative numbers that appear as positional args should stay positional (not become short flags).
  {
    auto argv = makeArgv({"app", "-1", "-0.25", "-.5"});
    Args args((int)argv.size(), argv.data());
    const auto& pos = args.positional();
    if (pos.size() != 3 || pos[0] != "-1" || pos[1] != "-0.25" || pos[2] != "-.5") {
      std::cerr << "[test_args] expected negative positional args to remain positional\n";
      ++fails;
    }
  }

  // Short flag parsing should still work.
  {
    auto argv = makeArgv({"app", "-hv"});
    Args args((int)argv.size(), argv.data());
    if (!args.hasFlag("h") || !args.hasFlag("v")) {
      std::cerr << "[test_args] expected -hv to set flags h and v\n";
      ++fails;
    }
  }

  // Number detection.
  {
    if (!Args::looksLikeNumber("-2.0E+4") || !Args::looksLikeNumber(".5") || Args::looksLikeNumber("-e5") ||
        Args::looksLikeNumber("1e") || Args::looksLikeNumber("--")) {
      std::cerr << "[test_args] looksLikeNumber misclassified a token\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_args] pass\n";
  return fails;
}
