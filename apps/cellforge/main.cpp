#include "ImageFile.h"

#include "cellforge/core/Args.h"
#include "cellforge/core/CVar.h"
#include "cellforge/core/JobSystem.h"
#include "cellforge/core/Log.h"
#include "cellforge/tex/DifferentialExtractor.h"
#include "cellforge/tex/FieldGenerator.h"
#include "cellforge/tex/KernelConfig.h"
#include "cellforge/tex/RasterExecutor.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace cellforge;

static void printHelp() {
  std::cout << "cellforge <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  field                  Render a cellular field\n"
            << "  diff                   Render a differential map of --in (or of a field if no --in)\n"
            << "\n"
            << "Output:\n"
            << "  --out <path>           Output image (.png = RGBA8, .hdr = float RGB >= 0)\n"
            << "  --sig                  Print a stable signature of the rendered buffer\n"
            << "\n"
            << "Input:\n"
            << "  --in <path>            Source image for 'diff'\n"
            << "  --alpha <path>         Image whose alpha masks a 'field' render (same size)\n"
            << "\n"
            << "Parameters:\n"
            << "  --width <px>           Shortcut for field.width (default: 512)\n"
            << "  --height <px>          Shortcut for field.height (default: 512)\n"
            << "  --seed <n|text>        Shortcut for field.seed (default: 0)\n"
            << "  --config <path>        Load a preset (name = value lines)\n"
            << "  --set <name=value>     Override one variable (repeatable)\n"
            << "  --save-config <path>   Write the resolved variables as a preset\n"
            << "  --list                 Print every variable and exit\n"
            << "\n"
            << "Execution:\n"
            << "  --threads <n>          Worker threads (default: 1 = serial, 0 = all cores)\n"
            << "  --verbose, -v          Debug logging\n"
            << "  --log <level>          trace | debug | info | warn | error | off\n"
            << "  --help, -h             This text\n";
}

static void printVars(const core::CVarRegistry& vars) {
  for (const core::CVar* v : vars.list()) {
    std::cout << std::left << std::setw(24) << v->name
              << std::setw(8) << core::CVarRegistry::typeName(v->type)
              << std::setw(14) << core::CVarRegistry::valueToString(*v);
    if (!v->help.empty()) std::cout << "  " << v->help;
    std::cout << "\n";
  }
}

static std::string hex64(core::u64 v) {
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

// Config file first, then the shortcut options, then --set in command-line order.
static bool applyConfig(const core::Args& args, core::CVarRegistry& vars) {
  std::string err;

  std::string configPath;
  if (args.getString("config", configPath)) {
    if (!vars.loadFile(configPath, &err)) {
      std::cerr << err;
      if (!err.empty() && err.back() != '\n') std::cerr << "\n";
      return false;
    }
    CELLFORGE_LOG_DEBUG("config: loaded " + configPath);
  }

  static const char* kShortcuts[][2] = {
    {"width", "field.width"},
    {"height", "field.height"},
    {"seed", "field.seed"},
  };
  for (const auto& s : kShortcuts) {
    std::string value;
    if (!args.getString(s[0], value)) continue;
    if (!vars.setFromString(s[1], value, &err)) {
      std::cerr << "Invalid --" << s[0] << ": " << err << "\n";
      return false;
    }
  }

  for (const std::string& a : args.values("set")) {
    if (!vars.assign(a, &err)) {
      std::cerr << "Invalid --set: " << err << "\n";
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args(argc, argv);

  if (args.has("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  if (args.has("verbose") || args.hasFlag("v")) core::setLogLevel(core::LogLevel::Debug);
  {
    std::string lvl;
    if (args.getString("log", lvl)) {
      core::LogLevel level = core::LogLevel::Info;
      if (!core::parseLogLevel(lvl, level)) {
        std::cerr << "Invalid --log: '" << lvl << "'\n";
        return 2;
      }
      core::setLogLevel(level);
    }
  }

  core::CVarRegistry vars;
  tex::defineFieldVars(vars);
  tex::defineDiffVars(vars);

  if (!applyConfig(args, vars)) return 2;
  tex::warnUnmatchedVars(vars);

  if (args.has("list")) {
    printVars(vars);
    return 0;
  }

  {
    std::string savePath;
    if (args.getString("save-config", savePath)) {
      std::string err;
      if (!vars.saveFile(savePath, &err)) {
        std::cerr << err << "\n";
        return 1;
      }
      CELLFORGE_LOG_INFO("Saved preset: " + savePath);
    }
  }

  const std::vector<std::string>& pos = args.positional();
  if (pos.empty()) {
    if (args.has("save-config")) return 0;
    printHelp();
    return 2;
  }
  const std::string& command = pos.front();
  if (command != "field" && command != "diff") {
    std::cerr << "Unknown command: '" << command << "'\n";
    return 2;
  }

  std::string outPath;
  if (!args.getString("out", outPath) || outPath.empty()) {
    std::cerr << "Missing --out <path>\n";
    return 2;
  }

  std::string err;
  tex::FieldParams fieldParams;
  if (!tex::resolveFieldParams(vars, fieldParams, &err)) {
    std::cerr << err << "\n";
    return 2;
  }

  int threads = 1;
  if (args.has("threads") && (!args.getInt("threads", threads) || threads < 0)) {
    std::cerr << "Invalid --threads\n";
    return 2;
  }

  std::unique_ptr<core::JobSystem> jobs;
  std::unique_ptr<tex::JobExecutor> jobExec;
  tex::RasterExecutor* exec = &tex::serialExecutor();
  if (threads != 1) {
    jobs = std::make_unique<core::JobSystem>((std::size_t)threads);
    jobExec = std::make_unique<tex::JobExecutor>(*jobs);
    exec = jobExec.get();
    CELLFORGE_LOG_DEBUG("Using " + std::to_string(jobs->threadCount()) + " worker threads");
  }

  tex::PixelBuffer result;

  if (command == "field") {
    tex::PixelBuffer alpha;
    std::string alphaPath;
    const bool useAlpha = args.getString("alpha", alphaPath);
    if (useAlpha && !app::readImage(alphaPath, alpha, &err)) {
      std::cerr << err << "\n";
      return 1;
    }

    if (!tex::generateField(fieldParams, result, &err, exec, useAlpha ? &alpha : nullptr)) {
      std::cerr << err << "\n";
      return 2;
    }
  } else {
    tex::DiffParams diffParams;
    if (!tex::resolveDiffParams(vars, diffParams, &err)) {
      std::cerr << err << "\n";
      return 2;
    }

    tex::PixelBuffer source;
    std::string inPath;
    if (args.getString("in", inPath)) {
      if (!app::readImage(inPath, source, &err)) {
        std::cerr << err << "\n";
        return 1;
      }
    } else if (!tex::generateField(fieldParams, source, &err, exec)) {
      std::cerr << err << "\n";
      return 2;
    }

    if (diffParams.rawOutput && !app::isFloatFormat(app::formatFromPath(outPath))) {
      CELLFORGE_LOG_WARN("diff.raw_output ignored: " + outPath + " is quantised to 8 bits");
      diffParams.rawOutput = false;
    }

    if (!tex::extractDifferential(source, diffParams, result, &err, exec)) {
      std::cerr << err << "\n";
      return 2;
    }
  }

  if (!app::writeImage(outPath, result, &err)) {
    std::cerr << err << "\n";
    return 1;
  }
  CELLFORGE_LOG_INFO("Wrote " + outPath + " (" + std::to_string(result.width) + "x" +
                     std::to_string(result.height) + ")");

  if (args.has("sig")) {
    std::cout << "signature " << hex64(tex::signature(result)) << "\n";
  }
  return 0;
}
