/**
 * @file main.cpp
 * @brief Entry point for mvdispatch-info
 *
 * Prints what the dispatcher sees on this machine: architecture family,
 * probed features, detected level, and which level (and symbol) a function
 * would resolve to for a given level list.
 */

#include <spdlog/spdlog.h>

#include <cstddef>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "config/config.h"
#include "cpu/compile_time_level.h"
#include "cpu/cpu_detector.h"
#include "cpu/level_list.h"
#include "dispatch/resolver.h"
#include "dispatch/symbol_name.h"
#include "version.h"

namespace {

using mvdispatch::cpu::CpuLevel;

constexpr const char* kDefaultFunction = "fn";

std::vector<std::string> SplitTags(const std::string& list) {
  std::vector<std::string> tags;
  std::stringstream stream(list);
  std::string tag;
  while (std::getline(stream, tag, ',')) {
    if (!tag.empty()) {
      tags.push_back(tag);
    }
  }
  return tags;
}

std::vector<std::string> FeatureNames(const mvdispatch::cpu::FeatureSet& features) {
  std::vector<std::string> names;
  for (std::size_t i = 0; i < mvdispatch::cpu::kFeatureCount; ++i) {
    auto feature = static_cast<mvdispatch::cpu::Feature>(i);
    if (features.Has(feature)) {
      names.emplace_back(mvdispatch::cpu::FeatureName(feature));
    }
  }
  return names;
}

/**
 * @brief Everything the report prints
 */
struct Report {
  std::string family;
  std::vector<std::string> features;
  std::string detected;
  std::string forced;
  bool probe_failed = false;
  std::string compile_time;
  std::string function;
  std::vector<CpuLevel> levels;
  CpuLevel selected = CpuLevel::kX86_64;
};

void PrintText(const Report& report) {
  std::cout << "mvdispatch " << mvdispatch::Version::String() << "\n";
  std::cout << "  family:             " << report.family << "\n";
  std::cout << "  features:          ";
  for (const auto& feature : report.features) {
    std::cout << " " << feature;
  }
  std::cout << "\n";
  std::cout << "  detected level:     " << report.detected << (report.probe_failed ? " (probe failed)" : "") << "\n";
  std::cout << "  forced level:       " << (report.forced.empty() ? "none" : report.forced) << "\n";
  std::cout << "  compile-time level: " << report.compile_time << "\n";
  std::cout << "\n";
  std::cout << "Symbols for '" << report.function << "' (highest first):\n";
  for (CpuLevel level : report.levels) {
    const char* marker = level == report.selected ? "  * " : "    ";
    std::cout << marker << mvdispatch::dispatch::SymbolName(level, report.function) << "\n";
  }
}

void PrintJson(const Report& report) {
  nlohmann::json symbols = nlohmann::json::array();
  for (CpuLevel level : report.levels) {
    symbols.push_back({{"level", std::string(mvdispatch::cpu::LevelTag(level))},
                       {"symbol", mvdispatch::dispatch::SymbolName(level, report.function)},
                       {"selected", level == report.selected}});
  }

  nlohmann::json output = {
      {"version", mvdispatch::Version::String()},
      {"family", report.family},
      {"features", report.features},
      {"detected_level", report.detected},
      {"forced_level", report.forced.empty() ? nlohmann::json(nullptr) : nlohmann::json(report.forced)},
      {"probe_failed", report.probe_failed},
      {"compile_time_level", report.compile_time},
      {"function", report.function},
      {"selected_level", std::string(mvdispatch::cpu::LevelTag(report.selected))},
      {"symbols", symbols},
  };
  std::cout << output.dump(2) << "\n";
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  // Keep stdout for the report; detection events only when asked for
  spdlog::set_level(spdlog::level::warn);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  bool json_output = false;
  const char* config_path = nullptr;
  std::string function = kDefaultFunction;
  std::string levels_arg;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      std::cout << "Usage: " << argv[0] << " [OPTIONS]\n";
      std::cout << "\n";
      std::cout << "Options:\n";
      std::cout << "  -c, --config <file>            Configuration file path\n";
      std::cout << "  -t, --config-test              Test configuration file and exit\n";
      std::cout << "  -f, --function <name>          Function to show symbols for (default: " << kDefaultFunction
                << ")\n";
      std::cout << "  -l, --levels <tag,tag,...>     Level list, highest first (default: config or canonical)\n";
      std::cout << "  -j, --json                     JSON output\n";
      std::cout << "  -h, --help                     Show this help message\n";
      std::cout << "  -v, --version                  Show version information\n";
      std::cout << "\n";
      std::cout << "Environment:\n";
      std::cout << "  " << mvdispatch::cpu::kForceLevelEnvVar << "=<tag>    Force a (lower) level\n";
      std::cout << "\n";
      std::cout << "Example:\n";
      std::cout << "  " << argv[0] << " -f dot -l x86_64_v3,x86_64\n";
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "mvdispatch version " << mvdispatch::Version::String() << "\n";
      std::cout << "CPU multiversioning: per-level builds with runtime variant selection\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-j" || arg == "--json") {
      json_output = true;
    } else if (arg == "-c" || arg == "--config" || arg == "-f" || arg == "--function" || arg == "-l" ||
               arg == "--levels") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return 1;
      }
      const char* value = argv[++i];
      if (arg == "-c" || arg == "--config") {
        config_path = value;
      } else if (arg == "-f" || arg == "--function") {
        function = value;
      } else {
        levels_arg = value;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (!mvdispatch::dispatch::IsValidFunctionName(function)) {
    std::cerr << "Error: '" << function << "' is not a valid function name\n";
    return 1;
  }

  // Load configuration
  mvdispatch::config::Config config;
  if (config_path != nullptr) {
    auto config_result = mvdispatch::config::LoadConfig(config_path);
    if (!config_result) {
      std::cerr << "Failed to load config: " << config_result.error().to_string() << "\n";
      return 1;
    }
    config = *config_result;

    if (config_test_mode) {
      std::cout << "Configuration file is valid\n";
      std::cout << "\nConfiguration summary:\n";
      std::cout << "  Dispatch:\n";
      std::cout << "    levels: ";
      if (config.dispatch.levels.empty()) {
        std::cout << "(canonical)";
      }
      for (size_t i = 0; i < config.dispatch.levels.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << config.dispatch.levels[i];
      }
      std::cout << "\n";
      std::cout << "    force_level: " << (config.dispatch.force_level.empty() ? "none" : config.dispatch.force_level)
                << "\n";
      std::cout << "  Logging:\n";
      std::cout << "    level: " << config.logging.level << "\n";
      std::cout << "    json: " << (config.logging.json ? "true" : "false") << "\n";
      std::cout << "    file: " << (config.logging.file.empty() ? "(stderr)" : config.logging.file) << "\n";
      return 0;
    }

    auto logging_result = mvdispatch::config::ApplyLoggingConfig(config.logging);
    if (!logging_result) {
      std::cerr << "Failed to apply logging config: " << logging_result.error().to_string() << "\n";
      return 1;
    }
  } else if (config_test_mode) {
    std::cerr << "Error: --config-test requires -c <file>\n";
    return 1;
  }

  mvdispatch::cpu::CpuDetector detector(mvdispatch::cpu::ForceLevelSetting(config.dispatch.force_level));
  const CpuLevel detected = detector.Detect();

  // Level list: command line, then config, then the canonical list of the host
  std::vector<std::string> tags = levels_arg.empty() ? config.dispatch.levels : SplitTags(levels_arg);
  std::vector<CpuLevel> levels = mvdispatch::cpu::LevelList::Canonical(detector.Family()).Levels();
  if (!tags.empty()) {
    auto level_list = mvdispatch::cpu::LevelList::FromTags(tags);
    if (!level_list) {
      std::cerr << "Error: " << level_list.error().to_string() << "\n";
      return 1;
    }
    levels = level_list->Levels();
  }

  auto selected = mvdispatch::dispatch::SelectLevel(levels, detected);
  if (!selected) {
    std::cerr << "Error: " << selected.error().to_string() << "\n";
    return 1;
  }

  Report report;
  report.family = std::string(mvdispatch::cpu::FamilyName(detector.Family()));
  report.features = FeatureNames(detector.Features());
  report.detected = std::string(mvdispatch::cpu::LevelTag(detected));
  if (detector.ForcedLevel().has_value()) {
    report.forced = std::string(mvdispatch::cpu::LevelTag(*detector.ForcedLevel()));
  }
  report.probe_failed = detector.ProbeFailed();
  report.compile_time = std::string(mvdispatch::cpu::LevelTag(mvdispatch::cpu::CompileTimeLevel()));
  report.function = function;
  report.levels = levels;
  report.selected = *selected;

  if (json_output) {
    PrintJson(report);
  } else {
    PrintText(report);
  }
  return 0;
}
