/**
 * @file config.h
 * @brief Configuration structures and YAML loader for mvdispatch
 */

#pragma once

#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::config {

// Default values for configuration
namespace defaults {

constexpr const char* kLogLevel = "info";
constexpr bool kLogJson = true;

}  // namespace defaults

/**
 * @brief Variant selection configuration
 */
struct DispatchConfig {
  std::vector<std::string> levels;  ///< Level order, highest first (empty = canonical list of the host)
  std::string force_level;          ///< Level to force, clamped to the detected one (empty = none)
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = defaults::kLogLevel;  ///< Log level: trace, debug, info, warn, error
  bool json = defaults::kLogJson;           ///< Structured events as JSON (false = key=value text)
  std::string file;                         ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  DispatchConfig dispatch;  ///< Variant selection
  LoggingConfig logging;    ///< Logging
};

/**
 * @brief Load configuration from YAML file
 *
 * The document is converted to JSON and checked against the embedded
 * schema, then parsed and semantically validated.
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * Checks what the schema cannot: the level list must be a valid LevelList
 * (single family, strictly descending) and the forced level must be a
 * known tag.
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or kConfigInvalidValue
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

/**
 * @brief Apply logging settings to spdlog and StructuredLog
 *
 * @return kConfigInvalidValue if the log file cannot be opened
 */
utils::Expected<void, utils::Error> ApplyLoggingConfig(const LoggingConfig& logging);

}  // namespace mvdispatch::config
