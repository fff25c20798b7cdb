/**
 * @file config.cpp
 * @brief Configuration parser implementation for mvdispatch
 */

#include "config/config.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <sstream>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "cpu/cpu_level.h"
#include "cpu/level_list.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace mvdispatch::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * Plain scalars become the narrowest JSON type they decode as
 * (integer, number, boolean, string); quoted scalars stay strings.
 */
json YamlToJson(const YAML::Node& yaml_node) {
  if (!yaml_node.IsDefined() || yaml_node.IsNull()) {
    return json();
  }

  if (yaml_node.IsScalar()) {
    if (yaml_node.Tag() == "!") {
      return yaml_node.Scalar();
    }
    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
      return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(yaml_node, double_value)) {
      return double_value;
    }
    bool bool_value = false;
    if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
      return bool_value;
    }
    return yaml_node.Scalar();
  }

  if (yaml_node.IsSequence()) {
    json json_array = json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    json json_object = json::object();
    for (const auto& pair : yaml_node) {
      json_object[pair.first.as<std::string>()] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return json();
}

DispatchConfig ParseDispatchConfig(const YAML::Node& node) {
  DispatchConfig config;

  if (node["levels"]) {
    config.levels = node["levels"].as<std::vector<std::string>>();
  }
  if (node["force_level"]) {
    config.force_level = node["force_level"].as<std::string>();
  }

  return config;
}

LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["json"]) {
    config.json = node["json"].as<bool>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

/**
 * @brief Validate the document against the embedded JSON Schema
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const json& config_json, const std::string& path) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::LogConfigValidation(path, true, "");
    } catch (const std::exception& e) {
      utils::LogConfigValidation(path, false, e.what());
      std::stringstream err_msg;
      err_msg << "Configuration validation failed: " << e.what() << "\n";
      err_msg << "  Allowed sections: dispatch (levels, force_level), logging (level, json, file)\n";
      err_msg << "  Level tags: x86_64, x86_64_v2, x86_64_v3, x86_64_v4, aarch64, aarch64_sve, aarch64_sve2";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str(), path));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("Embedded schema parse error: ") + e.what()));
  }

  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    // An empty document means "all defaults"
    json config_json = root.IsNull() ? json::object() : YamlToJson(root);

    auto validation_result = ValidateConfigSchema(config_json, path);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;
    if (root["dispatch"]) {
      config.dispatch = ParseDispatchConfig(root["dispatch"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigFileNotFound,
                                                  "Failed to open config file: " + std::string(e.what()), path));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what()), path));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what()), path));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate dispatch configuration
  if (!config.dispatch.levels.empty()) {
    auto levels = cpu::LevelList::FromTags(config.dispatch.levels);
    if (!levels) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                    "dispatch.levels is not a valid level list: " +
                                                        levels.error().message(),
                                                    levels.error().context()));
    }
  }
  if (!config.dispatch.force_level.empty() && !cpu::LevelFromTag(config.dispatch.force_level).has_value()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "dispatch.force_level is not a known level (got: " +
                                                      config.dispatch.force_level + ")"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

utils::Expected<void, utils::Error> ApplyLoggingConfig(const LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      spdlog::drop("mvdispatch");
      auto logger = spdlog::basic_logger_mt("mvdispatch", logging.file);
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                    "Cannot open log file: " + std::string(e.what()), logging.file));
    }
  }

  spdlog::set_level(spdlog::level::from_str(logging.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  utils::StructuredLog::SetFormat(logging.json ? utils::LogFormat::JSON : utils::LogFormat::TEXT);
  return {};
}

}  // namespace mvdispatch::config
