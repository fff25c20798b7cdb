/**
 * @file config_test.cpp
 * @brief Unit tests for configuration parser
 */

#include "config/config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "utils/structured_log.h"

using namespace mvdispatch::config;
using mvdispatch::utils::ErrorCode;

namespace {

void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream ofs(path);
  ofs << content;
}

}  // namespace

/**
 * @brief Test loading valid configuration file
 */
TEST(ConfigTest, LoadValidConfig) {
  auto config_result = LoadConfig("test_config.yaml");
  ASSERT_TRUE(config_result) << "Failed to load config: " << config_result.error().message();
  Config config = *config_result;

  // Dispatch config
  ASSERT_EQ(config.dispatch.levels.size(), 3);
  EXPECT_EQ(config.dispatch.levels[0], "x86_64_v3");
  EXPECT_EQ(config.dispatch.levels[1], "x86_64_v2");
  EXPECT_EQ(config.dispatch.levels[2], "x86_64");
  EXPECT_EQ(config.dispatch.force_level, "x86_64_v2");

  // Logging config
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_FALSE(config.logging.json);
  EXPECT_EQ(config.logging.file, "/tmp/mvdispatch_test.log");
}

/**
 * @brief Test loading non-existent file
 */
TEST(ConfigTest, LoadNonExistentFile) {
  auto config_result = LoadConfig("non_existent_file.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigFileNotFound);
  EXPECT_EQ(config_result.error().context(), "non_existent_file.yaml");
}

/**
 * @brief Test loading empty file (all defaults)
 */
TEST(ConfigTest, LoadEmptyConfig) {
  WriteFile("empty_test_config.yaml", "");

  auto config_result = LoadConfig("empty_test_config.yaml");
  ASSERT_TRUE(config_result) << config_result.error().to_string();
  EXPECT_TRUE(config_result->dispatch.levels.empty());
  EXPECT_TRUE(config_result->dispatch.force_level.empty());
  EXPECT_EQ(config_result->logging.level, "info");
  EXPECT_TRUE(config_result->logging.json);

  std::remove("empty_test_config.yaml");
}

/**
 * @brief Test loading minimal configuration
 */
TEST(ConfigTest, LoadMinimalConfig) {
  WriteFile("minimal_test_config.yaml",
            "dispatch:\n"
            "  levels: [aarch64_sve, aarch64]\n");

  auto config_result = LoadConfig("minimal_test_config.yaml");
  ASSERT_TRUE(config_result) << config_result.error().to_string();
  ASSERT_EQ(config_result->dispatch.levels.size(), 2);
  EXPECT_EQ(config_result->dispatch.levels[0], "aarch64_sve");
  EXPECT_EQ(config_result->logging.level, defaults::kLogLevel);

  std::remove("minimal_test_config.yaml");
}

/**
 * @brief Test that malformed YAML is reported as a YAML error
 */
TEST(ConfigTest, LoadInvalidYAML) {
  WriteFile("invalid_test_config.yaml",
            "dispatch:\n"
            "  levels: [x86_64_v3, x86_64\n");

  auto config_result = LoadConfig("invalid_test_config.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigYamlError);

  std::remove("invalid_test_config.yaml");
}

// ============================================================================
// Schema validation
// ============================================================================

TEST(ConfigTest, SchemaRejectsUnknownSection) {
  WriteFile("unknown_section_config.yaml",
            "server:\n"
            "  port: 8080\n");

  auto config_result = LoadConfig("unknown_section_config.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigValidationError);

  std::remove("unknown_section_config.yaml");
}

TEST(ConfigTest, SchemaRejectsUnknownLevelTag) {
  WriteFile("unknown_level_config.yaml",
            "dispatch:\n"
            "  levels: [x86_64_v5, x86_64]\n");

  auto config_result = LoadConfig("unknown_level_config.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigValidationError);

  std::remove("unknown_level_config.yaml");
}

TEST(ConfigTest, SchemaRejectsWrongType) {
  WriteFile("wrong_type_config.yaml",
            "logging:\n"
            "  json: 3\n");

  auto config_result = LoadConfig("wrong_type_config.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigValidationError);

  std::remove("wrong_type_config.yaml");
}

// ============================================================================
// Semantic validation
// ============================================================================

TEST(ConfigTest, RejectsMixedFamilyLevels) {
  WriteFile("mixed_family_config.yaml",
            "dispatch:\n"
            "  levels: [x86_64_v3, aarch64]\n");

  auto config_result = LoadConfig("mixed_family_config.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigInvalidValue);

  std::remove("mixed_family_config.yaml");
}

TEST(ConfigTest, RejectsAscendingLevels) {
  WriteFile("ascending_config.yaml",
            "dispatch:\n"
            "  levels: [x86_64, x86_64_v3]\n");

  auto config_result = LoadConfig("ascending_config.yaml");
  ASSERT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), ErrorCode::kConfigInvalidValue);
  EXPECT_NE(config_result.error().message().find("dispatch.levels"), std::string::npos);

  std::remove("ascending_config.yaml");
}

/**
 * @brief Test validation of directly constructed configs
 */
TEST(ConfigTest, ValidateConfig) {
  Config config;
  EXPECT_TRUE(ValidateConfig(config));

  config.dispatch.levels = {"x86_64_v4", "x86_64"};
  config.dispatch.force_level = "x86_64";
  EXPECT_TRUE(ValidateConfig(config));

  config.dispatch.force_level = "pentium";
  auto bad_force = ValidateConfig(config);
  ASSERT_FALSE(bad_force);
  EXPECT_EQ(bad_force.error().code(), ErrorCode::kConfigInvalidValue);

  config.dispatch.force_level.clear();
  config.logging.level = "verbose";
  auto bad_log_level = ValidateConfig(config);
  ASSERT_FALSE(bad_log_level);
  EXPECT_EQ(bad_log_level.error().code(), ErrorCode::kConfigInvalidValue);
}

/**
 * @brief Test default values
 */
TEST(ConfigTest, DefaultValues) {
  Config config;

  EXPECT_TRUE(config.dispatch.levels.empty());
  EXPECT_TRUE(config.dispatch.force_level.empty());
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.json);
  EXPECT_TRUE(config.logging.file.empty());
}

// ============================================================================
// Logging
// ============================================================================

TEST(ConfigTest, ApplyLoggingConfigSetsFormat) {
  using mvdispatch::utils::LogFormat;
  using mvdispatch::utils::StructuredLog;

  LoggingConfig logging;
  logging.level = "warn";
  logging.json = false;
  ASSERT_TRUE(ApplyLoggingConfig(logging));
  EXPECT_EQ(StructuredLog::GetFormat(), LogFormat::TEXT);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

  logging.level = "info";
  logging.json = true;
  ASSERT_TRUE(ApplyLoggingConfig(logging));
  EXPECT_EQ(StructuredLog::GetFormat(), LogFormat::JSON);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}

TEST(ConfigTest, ApplyLoggingConfigBadFile) {
  LoggingConfig logging;
  // A regular file cannot be a log directory
  logging.file = "test_config.yaml/mvdispatch.log";

  auto result = ApplyLoggingConfig(logging);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kConfigInvalidValue);
  EXPECT_EQ(result.error().context(), logging.file);
}
