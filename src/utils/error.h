/**
 * @file error.h
 * @brief Error codes and error type used across mvdispatch
 *
 * Errors are values: every fallible operation returns
 * Expected<T, Error> (see utils/expected.h) instead of throwing.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace mvdispatch::utils {

/**
 * @brief Error codes grouped by subsystem
 *
 * Ranges:
 * - 0-999: general
 * - 1000-1999: configuration
 * - 2000-2999: CPU taxonomy and feature probing
 * - 3000-3999: dispatch (symbols, level lists, resolution)
 */
enum class ErrorCode : std::uint16_t {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigYamlError = 1002,
  kConfigValidationError = 1003,
  kConfigInvalidValue = 1004,

  // CPU
  kCpuUnknownLevel = 2000,
  kCpuUnknownArchitecture = 2001,
  kCpuProbeUnsupported = 2002,
  kCpuProbeFailed = 2003,

  // Dispatch
  kDispatchEmptyLevelList = 3000,
  kDispatchInvalidLevelList = 3001,
  kDispatchSymbolNotFound = 3002,
  kDispatchModuleNotFound = 3003,
  kDispatchInvalidSymbolName = 3004,
};

/**
 * @brief Get a stable name for an error code (e.g. "kConfigInvalidValue")
 */
inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "kSuccess";
    case ErrorCode::kUnknown:
      return "kUnknown";
    case ErrorCode::kInvalidArgument:
      return "kInvalidArgument";
    case ErrorCode::kConfigFileNotFound:
      return "kConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "kConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "kConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "kConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "kConfigInvalidValue";
    case ErrorCode::kCpuUnknownLevel:
      return "kCpuUnknownLevel";
    case ErrorCode::kCpuUnknownArchitecture:
      return "kCpuUnknownArchitecture";
    case ErrorCode::kCpuProbeUnsupported:
      return "kCpuProbeUnsupported";
    case ErrorCode::kCpuProbeFailed:
      return "kCpuProbeFailed";
    case ErrorCode::kDispatchEmptyLevelList:
      return "kDispatchEmptyLevelList";
    case ErrorCode::kDispatchInvalidLevelList:
      return "kDispatchInvalidLevelList";
    case ErrorCode::kDispatchSymbolNotFound:
      return "kDispatchSymbolNotFound";
    case ErrorCode::kDispatchModuleNotFound:
      return "kDispatchModuleNotFound";
    case ErrorCode::kDispatchInvalidSymbolName:
      return "kDispatchInvalidSymbolName";
  }
  return "kUnknown";
}

/**
 * @brief Error value: code, human-readable message and optional context
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code, std::string message = "", std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  /**
   * @brief Format as "[kCode] message (context)"
   */
  std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeName(code_);
    result += "]";
    if (!message_.empty()) {
      result += " " + message_;
    }
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an Error
 *
 * @param code Error code
 * @param message Human-readable message
 * @param context Optional context (operation, key, path...)
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace mvdispatch::utils
