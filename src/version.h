/**
 * @file version.h
 * @brief mvdispatch version information
 */

#pragma once

#include <string>

namespace mvdispatch {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.3.0")
   */
  static std::string String() {
    return std::to_string(Major()) + "." + std::to_string(Minor()) + "." + std::to_string(Patch());
  }

  static int Major() { return 0; }
  static int Minor() { return 3; }
  static int Patch() { return 0; }
};

}  // namespace mvdispatch
