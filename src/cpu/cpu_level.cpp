/**
 * @file cpu_level.cpp
 * @brief Level tag parsing and family fallback
 */

#include "cpu/cpu_level.h"

#include <mutex>

#include "utils/structured_log.h"

namespace mvdispatch::cpu {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<CpuLevel, Error> ParseLevel(std::string_view tag) {
  auto level = LevelFromTag(tag);
  if (!level.has_value()) {
    return MakeUnexpected(MakeError(ErrorCode::kCpuUnknownLevel, "Unknown CPU level tag: '" + std::string(tag) + "'",
                                    "expected one of x86_64, x86_64_v2, x86_64_v3, x86_64_v4, aarch64, "
                                    "aarch64_sve, aarch64_sve2"));
  }
  return *level;
}

ArchFamily EffectiveFamily(ArchFamily family) {
  if (family != ArchFamily::kUnknown) {
    return family;
  }
  static std::once_flag warned;
  std::call_once(warned, []() { utils::LogUnknownArchitecture(std::string(FamilyName(kDefaultFamily))); });
  return kDefaultFamily;
}

}  // namespace mvdispatch::cpu
