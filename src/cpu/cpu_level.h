/**
 * @file cpu_level.h
 * @brief CPU capability levels, their families, ordering and feature requirements
 *
 * A level names a microarchitecture capability tier (x86-64-v3, SVE2...).
 * Levels belong to exactly one architecture family and are totally ordered
 * inside it; levels of different families are never comparable.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "cpu/feature_set.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::cpu {

/**
 * @brief Architecture family of a level
 */
enum class ArchFamily : std::uint8_t {
  kX86_64,
  kAarch64,
  kUnknown,
};

/**
 * @brief CPU capability level
 */
enum class CpuLevel : std::uint8_t {
  kX86_64,      ///< x86-64 baseline (SSE2)
  kX86_64V2,    ///< x86-64-v2 (SSE4.2, POPCNT)
  kX86_64V3,    ///< x86-64-v3 (AVX2, FMA, BMI)
  kX86_64V4,    ///< x86-64-v4 (AVX-512)
  kAarch64,     ///< ARMv8-A baseline (FP, Advanced SIMD)
  kAarch64Sve,  ///< SVE
  kAarch64Sve2, ///< SVE2
};

/// Family used when the build architecture is not in the taxonomy
constexpr ArchFamily kDefaultFamily = ArchFamily::kX86_64;

constexpr std::array<CpuLevel, 7> kAllLevels = {
    CpuLevel::kX86_64,  CpuLevel::kX86_64V2,    CpuLevel::kX86_64V3,     CpuLevel::kX86_64V4,
    CpuLevel::kAarch64, CpuLevel::kAarch64Sve, CpuLevel::kAarch64Sve2,
};

/// Canonical x86_64 order, highest first
constexpr std::array<CpuLevel, 4> kX86_64Levels = {
    CpuLevel::kX86_64V4,
    CpuLevel::kX86_64V3,
    CpuLevel::kX86_64V2,
    CpuLevel::kX86_64,
};

/// Canonical aarch64 order, highest first
constexpr std::array<CpuLevel, 3> kAarch64Levels = {
    CpuLevel::kAarch64Sve2,
    CpuLevel::kAarch64Sve,
    CpuLevel::kAarch64,
};

/**
 * @brief Canonical tag, used verbatim in exported symbol names
 */
constexpr std::string_view LevelTag(CpuLevel level) {
  switch (level) {
    case CpuLevel::kX86_64:
      return "x86_64";
    case CpuLevel::kX86_64V2:
      return "x86_64_v2";
    case CpuLevel::kX86_64V3:
      return "x86_64_v3";
    case CpuLevel::kX86_64V4:
      return "x86_64_v4";
    case CpuLevel::kAarch64:
      return "aarch64";
    case CpuLevel::kAarch64Sve:
      return "aarch64_sve";
    case CpuLevel::kAarch64Sve2:
      return "aarch64_sve2";
  }
  return "";
}

constexpr std::string_view FamilyName(ArchFamily family) {
  switch (family) {
    case ArchFamily::kX86_64:
      return "x86_64";
    case ArchFamily::kAarch64:
      return "aarch64";
    case ArchFamily::kUnknown:
      break;
  }
  return "unknown";
}

constexpr ArchFamily FamilyOf(CpuLevel level) {
  switch (level) {
    case CpuLevel::kX86_64:
    case CpuLevel::kX86_64V2:
    case CpuLevel::kX86_64V3:
    case CpuLevel::kX86_64V4:
      return ArchFamily::kX86_64;
    case CpuLevel::kAarch64:
    case CpuLevel::kAarch64Sve:
    case CpuLevel::kAarch64Sve2:
      return ArchFamily::kAarch64;
  }
  return ArchFamily::kUnknown;
}

/**
 * @brief Ordinal rank inside the family (0 = baseline)
 */
constexpr int RankOf(CpuLevel level) {
  switch (level) {
    case CpuLevel::kX86_64:
    case CpuLevel::kAarch64:
      return 0;
    case CpuLevel::kX86_64V2:
    case CpuLevel::kAarch64Sve:
      return 1;
    case CpuLevel::kX86_64V3:
    case CpuLevel::kAarch64Sve2:
      return 2;
    case CpuLevel::kX86_64V4:
      return 3;
  }
  return 0;
}

/**
 * @brief Lowest level of a family; kUnknown maps to kDefaultFamily
 */
constexpr CpuLevel BaselineFor(ArchFamily family) {
  return family == ArchFamily::kAarch64 ? CpuLevel::kAarch64 : CpuLevel::kX86_64;
}

/**
 * @brief Features a host must have for a level to be usable
 *
 * Each level's set strictly contains the set of every lower level of its family.
 */
constexpr FeatureSet RequiredFeatures(CpuLevel level) {
  constexpr FeatureSet kV1 = {Feature::kSSE, Feature::kSSE2};
  constexpr FeatureSet kV2 = kV1.Union({Feature::kSSE3, Feature::kSSSE3, Feature::kSSE4_1, Feature::kSSE4_2,
                                        Feature::kPOPCNT});
  constexpr FeatureSet kV3 = kV2.Union({Feature::kAVX, Feature::kAVX2, Feature::kBMI1, Feature::kBMI2, Feature::kF16C,
                                        Feature::kFMA, Feature::kLZCNT});
  constexpr FeatureSet kV4 = kV3.Union({Feature::kAVX512F, Feature::kAVX512BW, Feature::kAVX512CD,
                                        Feature::kAVX512DQ, Feature::kAVX512VL});
  constexpr FeatureSet kArmBase = {Feature::kFP, Feature::kASIMD};
  constexpr FeatureSet kArmSve = kArmBase.Union({Feature::kSVE});
  constexpr FeatureSet kArmSve2 = kArmSve.Union({Feature::kSVE2});

  switch (level) {
    case CpuLevel::kX86_64:
      return kV1;
    case CpuLevel::kX86_64V2:
      return kV2;
    case CpuLevel::kX86_64V3:
      return kV3;
    case CpuLevel::kX86_64V4:
      return kV4;
    case CpuLevel::kAarch64:
      return kArmBase;
    case CpuLevel::kAarch64Sve:
      return kArmSve;
    case CpuLevel::kAarch64Sve2:
      return kArmSve2;
  }
  return {};
}

/**
 * @brief Compiler CPU model a variant of this level is built with
 */
struct CpuModel {
  std::string_view option;  ///< "-march" or "-mcpu"
  std::string_view name;    ///< e.g. "x86-64-v3", "neoverse-v1"

  /// Full compiler flag, e.g. "-march=x86-64-v3"
  std::string Flag() const { return std::string(option) + "=" + std::string(name); }
};

constexpr CpuModel CpuModelFor(CpuLevel level) {
  switch (level) {
    case CpuLevel::kX86_64:
      return {"-march", "x86-64"};
    case CpuLevel::kX86_64V2:
      return {"-march", "x86-64-v2"};
    case CpuLevel::kX86_64V3:
      return {"-march", "x86-64-v3"};
    case CpuLevel::kX86_64V4:
      return {"-march", "x86-64-v4"};
    case CpuLevel::kAarch64:
      return {"-march", "armv8-a"};
    case CpuLevel::kAarch64Sve:
      return {"-mcpu", "neoverse-v1"};
    case CpuLevel::kAarch64Sve2:
      return {"-mcpu", "neoverse-v2"};
  }
  return {"-march", "x86-64"};
}

/**
 * @brief Look up a level by its canonical tag (compile-time usable)
 */
constexpr std::optional<CpuLevel> LevelFromTag(std::string_view tag) {
  for (CpuLevel level : kAllLevels) {
    if (LevelTag(level) == tag) {
      return level;
    }
  }
  return std::nullopt;
}

/**
 * @brief Parse a level tag, reporting kCpuUnknownLevel for unknown tags
 */
utils::Expected<CpuLevel, utils::Error> ParseLevel(std::string_view tag);

/**
 * @brief Three-way compare inside one family
 * @return <0, 0, >0 by rank; std::nullopt if families differ
 */
constexpr std::optional<int> CompareLevels(CpuLevel lhs, CpuLevel rhs) {
  if (FamilyOf(lhs) != FamilyOf(rhs)) {
    return std::nullopt;
  }
  return RankOf(lhs) - RankOf(rhs);
}

/**
 * @brief lhs <= rhs within one family; false across families
 */
constexpr bool IsAtMost(CpuLevel lhs, CpuLevel rhs) {
  auto cmp = CompareLevels(lhs, rhs);
  return cmp.has_value() && *cmp <= 0;
}

/**
 * @brief Architecture family this binary was compiled for
 */
constexpr ArchFamily HostArchFamily() {
#if defined(__x86_64__) || defined(_M_X64)
  return ArchFamily::kX86_64;
#elif defined(__aarch64__) || defined(_M_ARM64)
  return ArchFamily::kAarch64;
#else
  return ArchFamily::kUnknown;
#endif
}

/**
 * @brief Map an unknown family to kDefaultFamily
 *
 * Logs an `unknown_architecture` warning the first time it substitutes.
 */
ArchFamily EffectiveFamily(ArchFamily family);

/**
 * @brief Highest level of `family` whose required features are all in `features`
 *
 * Returns the family baseline when no level matches; kUnknown maps to the
 * default family's baseline.
 */
constexpr CpuLevel LevelFromFeatures(ArchFamily family, const FeatureSet& features) {
  if (family == ArchFamily::kX86_64) {
    for (CpuLevel level : kX86_64Levels) {
      if (RequiredFeatures(level).IsSubsetOf(features)) {
        return level;
      }
    }
  } else if (family == ArchFamily::kAarch64) {
    for (CpuLevel level : kAarch64Levels) {
      if (RequiredFeatures(level).IsSubsetOf(features)) {
        return level;
      }
    }
  }
  return BaselineFor(family);
}

}  // namespace mvdispatch::cpu
