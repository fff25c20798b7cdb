/**
 * @file cpu_detector.h
 * @brief Memoized host CPU level detection
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cpu/cpu_level.h"
#include "cpu/feature_probe.h"
#include "cpu/feature_set.h"

namespace mvdispatch::cpu {

/// Environment variable naming a level to force (clamped to the host level)
constexpr const char* kForceLevelEnvVar = "MVDISPATCH_FORCE_LEVEL";

/**
 * @brief Determines, once, the highest level the host satisfies
 *
 * The first Detect() probes the hardware; later calls return the cached
 * value. Concurrent first calls may each probe, but all of them observe the
 * same stored result. A failing probe yields the family baseline and a
 * `cpu_detection_fallback` warning, never an error.
 *
 * An optional forced level lowers the result (e.g. to exercise a baseline
 * variant on a capable machine). It is clamped to the detected level and
 * ignored, with a warning, when it belongs to another family.
 */
class CpuDetector {
 public:
  /**
   * @brief Detector over the native hardware probe
   */
  explicit CpuDetector(std::optional<CpuLevel> force_level = std::nullopt);

  /**
   * @brief Detector over a custom probe (simulated hosts in tests)
   *
   * A null probe is replaced by the native one.
   */
  explicit CpuDetector(std::unique_ptr<FeatureProbe> probe, std::optional<CpuLevel> force_level = std::nullopt);

  CpuDetector(const CpuDetector&) = delete;
  CpuDetector& operator=(const CpuDetector&) = delete;

  /**
   * @brief Detected (possibly forced) level; memoized after the first call
   */
  CpuLevel Detect() const;

  /**
   * @brief Features reported by the probe (empty if it failed)
   */
  FeatureSet Features() const;

  /**
   * @brief Family the detector reports levels for
   *
   * The probe's family, or the default family when it is unknown.
   */
  ArchFamily Family() const { return family_; }

  std::optional<CpuLevel> ForcedLevel() const { return force_level_; }

  /**
   * @brief Number of times the probe has actually run
   */
  uint64_t ProbeCount() const { return probe_count_.load(std::memory_order_relaxed); }

  /**
   * @brief True once detection ran and the probe failed
   */
  bool ProbeFailed() const;

 private:
  static constexpr int kNotDetected = -1;

  CpuLevel Compute() const;
  CpuLevel ApplyForceLevel(CpuLevel detected) const;

  std::unique_ptr<FeatureProbe> probe_;
  ArchFamily family_;
  std::optional<CpuLevel> force_level_;

  mutable std::atomic<int> cached_level_{kNotDetected};
  mutable std::atomic<uint64_t> cached_features_{0};
  mutable std::atomic<bool> probe_failed_{false};
  mutable std::atomic<uint64_t> probe_count_{0};
};

/**
 * @brief Process-lifetime detector used by the no-context resolution path
 *
 * Native probe; forced level taken from MVDISPATCH_FORCE_LEVEL.
 */
CpuDetector& DefaultDetector();

/**
 * @brief Effective forced level from MVDISPATCH_FORCE_LEVEL, else `configured_tag`
 *
 * An unparsable environment value is skipped with a warning and
 * `configured_tag` is used instead. Empty or unparsable results yield
 * std::nullopt.
 */
std::optional<CpuLevel> ForceLevelSetting(const std::string& configured_tag = "");

}  // namespace mvdispatch::cpu
