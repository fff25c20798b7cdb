/**
 * @file cpu_detector.cpp
 * @brief CpuDetector implementation
 */

#include "cpu/cpu_detector.h"

#include <spdlog/spdlog.h>

#include <cstdlib>

#include "utils/structured_log.h"

namespace mvdispatch::cpu {

CpuDetector::CpuDetector(std::optional<CpuLevel> force_level)
    : CpuDetector(std::make_unique<NativeFeatureProbe>(), force_level) {}

CpuDetector::CpuDetector(std::unique_ptr<FeatureProbe> probe, std::optional<CpuLevel> force_level)
    : probe_(probe != nullptr ? std::move(probe) : std::make_unique<NativeFeatureProbe>()),
      family_(EffectiveFamily(probe_->Family())),
      force_level_(force_level) {}

CpuLevel CpuDetector::Detect() const {
  int cached = cached_level_.load(std::memory_order_acquire);
  if (cached != kNotDetected) {
    return static_cast<CpuLevel>(cached);
  }

  const CpuLevel level = Compute();
  int expected = kNotDetected;
  if (cached_level_.compare_exchange_strong(expected, static_cast<int>(level), std::memory_order_acq_rel)) {
    utils::LogCpuDetection(std::string(FamilyName(family_)), std::string(LevelTag(level)), Features().ToString(),
                           force_level_.has_value());
    return level;
  }
  // Another thread finished first; its value wins
  return static_cast<CpuLevel>(expected);
}

FeatureSet CpuDetector::Features() const {
  if (cached_level_.load(std::memory_order_acquire) == kNotDetected) {
    Detect();
  }
  return FeatureSet::FromBits(cached_features_.load(std::memory_order_acquire));
}

bool CpuDetector::ProbeFailed() const {
  return probe_failed_.load(std::memory_order_acquire);
}

CpuLevel CpuDetector::Compute() const {
  const CpuLevel baseline = BaselineFor(family_);

  // Unknown architecture: nothing meaningful to probe
  if (probe_->Family() == ArchFamily::kUnknown) {
    probe_failed_.store(true, std::memory_order_release);
    auto error = utils::MakeError(utils::ErrorCode::kCpuUnknownArchitecture, "Feature probe has no known family");
    utils::LogCpuDetectionFallback(std::string(FamilyName(family_)), std::string(LevelTag(baseline)),
                                   error.to_string());
    return ApplyForceLevel(baseline);
  }

  probe_count_.fetch_add(1, std::memory_order_relaxed);
  auto features = probe_->Probe();
  if (!features) {
    probe_failed_.store(true, std::memory_order_release);
    utils::LogCpuDetectionFallback(std::string(FamilyName(family_)), std::string(LevelTag(baseline)),
                                   features.error().to_string());
    return ApplyForceLevel(baseline);
  }

  cached_features_.store(features->Bits(), std::memory_order_release);
  return ApplyForceLevel(LevelFromFeatures(family_, *features));
}

CpuLevel CpuDetector::ApplyForceLevel(CpuLevel detected) const {
  if (!force_level_.has_value()) {
    return detected;
  }

  const CpuLevel forced = *force_level_;
  if (FamilyOf(forced) != family_) {
    utils::LogForceLevelIgnored(std::string(LevelTag(forced)),
                                "level belongs to " + std::string(FamilyName(FamilyOf(forced))) + ", host is " +
                                    std::string(FamilyName(family_)));
    return detected;
  }
  if (!IsAtMost(forced, detected)) {
    utils::LogForceLevelIgnored(std::string(LevelTag(forced)),
                                "above detected level " + std::string(LevelTag(detected)) + ", clamped");
    return detected;
  }
  return forced;
}

CpuDetector& DefaultDetector() {
  static CpuDetector detector(ForceLevelSetting());
  return detector;
}

std::optional<CpuLevel> ForceLevelSetting(const std::string& configured_tag) {
  const char* env = std::getenv(kForceLevelEnvVar);
  if (env != nullptr && *env != '\0') {
    auto level = ParseLevel(env);
    if (level) {
      return *level;
    }
    spdlog::warn("Ignoring {}: {}", kForceLevelEnvVar, level.error().to_string());
  }
  if (configured_tag.empty()) {
    return std::nullopt;
  }

  auto level = ParseLevel(configured_tag);
  if (!level) {
    spdlog::warn("Ignoring forced CPU level: {}", level.error().to_string());
    return std::nullopt;
  }
  return *level;
}

}  // namespace mvdispatch::cpu
