/**
 * @file cpu_detector_test.cpp
 * @brief Unit tests for memoized CPU detection
 */

#include "cpu/cpu_detector.h"

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mvdispatch::cpu;
using mvdispatch::utils::Error;
using mvdispatch::utils::ErrorCode;
using mvdispatch::utils::Expected;
using mvdispatch::utils::MakeError;
using mvdispatch::utils::MakeUnexpected;

namespace {

/**
 * @brief Probe reporting a fixed (simulated) feature set
 */
class FakeProbe : public FeatureProbe {
 public:
  FakeProbe(ArchFamily family, FeatureSet features, std::atomic<int>* calls = nullptr)
      : family_(family), features_(features), calls_(calls) {}

  Expected<FeatureSet, Error> Probe() override {
    if (calls_ != nullptr) {
      calls_->fetch_add(1);
    }
    return features_;
  }
  ArchFamily Family() const override { return family_; }

 private:
  ArchFamily family_;
  FeatureSet features_;
  std::atomic<int>* calls_;
};

/**
 * @brief Probe that always fails
 */
class FailingProbe : public FeatureProbe {
 public:
  explicit FailingProbe(ArchFamily family) : family_(family) {}

  Expected<FeatureSet, Error> Probe() override {
    return MakeUnexpected(MakeError(ErrorCode::kCpuProbeFailed, "simulated probe failure"));
  }
  ArchFamily Family() const override { return family_; }

 private:
  ArchFamily family_;
};

/**
 * @brief Routes the default logger into a string for the lifetime of the object
 */
class LogCapture {
 public:
  LogCapture() : previous_(spdlog::default_logger()) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
  }
  ~LogCapture() { spdlog::set_default_logger(previous_); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::string Text() const { return stream_.str(); }

 private:
  std::shared_ptr<spdlog::logger> previous_;
  std::ostringstream stream_;
};

std::unique_ptr<FeatureProbe> MakeProbe(ArchFamily family, CpuLevel level, std::atomic<int>* calls = nullptr) {
  return std::make_unique<FakeProbe>(family, RequiredFeatures(level), calls);
}

}  // namespace

// ============================================================================
// Detection
// ============================================================================

TEST(CpuDetectorTest, DetectsEachSimulatedLevel) {
  for (CpuLevel level : kX86_64Levels) {
    CpuDetector detector(MakeProbe(ArchFamily::kX86_64, level));
    EXPECT_EQ(detector.Detect(), level) << LevelTag(level);
    EXPECT_EQ(detector.Family(), ArchFamily::kX86_64);
    EXPECT_FALSE(detector.ProbeFailed());
  }
  for (CpuLevel level : kAarch64Levels) {
    CpuDetector detector(MakeProbe(ArchFamily::kAarch64, level));
    EXPECT_EQ(detector.Detect(), level) << LevelTag(level);
  }
}

TEST(CpuDetectorTest, ReportsProbedFeatures) {
  CpuDetector detector(MakeProbe(ArchFamily::kX86_64, CpuLevel::kX86_64V3));
  FeatureSet features = detector.Features();
  EXPECT_TRUE(features.Has(Feature::kAVX2));
  EXPECT_FALSE(features.Has(Feature::kAVX512F));
}

/**
 * @brief More features never yield a lower level
 */
TEST(CpuDetectorTest, Monotonic) {
  FeatureSet features;
  int previous_rank = -1;
  for (auto it = kX86_64Levels.rbegin(); it != kX86_64Levels.rend(); ++it) {
    features = features.Union(RequiredFeatures(*it));
    CpuDetector detector(std::make_unique<FakeProbe>(ArchFamily::kX86_64, features));
    int rank = RankOf(detector.Detect());
    EXPECT_GE(rank, previous_rank);
    previous_rank = rank;
  }
  EXPECT_EQ(previous_rank, RankOf(CpuLevel::kX86_64V4));
}

TEST(CpuDetectorTest, ProbeFailureFallsBackToBaseline) {
  CpuDetector x86(std::make_unique<FailingProbe>(ArchFamily::kX86_64));
  EXPECT_EQ(x86.Detect(), CpuLevel::kX86_64);
  EXPECT_TRUE(x86.ProbeFailed());
  EXPECT_TRUE(x86.Features().Empty());

  CpuDetector arm(std::make_unique<FailingProbe>(ArchFamily::kAarch64));
  EXPECT_EQ(arm.Detect(), CpuLevel::kAarch64);
}

TEST(CpuDetectorTest, UnknownFamilyUsesDefaultBaseline) {
  std::atomic<int> calls{0};
  CpuDetector detector(MakeProbe(ArchFamily::kUnknown, CpuLevel::kX86_64V4, &calls));
  EXPECT_EQ(detector.Family(), ArchFamily::kX86_64);
  EXPECT_EQ(detector.Detect(), CpuLevel::kX86_64);
  EXPECT_TRUE(detector.ProbeFailed());
  EXPECT_EQ(calls.load(), 0);
}

TEST(CpuDetectorTest, UnknownFamilyLogsFallback) {
  LogCapture capture;
  CpuDetector detector(MakeProbe(ArchFamily::kUnknown, CpuLevel::kX86_64V4));
  EXPECT_EQ(detector.Detect(), CpuLevel::kX86_64);

  std::string text = capture.Text();
  EXPECT_NE(text.find("cpu_detection_fallback"), std::string::npos) << text;
  EXPECT_NE(text.find("kCpuUnknownArchitecture"), std::string::npos) << text;
}

TEST(CpuDetectorTest, NullProbeUsesNativeProbe) {
  CpuDetector detector(std::unique_ptr<FeatureProbe>{});
  CpuDetector native;
  EXPECT_EQ(detector.Family(), native.Family());
  EXPECT_EQ(detector.Detect(), native.Detect());
}

// ============================================================================
// Memoization
// ============================================================================

TEST(CpuDetectorTest, ProbesOnce) {
  std::atomic<int> calls{0};
  CpuDetector detector(MakeProbe(ArchFamily::kX86_64, CpuLevel::kX86_64V2, &calls));
  EXPECT_EQ(detector.ProbeCount(), 0);

  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(detector.Detect(), CpuLevel::kX86_64V2);
  }
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(detector.ProbeCount(), 1);
}

TEST(CpuDetectorTest, ConcurrentDetectAgrees) {
  constexpr int kThreads = 8;
  std::atomic<int> calls{0};
  CpuDetector detector(MakeProbe(ArchFamily::kX86_64, CpuLevel::kX86_64V3, &calls));

  std::vector<CpuLevel> results(kThreads, CpuLevel::kX86_64);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() { results[i] = detector.Detect(); });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (CpuLevel level : results) {
    EXPECT_EQ(level, CpuLevel::kX86_64V3);
  }
  // Racing first calls may each probe, but never more than once per thread
  EXPECT_GE(calls.load(), 1);
  EXPECT_LE(calls.load(), kThreads);
  EXPECT_EQ(detector.Detect(), CpuLevel::kX86_64V3);
}

// ============================================================================
// Forced level
// ============================================================================

TEST(CpuDetectorTest, ForceLowerLevel) {
  CpuDetector detector(MakeProbe(ArchFamily::kX86_64, CpuLevel::kX86_64V4), CpuLevel::kX86_64V2);
  EXPECT_EQ(detector.Detect(), CpuLevel::kX86_64V2);
  ASSERT_TRUE(detector.ForcedLevel().has_value());
  EXPECT_EQ(*detector.ForcedLevel(), CpuLevel::kX86_64V2);
}

TEST(CpuDetectorTest, ForceHigherLevelIsClamped) {
  CpuDetector detector(MakeProbe(ArchFamily::kX86_64, CpuLevel::kX86_64V2), CpuLevel::kX86_64V4);
  EXPECT_EQ(detector.Detect(), CpuLevel::kX86_64V2);
}

TEST(CpuDetectorTest, ForceOtherFamilyIgnored) {
  CpuDetector detector(MakeProbe(ArchFamily::kAarch64, CpuLevel::kAarch64Sve), CpuLevel::kX86_64);
  EXPECT_EQ(detector.Detect(), CpuLevel::kAarch64Sve);
}

TEST(CpuDetectorTest, ForceAppliesAfterProbeFailure) {
  CpuDetector detector(std::make_unique<FailingProbe>(ArchFamily::kAarch64), CpuLevel::kAarch64);
  EXPECT_EQ(detector.Detect(), CpuLevel::kAarch64);
}

TEST(CpuDetectorTest, ForceAppliesOnUnknownFamily) {
  // The default family baseline is already the lowest level; a forced one of that family is kept
  CpuDetector baseline(MakeProbe(ArchFamily::kUnknown, CpuLevel::kX86_64V4), CpuLevel::kX86_64);
  EXPECT_EQ(baseline.Detect(), CpuLevel::kX86_64);
  ASSERT_TRUE(baseline.ForcedLevel().has_value());

  // A higher forced level is clamped to the fallback baseline
  CpuDetector clamped(MakeProbe(ArchFamily::kUnknown, CpuLevel::kX86_64V4), CpuLevel::kX86_64V3);
  EXPECT_EQ(clamped.Detect(), CpuLevel::kX86_64);
}

TEST(CpuDetectorTest, ForceLevelSetting) {
  unsetenv(kForceLevelEnvVar);
  EXPECT_FALSE(ForceLevelSetting().has_value());
  EXPECT_FALSE(ForceLevelSetting("not_a_level").has_value());

  auto configured = ForceLevelSetting("x86_64_v2");
  ASSERT_TRUE(configured.has_value());
  EXPECT_EQ(*configured, CpuLevel::kX86_64V2);

  // Environment wins over configuration
  setenv(kForceLevelEnvVar, "aarch64_sve", 1);
  auto from_env = ForceLevelSetting("x86_64_v2");
  ASSERT_TRUE(from_env.has_value());
  EXPECT_EQ(*from_env, CpuLevel::kAarch64Sve);

  // An unparsable environment value falls back to the configured level
  setenv(kForceLevelEnvVar, "bogus", 1);
  auto fallback = ForceLevelSetting("x86_64_v2");
  ASSERT_TRUE(fallback.has_value());
  EXPECT_EQ(*fallback, CpuLevel::kX86_64V2);
  EXPECT_FALSE(ForceLevelSetting().has_value());
  EXPECT_FALSE(ForceLevelSetting("not_a_level").has_value());

  unsetenv(kForceLevelEnvVar);
}

// ============================================================================
// Native detector
// ============================================================================

TEST(CpuDetectorTest, NativeDetectorIsConsistent) {
  CpuDetector detector;
  CpuLevel level = detector.Detect();
  EXPECT_EQ(detector.Detect(), level);
  if (HostArchFamily() != ArchFamily::kUnknown) {
    EXPECT_EQ(FamilyOf(level), HostArchFamily());
  }
  EXPECT_LE(detector.ProbeCount(), 1);
}
