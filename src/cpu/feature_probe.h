/**
 * @file feature_probe.h
 * @brief Hardware feature probing
 *
 * FeatureProbe is the seam between the detector and the hardware; tests
 * substitute a probe that reports a simulated feature set.
 */

#pragma once

#include "cpu/cpu_level.h"
#include "cpu/feature_set.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::cpu {

/**
 * @brief Source of the host feature set
 */
class FeatureProbe {
 public:
  virtual ~FeatureProbe() = default;

  /**
   * @brief Query the features of the running machine
   *
   * Must be safe to call concurrently; the result must not change between calls.
   */
  virtual utils::Expected<FeatureSet, utils::Error> Probe() = 0;

  /**
   * @brief Architecture family the probed features belong to
   */
  virtual ArchFamily Family() const = 0;
};

/**
 * @brief Probe backed by the CPU itself
 *
 * - x86_64: CPUID leaves 1, 7.0 and 0x80000001. XGETBV(0) confirms the OS
 *   saves YMM state (AVX family) and ZMM/opmask state (AVX-512); flags whose
 *   register state is not saved are cleared.
 * - aarch64 Linux: getauxval(AT_HWCAP / AT_HWCAP2).
 * - Anything else: kCpuProbeUnsupported.
 */
class NativeFeatureProbe : public FeatureProbe {
 public:
  utils::Expected<FeatureSet, utils::Error> Probe() override;
  ArchFamily Family() const override { return HostArchFamily(); }
};

}  // namespace mvdispatch::cpu
