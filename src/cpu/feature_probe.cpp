/**
 * @file feature_probe.cpp
 * @brief Native CPUID / HWCAP feature probing
 */

#include "cpu/feature_probe.h"

#include <cstdint>

#if defined(__x86_64__) || defined(_M_X64)
#if defined(_MSC_VER)
#include <intrin.h>
#else
#include <cpuid.h>
#endif
#elif (defined(__aarch64__) || defined(_M_ARM64)) && defined(__linux__)
#include <sys/auxv.h>
#endif

namespace mvdispatch::cpu {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

#if defined(__x86_64__) || defined(_M_X64)

struct CpuidRegs {
  uint32_t eax = 0;
  uint32_t ebx = 0;
  uint32_t ecx = 0;
  uint32_t edx = 0;
};

// Leaf 1 ECX
constexpr uint32_t kLeaf1EcxSSE3 = 1U << 0;
constexpr uint32_t kLeaf1EcxSSSE3 = 1U << 9;
constexpr uint32_t kLeaf1EcxFMA = 1U << 12;
constexpr uint32_t kLeaf1EcxCX16 = 1U << 13;
constexpr uint32_t kLeaf1EcxSSE41 = 1U << 19;
constexpr uint32_t kLeaf1EcxSSE42 = 1U << 20;
constexpr uint32_t kLeaf1EcxMOVBE = 1U << 22;
constexpr uint32_t kLeaf1EcxPOPCNT = 1U << 23;
constexpr uint32_t kLeaf1EcxOSXSAVE = 1U << 27;
constexpr uint32_t kLeaf1EcxAVX = 1U << 28;
constexpr uint32_t kLeaf1EcxF16C = 1U << 29;
// Leaf 1 EDX
constexpr uint32_t kLeaf1EdxSSE = 1U << 25;
constexpr uint32_t kLeaf1EdxSSE2 = 1U << 26;
// Leaf 7.0 EBX
constexpr uint32_t kLeaf7EbxBMI1 = 1U << 3;
constexpr uint32_t kLeaf7EbxAVX2 = 1U << 5;
constexpr uint32_t kLeaf7EbxBMI2 = 1U << 8;
constexpr uint32_t kLeaf7EbxAVX512F = 1U << 16;
constexpr uint32_t kLeaf7EbxAVX512DQ = 1U << 17;
constexpr uint32_t kLeaf7EbxAVX512CD = 1U << 28;
constexpr uint32_t kLeaf7EbxAVX512BW = 1U << 30;
constexpr uint32_t kLeaf7EbxAVX512VL = 1U << 31;
// Leaf 0x80000001 ECX
constexpr uint32_t kExtEcxLAHF = 1U << 0;
constexpr uint32_t kExtEcxLZCNT = 1U << 5;

// XCR0: SSE + AVX (YMM) state, opmask + ZMM_Hi256 + Hi16_ZMM state
constexpr uint64_t kXcr0YmmMask = 0x6;
constexpr uint64_t kXcr0ZmmMask = 0xE0;

constexpr uint32_t kExtendedLeafBase = 0x80000000U;

uint32_t MaxLeaf(uint32_t base) {
#if defined(_MSC_VER)
  int regs[4] = {};
  __cpuid(regs, static_cast<int>(base));
  return static_cast<uint32_t>(regs[0]);
#else
  return __get_cpuid_max(base, nullptr);
#endif
}

CpuidRegs Cpuid(uint32_t leaf, uint32_t subleaf = 0) {
  CpuidRegs regs;
#if defined(_MSC_VER)
  int out[4] = {};
  __cpuidex(out, static_cast<int>(leaf), static_cast<int>(subleaf));
  regs.eax = static_cast<uint32_t>(out[0]);
  regs.ebx = static_cast<uint32_t>(out[1]);
  regs.ecx = static_cast<uint32_t>(out[2]);
  regs.edx = static_cast<uint32_t>(out[3]);
#else
  __cpuid_count(leaf, subleaf, regs.eax, regs.ebx, regs.ecx, regs.edx);
#endif
  return regs;
}

uint64_t ReadXcr0() {
#if defined(_MSC_VER)
  return _xgetbv(0);
#else
  uint32_t low = 0;
  uint32_t high = 0;
  __asm__ volatile("xgetbv" : "=a"(low), "=d"(high) : "c"(0));
  return (static_cast<uint64_t>(high) << 32) | low;
#endif
}

Expected<FeatureSet, Error> ProbeX86() {
  const uint32_t max_leaf = MaxLeaf(0);
  if (max_leaf < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kCpuProbeFailed, "CPUID leaf 1 not available"));
  }

  FeatureSet features;
  const CpuidRegs leaf1 = Cpuid(1);
  features.Set(Feature::kSSE, (leaf1.edx & kLeaf1EdxSSE) != 0)
      .Set(Feature::kSSE2, (leaf1.edx & kLeaf1EdxSSE2) != 0)
      .Set(Feature::kSSE3, (leaf1.ecx & kLeaf1EcxSSE3) != 0)
      .Set(Feature::kSSSE3, (leaf1.ecx & kLeaf1EcxSSSE3) != 0)
      .Set(Feature::kSSE4_1, (leaf1.ecx & kLeaf1EcxSSE41) != 0)
      .Set(Feature::kSSE4_2, (leaf1.ecx & kLeaf1EcxSSE42) != 0)
      .Set(Feature::kPOPCNT, (leaf1.ecx & kLeaf1EcxPOPCNT) != 0)
      .Set(Feature::kCX16, (leaf1.ecx & kLeaf1EcxCX16) != 0)
      .Set(Feature::kMOVBE, (leaf1.ecx & kLeaf1EcxMOVBE) != 0)
      .Set(Feature::kOSXSAVE, (leaf1.ecx & kLeaf1EcxOSXSAVE) != 0)
      .Set(Feature::kAVX, (leaf1.ecx & kLeaf1EcxAVX) != 0)
      .Set(Feature::kF16C, (leaf1.ecx & kLeaf1EcxF16C) != 0)
      .Set(Feature::kFMA, (leaf1.ecx & kLeaf1EcxFMA) != 0);

  if (max_leaf >= 7) {
    const CpuidRegs leaf7 = Cpuid(7, 0);
    features.Set(Feature::kBMI1, (leaf7.ebx & kLeaf7EbxBMI1) != 0)
        .Set(Feature::kAVX2, (leaf7.ebx & kLeaf7EbxAVX2) != 0)
        .Set(Feature::kBMI2, (leaf7.ebx & kLeaf7EbxBMI2) != 0)
        .Set(Feature::kAVX512F, (leaf7.ebx & kLeaf7EbxAVX512F) != 0)
        .Set(Feature::kAVX512DQ, (leaf7.ebx & kLeaf7EbxAVX512DQ) != 0)
        .Set(Feature::kAVX512CD, (leaf7.ebx & kLeaf7EbxAVX512CD) != 0)
        .Set(Feature::kAVX512BW, (leaf7.ebx & kLeaf7EbxAVX512BW) != 0)
        .Set(Feature::kAVX512VL, (leaf7.ebx & kLeaf7EbxAVX512VL) != 0);
  }

  if (MaxLeaf(kExtendedLeafBase) >= kExtendedLeafBase + 1) {
    const CpuidRegs ext = Cpuid(kExtendedLeafBase + 1);
    features.Set(Feature::kLAHF, (ext.ecx & kExtEcxLAHF) != 0).Set(Feature::kLZCNT, (ext.ecx & kExtEcxLZCNT) != 0);
  }

  // XGETBV is only legal when the OS has enabled XSAVE
  const uint64_t xcr0 = features.Has(Feature::kOSXSAVE) ? ReadXcr0() : 0;
  if ((xcr0 & kXcr0YmmMask) != kXcr0YmmMask) {
    for (Feature f : {Feature::kAVX, Feature::kAVX2, Feature::kFMA, Feature::kF16C}) {
      features.Remove(f);
    }
  }
  if ((xcr0 & kXcr0ZmmMask) != kXcr0ZmmMask || !features.Has(Feature::kAVX)) {
    for (Feature f : {Feature::kAVX512F, Feature::kAVX512BW, Feature::kAVX512CD, Feature::kAVX512DQ,
                      Feature::kAVX512VL}) {
      features.Remove(f);
    }
  }
  return features;
}

#elif (defined(__aarch64__) || defined(_M_ARM64)) && defined(__linux__)

// Linux arm64 HWCAP bits (arch/arm64/include/uapi/asm/hwcap.h)
constexpr unsigned long kHwcapFP = 1UL << 0;
constexpr unsigned long kHwcapASIMD = 1UL << 1;
constexpr unsigned long kHwcapSVE = 1UL << 22;
constexpr unsigned long kHwcap2SVE2 = 1UL << 1;

Expected<FeatureSet, Error> ProbeAarch64() {
  const unsigned long hwcap = getauxval(AT_HWCAP);
  const unsigned long hwcap2 = getauxval(AT_HWCAP2);
  if (hwcap == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kCpuProbeFailed, "getauxval(AT_HWCAP) returned no capabilities"));
  }

  FeatureSet features;
  features.Set(Feature::kFP, (hwcap & kHwcapFP) != 0)
      .Set(Feature::kASIMD, (hwcap & kHwcapASIMD) != 0)
      .Set(Feature::kSVE, (hwcap & kHwcapSVE) != 0)
      .Set(Feature::kSVE2, (hwcap2 & kHwcap2SVE2) != 0);
  return features;
}

#endif

}  // namespace

Expected<FeatureSet, Error> NativeFeatureProbe::Probe() {
#if defined(__x86_64__) || defined(_M_X64)
  return ProbeX86();
#elif (defined(__aarch64__) || defined(_M_ARM64)) && defined(__linux__)
  return ProbeAarch64();
#elif defined(__aarch64__) || defined(_M_ARM64)
  return MakeUnexpected(
      MakeError(ErrorCode::kCpuProbeUnsupported, "No aarch64 feature probe for this operating system"));
#else
  return MakeUnexpected(MakeError(ErrorCode::kCpuProbeUnsupported, "No feature probe for this architecture"));
#endif
}

}  // namespace mvdispatch::cpu
