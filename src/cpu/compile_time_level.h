/**
 * @file compile_time_level.h
 * @brief Level of the current translation unit, from predefined compiler macros
 *
 * CompileTimeFeatures() / CompileTimeLevel() apply the runtime mapping to the
 * feature macros the compiler defines for the active -march / -mcpu. The
 * preprocessor twin MVDISPATCH_VARIANT_TAG expands to the same level's tag as
 * a bare token, for symbol pasting.
 *
 * Only macros and constexpr code live here: a variant translation unit built
 * for a high level must not emit out-of-line functions the linker could pick
 * for the whole program.
 */

#pragma once

#include "cpu/cpu_level.h"
#include "cpu/feature_set.h"

namespace mvdispatch::cpu {

/**
 * @brief Features the compiler is allowed to use in this translation unit
 */
constexpr FeatureSet CompileTimeFeatures() {
  FeatureSet features;
#if defined(__SSE__) || defined(_M_X64)
  features.Add(Feature::kSSE);
#endif
#if defined(__SSE2__) || defined(_M_X64)
  features.Add(Feature::kSSE2);
#endif
#ifdef __SSE3__
  features.Add(Feature::kSSE3);
#endif
#ifdef __SSSE3__
  features.Add(Feature::kSSSE3);
#endif
#ifdef __SSE4_1__
  features.Add(Feature::kSSE4_1);
#endif
#ifdef __SSE4_2__
  features.Add(Feature::kSSE4_2);
#endif
#ifdef __POPCNT__
  features.Add(Feature::kPOPCNT);
#endif
#ifdef __MOVBE__
  features.Add(Feature::kMOVBE);
#endif
#ifdef __AVX__
  features.Add(Feature::kAVX);
#endif
#ifdef __AVX2__
  features.Add(Feature::kAVX2);
#endif
#ifdef __BMI__
  features.Add(Feature::kBMI1);
#endif
#ifdef __BMI2__
  features.Add(Feature::kBMI2);
#endif
#ifdef __F16C__
  features.Add(Feature::kF16C);
#endif
#ifdef __FMA__
  features.Add(Feature::kFMA);
#endif
#ifdef __LZCNT__
  features.Add(Feature::kLZCNT);
#endif
#ifdef __AVX512F__
  features.Add(Feature::kAVX512F);
#endif
#ifdef __AVX512BW__
  features.Add(Feature::kAVX512BW);
#endif
#ifdef __AVX512CD__
  features.Add(Feature::kAVX512CD);
#endif
#ifdef __AVX512DQ__
  features.Add(Feature::kAVX512DQ);
#endif
#ifdef __AVX512VL__
  features.Add(Feature::kAVX512VL);
#endif
#if defined(__aarch64__) || defined(_M_ARM64)
  // FP and Advanced SIMD are mandatory in ARMv8-A
  features.Add(Feature::kFP).Add(Feature::kASIMD);
#endif
#ifdef __ARM_FEATURE_SVE
  features.Add(Feature::kSVE);
#endif
#ifdef __ARM_FEATURE_SVE2
  features.Add(Feature::kSVE2);
#endif
  return features;
}

/**
 * @brief Highest level whose requirements this translation unit is compiled for
 */
constexpr CpuLevel CompileTimeLevel() {
  return LevelFromFeatures(HostArchFamily(), CompileTimeFeatures());
}

}  // namespace mvdispatch::cpu

// Preprocessor twin of CompileTimeLevel(): the level tag as a bare token.
#if defined(__x86_64__) || defined(_M_X64)
#if defined(__SSE3__) && defined(__SSSE3__) && defined(__SSE4_1__) && defined(__SSE4_2__) && defined(__POPCNT__)
#define MVDISPATCH_HAS_X86_64_V2 1
#endif
#if defined(MVDISPATCH_HAS_X86_64_V2) && defined(__AVX__) && defined(__AVX2__) && defined(__BMI__) && \
    defined(__BMI2__) && defined(__F16C__) && defined(__FMA__) && defined(__LZCNT__)
#define MVDISPATCH_HAS_X86_64_V3 1
#endif
#if defined(MVDISPATCH_HAS_X86_64_V3) && defined(__AVX512F__) && defined(__AVX512BW__) && defined(__AVX512CD__) && \
    defined(__AVX512DQ__) && defined(__AVX512VL__)
#define MVDISPATCH_HAS_X86_64_V4 1
#endif

#if defined(MVDISPATCH_HAS_X86_64_V4)
#define MVDISPATCH_VARIANT_TAG x86_64_v4
#elif defined(MVDISPATCH_HAS_X86_64_V3)
#define MVDISPATCH_VARIANT_TAG x86_64_v3
#elif defined(MVDISPATCH_HAS_X86_64_V2)
#define MVDISPATCH_VARIANT_TAG x86_64_v2
#else
#define MVDISPATCH_VARIANT_TAG x86_64
#endif

#elif defined(__aarch64__) || defined(_M_ARM64)
#if defined(__ARM_FEATURE_SVE2)
#define MVDISPATCH_VARIANT_TAG aarch64_sve2
#elif defined(__ARM_FEATURE_SVE)
#define MVDISPATCH_VARIANT_TAG aarch64_sve
#else
#define MVDISPATCH_VARIANT_TAG aarch64
#endif

#else
// Unknown architecture: default family baseline
#define MVDISPATCH_VARIANT_TAG x86_64
#endif
