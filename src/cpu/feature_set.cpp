/**
 * @file feature_set.cpp
 * @brief Feature names and FeatureSet formatting
 */

#include "cpu/feature_set.h"

namespace mvdispatch::cpu {

const char* FeatureName(Feature feature) {
  switch (feature) {
    case Feature::kSSE:
      return "sse";
    case Feature::kSSE2:
      return "sse2";
    case Feature::kSSE3:
      return "sse3";
    case Feature::kSSSE3:
      return "ssse3";
    case Feature::kSSE4_1:
      return "sse4.1";
    case Feature::kSSE4_2:
      return "sse4.2";
    case Feature::kPOPCNT:
      return "popcnt";
    case Feature::kCX16:
      return "cx16";
    case Feature::kLAHF:
      return "lahf";
    case Feature::kAVX:
      return "avx";
    case Feature::kAVX2:
      return "avx2";
    case Feature::kBMI1:
      return "bmi1";
    case Feature::kBMI2:
      return "bmi2";
    case Feature::kF16C:
      return "f16c";
    case Feature::kFMA:
      return "fma";
    case Feature::kLZCNT:
      return "lzcnt";
    case Feature::kMOVBE:
      return "movbe";
    case Feature::kOSXSAVE:
      return "osxsave";
    case Feature::kAVX512F:
      return "avx512f";
    case Feature::kAVX512BW:
      return "avx512bw";
    case Feature::kAVX512CD:
      return "avx512cd";
    case Feature::kAVX512DQ:
      return "avx512dq";
    case Feature::kAVX512VL:
      return "avx512vl";
    case Feature::kFP:
      return "fp";
    case Feature::kASIMD:
      return "asimd";
    case Feature::kSVE:
      return "sve";
    case Feature::kSVE2:
      return "sve2";
    case Feature::kCount:
      break;
  }
  return "unknown";
}

std::string FeatureSet::ToString() const {
  std::string result;
  for (std::size_t i = 0; i < kFeatureCount; ++i) {
    auto feature = static_cast<Feature>(i);
    if (!Has(feature)) {
      continue;
    }
    if (!result.empty()) {
      result += ' ';
    }
    result += FeatureName(feature);
  }
  return result;
}

}  // namespace mvdispatch::cpu
