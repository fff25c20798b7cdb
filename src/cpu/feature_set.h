/**
 * @file feature_set.h
 * @brief Hardware feature flags and a constexpr bitmask set of them
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace mvdispatch::cpu {

/**
 * @brief Hardware features probed on the host
 *
 * Values are bit positions in FeatureSet.
 */
enum class Feature : std::uint8_t {
  // x86_64
  kSSE = 0,
  kSSE2,
  kSSE3,
  kSSSE3,
  kSSE4_1,
  kSSE4_2,
  kPOPCNT,
  kCX16,
  kLAHF,  ///< LAHF/SAHF in 64-bit mode
  kAVX,
  kAVX2,
  kBMI1,
  kBMI2,
  kF16C,
  kFMA,
  kLZCNT,
  kMOVBE,
  kOSXSAVE,
  kAVX512F,
  kAVX512BW,
  kAVX512CD,
  kAVX512DQ,
  kAVX512VL,

  // aarch64
  kFP,
  kASIMD,
  kSVE,
  kSVE2,

  kCount  ///< Number of features (not a feature)
};

constexpr std::size_t kFeatureCount = static_cast<std::size_t>(Feature::kCount);

/**
 * @brief Printable name of a feature (e.g. "sse4.1", "avx512f")
 */
const char* FeatureName(Feature feature);

/**
 * @brief Set of features backed by a 64-bit mask
 */
class FeatureSet {
 public:
  constexpr FeatureSet() = default;

  constexpr FeatureSet(std::initializer_list<Feature> features) {
    for (Feature feature : features) {
      bits_ |= Bit(feature);
    }
  }

  static constexpr FeatureSet FromBits(std::uint64_t bits) {
    FeatureSet set;
    set.bits_ = bits;
    return set;
  }

  constexpr std::uint64_t Bits() const { return bits_; }
  constexpr bool Empty() const { return bits_ == 0; }

  constexpr bool Has(Feature feature) const { return (bits_ & Bit(feature)) != 0; }

  constexpr FeatureSet& Add(Feature feature) {
    bits_ |= Bit(feature);
    return *this;
  }

  constexpr FeatureSet& Remove(Feature feature) {
    bits_ &= ~Bit(feature);
    return *this;
  }

  /**
   * @brief Conditionally add a feature (probe helper)
   */
  constexpr FeatureSet& Set(Feature feature, bool present) { return present ? Add(feature) : Remove(feature); }

  constexpr bool IsSubsetOf(const FeatureSet& other) const { return (bits_ & ~other.bits_) == 0; }
  constexpr bool IsSupersetOf(const FeatureSet& other) const { return other.IsSubsetOf(*this); }

  /// Superset and not equal
  constexpr bool IsStrictSupersetOf(const FeatureSet& other) const {
    return IsSupersetOf(other) && bits_ != other.bits_;
  }

  constexpr FeatureSet Union(const FeatureSet& other) const { return FromBits(bits_ | other.bits_); }
  constexpr FeatureSet Intersection(const FeatureSet& other) const { return FromBits(bits_ & other.bits_); }
  constexpr FeatureSet Minus(const FeatureSet& other) const { return FromBits(bits_ & ~other.bits_); }

  constexpr bool operator==(const FeatureSet& other) const { return bits_ == other.bits_; }
  constexpr bool operator!=(const FeatureSet& other) const { return bits_ != other.bits_; }

  /**
   * @brief Space-separated feature names in enum order (e.g. "sse sse2 avx")
   */
  std::string ToString() const;

 private:
  static constexpr std::uint64_t Bit(Feature feature) { return std::uint64_t{1} << static_cast<unsigned>(feature); }

  std::uint64_t bits_ = 0;
};

static_assert(kFeatureCount <= 64, "FeatureSet is a 64-bit mask");

}  // namespace mvdispatch::cpu
