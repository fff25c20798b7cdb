/**
 * @file level_list.h
 * @brief Validated, highest-first list of CPU levels
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "cpu/cpu_level.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::cpu {

/**
 * @brief Ordered sequence of levels of one family, highest first
 *
 * Invariants (checked by Create): non-empty, single family, strictly
 * descending. A list that does not end in the family baseline is accepted
 * with a warning; resolution then falls back to its last entry.
 */
class LevelList {
 public:
  /**
   * @brief Validate and build a list
   * @return kDispatchEmptyLevelList or kDispatchInvalidLevelList on violation
   */
  static utils::Expected<LevelList, utils::Error> Create(std::vector<CpuLevel> levels);

  /**
   * @brief Parse a list of tags (config, CLI), then validate it
   */
  static utils::Expected<LevelList, utils::Error> FromTags(const std::vector<std::string>& tags);

  /**
   * @brief Canonical list of a family (unknown maps to the default family)
   */
  static LevelList Canonical(ArchFamily family);

  const std::vector<CpuLevel>& Levels() const { return levels_; }
  ArchFamily Family() const { return FamilyOf(levels_.front()); }

  size_t Size() const { return levels_.size(); }
  CpuLevel operator[](size_t index) const { return levels_[index]; }
  CpuLevel Front() const { return levels_.front(); }
  CpuLevel Back() const { return levels_.back(); }

  std::vector<CpuLevel>::const_iterator begin() const { return levels_.begin(); }
  std::vector<CpuLevel>::const_iterator end() const { return levels_.end(); }

  bool Contains(CpuLevel level) const;

  /**
   * @brief Tags joined with ", " (e.g. "x86_64_v3, x86_64")
   */
  std::string ToString() const;

  bool operator==(const LevelList& other) const { return levels_ == other.levels_; }
  bool operator!=(const LevelList& other) const { return levels_ != other.levels_; }

 private:
  explicit LevelList(std::vector<CpuLevel> levels) : levels_(std::move(levels)) {}

  std::vector<CpuLevel> levels_;
};

/**
 * @brief Canonical level list for the architecture a build targets
 *
 * Equivalent to LevelList::Canonical(); kUnknown logs an
 * `unknown_architecture` warning once and yields the x86_64 list.
 */
inline LevelList DefaultLevelsForArch(ArchFamily family) {
  return LevelList::Canonical(family);
}

}  // namespace mvdispatch::cpu
