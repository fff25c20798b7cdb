/**
 * @file level_list.cpp
 * @brief LevelList validation
 */

#include "cpu/level_list.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mvdispatch::cpu {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

std::string JoinTags(const std::vector<CpuLevel>& levels) {
  std::string result;
  for (CpuLevel level : levels) {
    if (!result.empty()) {
      result += ", ";
    }
    result += LevelTag(level);
  }
  return result;
}

}  // namespace

Expected<LevelList, Error> LevelList::Create(std::vector<CpuLevel> levels) {
  if (levels.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kDispatchEmptyLevelList, "Level list is empty"));
  }

  const ArchFamily family = FamilyOf(levels.front());
  for (size_t i = 1; i < levels.size(); ++i) {
    if (FamilyOf(levels[i]) != family) {
      return MakeUnexpected(MakeError(ErrorCode::kDispatchInvalidLevelList, "Level list mixes architecture families",
                                      JoinTags(levels)));
    }
    // Same family, so the comparison always has a value
    if (CompareLevels(levels[i - 1], levels[i]).value_or(0) <= 0) {
      return MakeUnexpected(MakeError(ErrorCode::kDispatchInvalidLevelList,
                                      "Level list must be strictly descending (highest first)", JoinTags(levels)));
    }
  }

  if (levels.back() != BaselineFor(family)) {
    spdlog::warn("Level list [{}] does not end in the {} baseline; hosts below {} fall back to it", JoinTags(levels),
                 FamilyName(family), LevelTag(levels.back()));
  }
  return LevelList(std::move(levels));
}

Expected<LevelList, Error> LevelList::FromTags(const std::vector<std::string>& tags) {
  std::vector<CpuLevel> levels;
  levels.reserve(tags.size());
  for (const auto& tag : tags) {
    auto level = ParseLevel(tag);
    if (!level) {
      return MakeUnexpected(level.error());
    }
    levels.push_back(*level);
  }
  return Create(std::move(levels));
}

LevelList LevelList::Canonical(ArchFamily family) {
  if (EffectiveFamily(family) == ArchFamily::kAarch64) {
    return LevelList(std::vector<CpuLevel>(kAarch64Levels.begin(), kAarch64Levels.end()));
  }
  return LevelList(std::vector<CpuLevel>(kX86_64Levels.begin(), kX86_64Levels.end()));
}

bool LevelList::Contains(CpuLevel level) const {
  return std::find(levels_.begin(), levels_.end(), level) != levels_.end();
}

std::string LevelList::ToString() const {
  return JoinTags(levels_);
}

}  // namespace mvdispatch::cpu
