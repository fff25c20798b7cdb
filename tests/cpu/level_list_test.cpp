/**
 * @file level_list_test.cpp
 * @brief Unit tests for LevelList validation
 */

#include "cpu/level_list.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace mvdispatch::cpu;
using mvdispatch::utils::ErrorCode;

TEST(LevelListTest, CreateValid) {
  auto list = LevelList::Create({CpuLevel::kX86_64V3, CpuLevel::kX86_64});
  ASSERT_TRUE(list) << list.error().to_string();
  EXPECT_EQ(list->Size(), 2);
  EXPECT_EQ(list->Front(), CpuLevel::kX86_64V3);
  EXPECT_EQ(list->Back(), CpuLevel::kX86_64);
  EXPECT_EQ(list->Family(), ArchFamily::kX86_64);
  EXPECT_TRUE(list->Contains(CpuLevel::kX86_64));
  EXPECT_FALSE(list->Contains(CpuLevel::kX86_64V2));
  EXPECT_EQ(list->ToString(), "x86_64_v3, x86_64");
}

TEST(LevelListTest, SingleLevel) {
  auto list = LevelList::Create({CpuLevel::kAarch64});
  ASSERT_TRUE(list);
  EXPECT_EQ(list->Size(), 1);
  EXPECT_EQ((*list)[0], CpuLevel::kAarch64);
}

TEST(LevelListTest, EmptyRejected) {
  auto list = LevelList::Create({});
  ASSERT_FALSE(list);
  EXPECT_EQ(list.error().code(), ErrorCode::kDispatchEmptyLevelList);
}

TEST(LevelListTest, MixedFamiliesRejected) {
  auto list = LevelList::Create({CpuLevel::kX86_64V3, CpuLevel::kAarch64});
  ASSERT_FALSE(list);
  EXPECT_EQ(list.error().code(), ErrorCode::kDispatchInvalidLevelList);
}

TEST(LevelListTest, AscendingRejected) {
  auto list = LevelList::Create({CpuLevel::kX86_64, CpuLevel::kX86_64V3});
  ASSERT_FALSE(list);
  EXPECT_EQ(list.error().code(), ErrorCode::kDispatchInvalidLevelList);
}

TEST(LevelListTest, DuplicateRejected) {
  auto list = LevelList::Create({CpuLevel::kAarch64Sve, CpuLevel::kAarch64Sve, CpuLevel::kAarch64});
  ASSERT_FALSE(list);
  EXPECT_EQ(list.error().code(), ErrorCode::kDispatchInvalidLevelList);
}

/**
 * @brief A list without the baseline is allowed (resolution falls back to its last entry)
 */
TEST(LevelListTest, MissingBaselineAccepted) {
  auto list = LevelList::Create({CpuLevel::kX86_64V4, CpuLevel::kX86_64V3});
  ASSERT_TRUE(list);
  EXPECT_EQ(list->Back(), CpuLevel::kX86_64V3);
}

TEST(LevelListTest, FromTags) {
  auto list = LevelList::FromTags({"aarch64_sve2", "aarch64"});
  ASSERT_TRUE(list);
  EXPECT_EQ(list->Levels(), (std::vector<CpuLevel>{CpuLevel::kAarch64Sve2, CpuLevel::kAarch64}));

  auto unknown = LevelList::FromTags({"x86_64_v3", "i686"});
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().code(), ErrorCode::kCpuUnknownLevel);

  auto empty = LevelList::FromTags({});
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code(), ErrorCode::kDispatchEmptyLevelList);
}

TEST(LevelListTest, Canonical) {
  LevelList x86 = LevelList::Canonical(ArchFamily::kX86_64);
  EXPECT_EQ(x86.ToString(), "x86_64_v4, x86_64_v3, x86_64_v2, x86_64");

  LevelList arm = LevelList::Canonical(ArchFamily::kAarch64);
  EXPECT_EQ(arm.ToString(), "aarch64_sve2, aarch64_sve, aarch64");

  // Unknown architectures get the default family's list
  EXPECT_EQ(LevelList::Canonical(ArchFamily::kUnknown), x86);
  EXPECT_EQ(DefaultLevelsForArch(ArchFamily::kAarch64), arm);
}

TEST(LevelListTest, CanonicalListsAreValid) {
  for (ArchFamily family : {ArchFamily::kX86_64, ArchFamily::kAarch64}) {
    LevelList canonical = LevelList::Canonical(family);
    auto recreated = LevelList::Create(canonical.Levels());
    ASSERT_TRUE(recreated);
    EXPECT_EQ(*recreated, canonical);
    EXPECT_EQ(canonical.Back(), BaselineFor(family));
  }
}

TEST(LevelListTest, Iteration) {
  LevelList arm = LevelList::Canonical(ArchFamily::kAarch64);
  std::vector<std::string> tags;
  for (CpuLevel level : arm) {
    tags.emplace_back(LevelTag(level));
  }
  EXPECT_EQ(tags, (std::vector<std::string>{"aarch64_sve2", "aarch64_sve", "aarch64"}));
}
