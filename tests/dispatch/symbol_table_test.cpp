/**
 * @file symbol_table_test.cpp
 * @brief Unit tests for SymbolTable
 */

#include "dispatch/symbol_table.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace mvdispatch::dispatch;
using mvdispatch::cpu::CpuLevel;
using mvdispatch::utils::ErrorCode;

namespace {

int BaselineAnswer() {
  return 1;
}
int V3Answer() {
  return 3;
}

const ErasedFn kBaselineSlot = reinterpret_cast<ErasedFn>(&BaselineAnswer);
const ErasedFn kV3Slot = reinterpret_cast<ErasedFn>(&V3Answer);

}  // namespace

TEST(SymbolTableTest, RegisterAndFind) {
  SymbolTable table;
  table.RegisterModule("answer",
                       {ExportedSymbol{CpuLevel::kX86_64V3, "answer", &kV3Slot},
                        ExportedSymbol{CpuLevel::kX86_64, "answer", &kBaselineSlot}},
                       {CpuLevel::kX86_64V3, CpuLevel::kX86_64});

  EXPECT_EQ(table.Size(), 2);

  const ExportedSymbol* v3 = table.Find(CpuLevel::kX86_64V3, "answer");
  ASSERT_NE(v3, nullptr);
  EXPECT_EQ(v3->Name(), "x86_64_v3_answer");
  EXPECT_EQ(reinterpret_cast<int (*)()>(v3->Load())(), 3);

  EXPECT_EQ(table.Find(CpuLevel::kX86_64V2, "answer"), nullptr);
  EXPECT_EQ(table.Find(CpuLevel::kX86_64V3, "question"), nullptr);
}

TEST(SymbolTableTest, ModuleLevels) {
  SymbolTable table;
  table.RegisterModule("answer", {}, {CpuLevel::kAarch64Sve, CpuLevel::kAarch64});

  auto levels = table.ModuleLevels("answer");
  ASSERT_TRUE(levels);
  EXPECT_EQ(*levels, (std::vector<CpuLevel>{CpuLevel::kAarch64Sve, CpuLevel::kAarch64}));

  auto missing = table.ModuleLevels("question");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kDispatchModuleNotFound);
}

TEST(SymbolTableTest, DuplicateKeepsFirst) {
  SymbolTable table;
  table.Register(ExportedSymbol{CpuLevel::kX86_64, "answer", &kBaselineSlot});
  table.Register(ExportedSymbol{CpuLevel::kX86_64, "answer", &kV3Slot});

  EXPECT_EQ(table.Size(), 1);
  const ExportedSymbol* symbol = table.Find(CpuLevel::kX86_64, "answer");
  ASSERT_NE(symbol, nullptr);
  EXPECT_EQ(symbol->slot, &kBaselineSlot);
}

TEST(SymbolTableTest, ListingsAreSorted) {
  SymbolTable table;
  table.RegisterModule("zeta", {ExportedSymbol{CpuLevel::kX86_64V3, "answer", &kV3Slot}}, {CpuLevel::kX86_64V3});
  table.RegisterModule("alpha", {ExportedSymbol{CpuLevel::kX86_64, "answer", &kBaselineSlot}}, {CpuLevel::kX86_64});

  EXPECT_EQ(table.Modules(), (std::vector<std::string>{"alpha", "zeta"}));

  auto symbols = table.Symbols();
  ASSERT_EQ(symbols.size(), 2);
  EXPECT_EQ(symbols[0].Name(), "x86_64_answer");
  EXPECT_EQ(symbols[1].Name(), "x86_64_v3_answer");
}

TEST(SymbolTableTest, ConcurrentReaders) {
  SymbolTable table;
  table.Register(ExportedSymbol{CpuLevel::kX86_64, "answer", &kBaselineSlot});

  std::vector<std::thread> threads;
  std::vector<int> found(4, 0);
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i]() {
      for (int j = 0; j < 1000; ++j) {
        if (table.Find(CpuLevel::kX86_64, "answer") != nullptr) {
          ++found[i];
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (int count : found) {
    EXPECT_EQ(count, 1000);
  }
}
