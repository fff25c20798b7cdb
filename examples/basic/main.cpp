/**
 * @file main.cpp
 * @brief Resolve the dot_product variants for this machine and call them
 */

#include <spdlog/spdlog.h>

#include <vector>

#include "cpu/cpu_detector.h"
#include "cpu/level_list.h"
#include "dispatch/resolver.h"
#include "dot_product.h"

int main() {
  spdlog::set_level(spdlog::level::debug);

  mvdispatch::cpu::CpuDetector detector(mvdispatch::cpu::ForceLevelSetting());
  mvdispatch::dispatch::Resolver resolver(detector);

  auto dot = MVDISPATCH_RESOLVE_FROM(resolver, dot_product, dot);
  if (!dot) {
    spdlog::error("{}", dot.error().to_string());
    return 1;
  }
  auto axpy = MVDISPATCH_RESOLVE_FROM(resolver, dot_product, axpy);
  if (!axpy) {
    spdlog::error("{}", axpy.error().to_string());
    return 1;
  }

  std::vector<float> a = {1.0F, 2.0F, 3.0F, 4.0F};
  std::vector<float> b = {5.0F, 6.0F, 7.0F, 8.0F};
  spdlog::info("dot = {}", (*dot)(a.data(), b.data(), a.size()));  // 70

  (*axpy)(2.0F, a.data(), b.data(), b.size());
  spdlog::info("dot after axpy = {}", (*dot)(a.data(), b.data(), a.size()));  // 130

  // Same function over an explicit list (only the levels the module was built with)
  auto levels = mvdispatch::cpu::LevelList::Canonical(detector.Family());
  auto baseline = resolver.ResolveForLevel<decltype(dot_product::dot)>("dot", levels.Levels(), levels.Back());
  if (!baseline) {
    spdlog::error("{}", baseline.error().to_string());
    return 1;
  }
  spdlog::info("baseline dot = {}", (*baseline)(a.data(), b.data(), a.size()));
  return 0;
}
