/**
 * @file resolver.h
 * @brief Runtime selection of the best variant for the host CPU
 *
 * Usage:
 * @code
 * cpu::CpuDetector detector;
 * dispatch::Resolver resolver(detector);
 *
 * auto dot = MVDISPATCH_RESOLVE_FROM(resolver, dot_product, dot);
 * if (!dot) {
 *   spdlog::error("{}", dot.error().to_string());
 *   return 1;
 * }
 * float result = (*dot)(a, b);
 * @endcode
 */

#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "cpu/cpu_detector.h"
#include "cpu/cpu_level.h"
#include "cpu/level_list.h"
#include "dispatch/symbol_table.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::dispatch {

/**
 * @brief Level a host at `detected` runs from `levels`
 *
 * The first entry not above `detected` (same family), else the last entry.
 *
 * @return kDispatchEmptyLevelList if `levels` is empty
 */
utils::Expected<cpu::CpuLevel, utils::Error> SelectLevel(const std::vector<cpu::CpuLevel>& levels,
                                                         cpu::CpuLevel detected);

/**
 * @brief Pick the symbol of `function` for a detected level
 *
 * The level comes from SelectLevel(). The chosen pair must exist in
 * `table`; there is no silent fallback to another level.
 *
 * @return kDispatchEmptyLevelList or kDispatchSymbolNotFound on failure
 */
utils::Expected<const ExportedSymbol*, utils::Error> ResolveSymbol(const SymbolTable& table,
                                                                   const std::vector<cpu::CpuLevel>& levels,
                                                                   cpu::CpuLevel detected, std::string_view function);

/**
 * @brief Typed resolution bound to a detector and a symbol table
 *
 * `Fn` is the function type of the variant, e.g. `float(const float*, const float*)`.
 * Calling the result with a different type than the variant was defined with
 * is undefined behavior; MVDISPATCH_RESOLVE_FROM derives `Fn` from the
 * module's declaration to rule that out.
 */
class Resolver {
 public:
  explicit Resolver(const cpu::CpuDetector& detector, const SymbolTable& table = SymbolTable::Global())
      : detector_(detector), table_(table) {}

  /**
   * @brief Resolve `function` over an explicit level list, using the detected level
   */
  template <typename Fn>
  utils::Expected<Fn*, utils::Error> Resolve(std::string_view function,
                                             const std::vector<cpu::CpuLevel>& levels) const {
    return ResolveForLevel<Fn>(function, levels, detector_.Detect());
  }

  template <typename Fn>
  utils::Expected<Fn*, utils::Error> Resolve(std::string_view function, const cpu::LevelList& levels) const {
    return Resolve<Fn>(function, levels.Levels());
  }

  /**
   * @brief Resolve as if the host were at `detected` (no detection)
   */
  template <typename Fn>
  utils::Expected<Fn*, utils::Error> ResolveForLevel(std::string_view function,
                                                     const std::vector<cpu::CpuLevel>& levels,
                                                     cpu::CpuLevel detected) const {
    static_assert(std::is_function_v<Fn>, "Fn must be a function type, e.g. float(const float*, const float*)");
    auto symbol = ResolveSymbol(table_, levels, detected, function);
    if (!symbol) {
      return utils::MakeUnexpected(symbol.error());
    }
    return reinterpret_cast<Fn*>((*symbol)->Load());
  }

  /**
   * @brief Resolve over the levels `module` was built with
   */
  template <typename Fn>
  utils::Expected<Fn*, utils::Error> ResolveFrom(const std::string& module, std::string_view function) const {
    auto levels = table_.ModuleLevels(module);
    if (!levels) {
      return utils::MakeUnexpected(levels.error());
    }
    return Resolve<Fn>(function, *levels);
  }

  const cpu::CpuDetector& Detector() const { return detector_; }
  const SymbolTable& Table() const { return table_; }

 private:
  const cpu::CpuDetector& detector_;
  const SymbolTable& table_;
};

/**
 * @brief Resolve with the process-owned DefaultDetector() and the global table
 *
 * For code with no access to the application's detector (plugins, dlopen'ed
 * modules).
 */
template <typename Fn>
utils::Expected<Fn*, utils::Error> ResolveNoContext(std::string_view function,
                                                    const std::vector<cpu::CpuLevel>& levels) {
  return Resolver(cpu::DefaultDetector()).Resolve<Fn>(function, levels);
}

template <typename Fn>
utils::Expected<Fn*, utils::Error> ResolveFromNoContext(const std::string& module, std::string_view function) {
  return Resolver(cpu::DefaultDetector()).ResolveFrom<Fn>(module, function);
}

}  // namespace mvdispatch::dispatch

/**
 * @brief Resolve `module::function` with the signature of its declaration
 *
 * `module` is the namespace declared by the module header (NAME in
 * mvdispatch_add_multiversion) and also the registered module name.
 */
#define MVDISPATCH_RESOLVE_FROM(resolver, module, function) \
  (resolver).ResolveFrom<decltype(module::function)>(#module, #function)

#define MVDISPATCH_RESOLVE_FROM_NO_CONTEXT(module, function) \
  ::mvdispatch::dispatch::ResolveFromNoContext<decltype(module::function)>(#module, #function)
