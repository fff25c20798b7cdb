/**
 * @file resolver.cpp
 * @brief Variant selection over a level list
 */

#include "dispatch/resolver.h"

#include "dispatch/symbol_name.h"
#include "utils/structured_log.h"

namespace mvdispatch::dispatch {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<cpu::CpuLevel, Error> SelectLevel(const std::vector<cpu::CpuLevel>& levels, cpu::CpuLevel detected) {
  if (levels.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kDispatchEmptyLevelList, "Cannot resolve from an empty level list"));
  }
  for (cpu::CpuLevel level : levels) {
    if (cpu::IsAtMost(level, detected)) {
      return level;
    }
  }
  return levels.back();
}

Expected<const ExportedSymbol*, Error> ResolveSymbol(const SymbolTable& table, const std::vector<cpu::CpuLevel>& levels,
                                                     cpu::CpuLevel detected, std::string_view function) {
  auto selected = SelectLevel(levels, detected);
  if (!selected) {
    return MakeUnexpected(MakeError(selected.error().code(), selected.error().message(), std::string(function)));
  }
  const cpu::CpuLevel chosen = *selected;

  const ExportedSymbol* symbol = table.Find(chosen, function);
  if (symbol == nullptr) {
    std::string name = SymbolName(chosen, function);
    utils::LogSymbolNotFound(name, std::string(cpu::LevelTag(detected)));
    return MakeUnexpected(MakeError(ErrorCode::kDispatchSymbolNotFound,
                                    "Symbol '" + name + "' is not linked into this program",
                                    "detected " + std::string(cpu::LevelTag(detected))));
  }

  utils::LogVariantResolved(std::string(function), std::string(cpu::LevelTag(detected)),
                            std::string(cpu::LevelTag(chosen)), symbol->Name());
  return symbol;
}

}  // namespace mvdispatch::dispatch
