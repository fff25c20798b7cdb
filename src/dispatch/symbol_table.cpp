/**
 * @file symbol_table.cpp
 * @brief SymbolTable implementation
 */

#include "dispatch/symbol_table.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

#include "dispatch/symbol_name.h"

namespace mvdispatch::dispatch {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

std::string ExportedSymbol::Name() const {
  return SymbolName(level, function);
}

SymbolTable& SymbolTable::Global() {
  static SymbolTable table;
  return table;
}

void SymbolTable::RegisterModule(const std::string& module, const std::vector<ExportedSymbol>& symbols,
                                 const std::vector<cpu::CpuLevel>& levels) {
  std::unique_lock lock(mutex_);
  for (const auto& symbol : symbols) {
    InsertLocked(symbol);
  }
  auto [it, inserted] = module_levels_.emplace(module, levels);
  if (!inserted) {
    spdlog::warn("Module '{}' registered twice; keeping its first level list", module);
  }
}

void SymbolTable::Register(const ExportedSymbol& symbol) {
  std::unique_lock lock(mutex_);
  InsertLocked(symbol);
}

void SymbolTable::InsertLocked(const ExportedSymbol& symbol) {
  auto name = symbol.Name();
  auto [it, inserted] = symbols_.emplace(name, symbol);
  if (!inserted) {
    spdlog::warn("Symbol '{}' registered twice; keeping the first registration", name);
  }
}

const ExportedSymbol* SymbolTable::Find(cpu::CpuLevel level, std::string_view function) const {
  std::shared_lock lock(mutex_);
  auto it = symbols_.find(SymbolName(level, function));
  if (it == symbols_.end()) {
    return nullptr;
  }
  // unordered_map nodes are stable, and entries are never erased
  return &it->second;
}

Expected<std::vector<cpu::CpuLevel>, Error> SymbolTable::ModuleLevels(const std::string& module) const {
  std::shared_lock lock(mutex_);
  auto it = module_levels_.find(module);
  if (it == module_levels_.end()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kDispatchModuleNotFound, "No multiversioned module named '" + module + "'"));
  }
  return it->second;
}

std::vector<std::string> SymbolTable::Modules() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> modules;
  modules.reserve(module_levels_.size());
  for (const auto& [name, levels] : module_levels_) {
    modules.push_back(name);
  }
  std::sort(modules.begin(), modules.end());
  return modules;
}

std::vector<ExportedSymbol> SymbolTable::Symbols() const {
  std::vector<std::pair<std::string, ExportedSymbol>> entries;
  {
    std::shared_lock lock(mutex_);
    entries.assign(symbols_.begin(), symbols_.end());
  }
  std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  std::vector<ExportedSymbol> result;
  result.reserve(entries.size());
  for (auto& entry : entries) {
    result.push_back(entry.second);
  }
  return result;
}

size_t SymbolTable::Size() const {
  std::shared_lock lock(mutex_);
  return symbols_.size();
}

}  // namespace mvdispatch::dispatch
