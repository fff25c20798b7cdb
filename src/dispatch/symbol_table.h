/**
 * @file symbol_table.h
 * @brief Registry of the level-tagged symbols linked into the process
 */

#pragma once

#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cpu/cpu_level.h"
#include "dispatch/export.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::dispatch {

/**
 * @brief One exported (level, function) pair
 *
 * `slot` is the address of the linked `<tag>_<function>` constant. It is
 * dereferenced only on Load(), so registration does not depend on the
 * initialization order of the level objects.
 */
struct ExportedSymbol {
  cpu::CpuLevel level;
  const char* function;
  const ErasedFn* slot;

  std::string Name() const;
  ErasedFn Load() const { return *slot; }
};

/**
 * @brief Symbols and built level lists of every multiversioned module
 *
 * Filled by the generated symbol units during static initialization (and by
 * dlopen'ed modules when they load); read-only for practical purposes
 * afterwards. All methods are thread-safe.
 */
class SymbolTable {
 public:
  SymbolTable() = default;
  SymbolTable(const SymbolTable&) = delete;
  SymbolTable& operator=(const SymbolTable&) = delete;

  /**
   * @brief Process-wide table the generated symbol units register into
   */
  static SymbolTable& Global();

  /**
   * @brief Register a module's symbols and the levels it was built for
   *
   * A symbol already present keeps its first registration (a warning is
   * logged); the linker normally rejects such duplicates first.
   */
  void RegisterModule(const std::string& module, const std::vector<ExportedSymbol>& symbols,
                      const std::vector<cpu::CpuLevel>& levels);

  /**
   * @brief Add a single symbol outside any module
   */
  void Register(const ExportedSymbol& symbol);

  /**
   * @brief Look up the symbol of a (level, function) pair
   * @return nullptr if that pair was never built
   */
  const ExportedSymbol* Find(cpu::CpuLevel level, std::string_view function) const;

  /**
   * @brief Level list a module was built with, highest first
   * @return kDispatchModuleNotFound for unknown modules
   */
  utils::Expected<std::vector<cpu::CpuLevel>, utils::Error> ModuleLevels(const std::string& module) const;

  std::vector<std::string> Modules() const;

  /**
   * @brief All registered symbols, sorted by name
   */
  std::vector<ExportedSymbol> Symbols() const;

  size_t Size() const;

 private:
  void InsertLocked(const ExportedSymbol& symbol);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, ExportedSymbol> symbols_;  ///< Keyed by symbol name
  std::unordered_map<std::string, std::vector<cpu::CpuLevel>> module_levels_;
};

/**
 * @brief Static-initialization hook used by generated symbol units
 *
 * @code
 * const SymbolRegistrar kRegistrar("dot_product", {...symbols...}, {...levels...});
 * @endcode
 */
class SymbolRegistrar {
 public:
  SymbolRegistrar(const char* module, const std::vector<ExportedSymbol>& symbols,
                  const std::vector<cpu::CpuLevel>& levels) {
    SymbolTable::Global().RegisterModule(module, symbols, levels);
  }
};

}  // namespace mvdispatch::dispatch
