/**
 * @file symbol_name.h
 * @brief Exported symbol naming: {levelTag}_{functionName}
 */

#pragma once

#include <string>
#include <string_view>

#include "cpu/cpu_level.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mvdispatch::dispatch {

/**
 * @brief Symbol exported for one (level, function) pair
 *
 * SymbolName(kX86_64V3, "dot") == "x86_64_v3_dot"
 */
std::string SymbolName(cpu::CpuLevel level, std::string_view function);

/**
 * @brief Components of a parsed symbol name
 */
struct ParsedSymbol {
  cpu::CpuLevel level;
  std::string function;
};

/**
 * @brief Split a symbol back into level and function name
 *
 * The split is not always unique: SymbolName(kX86_64, "v3_dot") and
 * SymbolName(kX86_64V3, "dot") are the same string. The longest matching
 * tag wins, so "x86_64_v3_dot" parses as level x86_64_v3, function "dot".
 * Function names starting with a tag suffix (v2_, v3_, v4_, sve_, sve2_)
 * do not round-trip through this function.
 *
 * @return kDispatchInvalidSymbolName if no tag prefix matches or the
 *         function part is empty
 */
utils::Expected<ParsedSymbol, utils::Error> ParseSymbolName(std::string_view symbol);

/**
 * @brief True if `name` is a valid C identifier (usable as a function name)
 */
bool IsValidFunctionName(std::string_view name);

}  // namespace mvdispatch::dispatch
