/**
 * @file symbol_name.cpp
 * @brief Symbol naming implementation
 */

#include "dispatch/symbol_name.h"

#include <cctype>

namespace mvdispatch::dispatch {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

std::string SymbolName(cpu::CpuLevel level, std::string_view function) {
  std::string symbol(cpu::LevelTag(level));
  symbol += '_';
  symbol += function;
  return symbol;
}

Expected<ParsedSymbol, Error> ParseSymbolName(std::string_view symbol) {
  const cpu::CpuLevel* best = nullptr;
  size_t best_length = 0;

  for (const cpu::CpuLevel& level : cpu::kAllLevels) {
    std::string_view tag = cpu::LevelTag(level);
    if (symbol.size() > tag.size() + 1 && symbol.substr(0, tag.size()) == tag && symbol[tag.size()] == '_' &&
        tag.size() > best_length) {
      best = &level;
      best_length = tag.size();
    }
  }

  if (best == nullptr) {
    return MakeUnexpected(
        MakeError(ErrorCode::kDispatchInvalidSymbolName, "Symbol has no level tag prefix", std::string(symbol)));
  }

  ParsedSymbol parsed{*best, std::string(symbol.substr(best_length + 1))};
  if (!IsValidFunctionName(parsed.function)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kDispatchInvalidSymbolName, "Invalid function name in symbol", std::string(symbol)));
  }
  return parsed;
}

bool IsValidFunctionName(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  auto first = static_cast<unsigned char>(name.front());
  if (std::isalpha(first) == 0 && first != '_') {
    return false;
  }
  for (char chr : name) {
    auto uchr = static_cast<unsigned char>(chr);
    if (std::isalnum(uchr) == 0 && uchr != '_') {
      return false;
    }
  }
  return true;
}

}  // namespace mvdispatch::dispatch
