/**
 * @file export.h
 * @brief Export / import macros for multiversioned functions
 *
 * A multiversioned source unit is compiled once per CPU level. Its functions
 * have internal linkage; each exported one is published as
 *
 * @code
 * extern "C" const ErasedFn x86_64_v3_dot = reinterpret_cast<ErasedFn>(&dot);
 * @endcode
 *
 * so N level builds of the same unit link together without collisions.
 *
 * Functions are listed in a registration list (X-macro) next to the unit,
 * each tagged with its calling convention:
 *
 * @code
 * #define DOT_PRODUCT_EXPORTS(X) \
 *   X(C, dot)                    \
 *   X(CXX, horizontal_sum)
 * @endcode
 *
 * `C` entries are exported and must have a C-compatible signature; `CXX`
 * entries are internal helpers and are skipped.
 *
 * This header must stay free of out-of-line code: it is included by every
 * level build.
 */

#pragma once

#include <type_traits>

#include "cpu/compile_time_level.h"

namespace mvdispatch::dispatch {

/**
 * @brief Type-erased function pointer stored in exported symbols
 */
using ErasedFn = void (*)();

namespace detail {

template <typename T>
constexpr bool kIsCType = std::is_void_v<T> || std::is_arithmetic_v<T> || std::is_enum_v<T> ||
                          std::is_pointer_v<T> || (std::is_trivial_v<T> && std::is_standard_layout_v<T>);

}  // namespace detail

/**
 * @brief True for function pointers whose signature C can call
 */
template <typename Fn>
struct IsCCallable : std::false_type {};

template <typename R, typename... Args>
struct IsCCallable<R (*)(Args...)>
    : std::bool_constant<detail::kIsCType<R> && (detail::kIsCType<Args> && ...)> {};

template <typename R, typename... Args>
struct IsCCallable<R (*)(Args...) noexcept>
    : std::bool_constant<detail::kIsCType<R> && (detail::kIsCType<Args> && ...)> {};

}  // namespace mvdispatch::dispatch

#define MVDISPATCH_STRINGIFY_IMPL(x) #x
#define MVDISPATCH_STRINGIFY(x) MVDISPATCH_STRINGIFY_IMPL(x)

#define MVDISPATCH_SYMBOL_IMPL(level, name) level##_##name

/**
 * @brief Exported symbol token for (level tag, function name)
 *
 * MVDISPATCH_SYMBOL(x86_64_v3, dot) -> x86_64_v3_dot. Arguments are
 * macro-expanded first, so MVDISPATCH_VARIANT_TAG can be passed.
 */
#define MVDISPATCH_SYMBOL(level, name) MVDISPATCH_SYMBOL_IMPL(level, name)

/**
 * @brief CpuLevel value of a bare tag token
 */
#define MVDISPATCH_LEVEL_OF(tag) (*::mvdispatch::cpu::LevelFromTag(MVDISPATCH_STRINGIFY(tag)))

// ---------------------------------------------------------------------------
// Export side (level builds)
// ---------------------------------------------------------------------------

/**
 * @brief Export `fn` as {tag of this build}_{name}
 */
#define MVDISPATCH_EXPORT_AS(name, fn)                                                                   \
  static_assert(::mvdispatch::dispatch::IsCCallable<decltype(&fn)>::value,                               \
                "exported function '" #name "' must have a C-compatible signature");                     \
  extern "C" const ::mvdispatch::dispatch::ErasedFn MVDISPATCH_SYMBOL(MVDISPATCH_VARIANT_TAG, name) = \
      reinterpret_cast<::mvdispatch::dispatch::ErasedFn>(&fn);

#define MVDISPATCH_EXPORT_C(name) MVDISPATCH_EXPORT_AS(name, name)
#define MVDISPATCH_EXPORT_CXX(name)
#define MVDISPATCH_EXPORT_ENTRY(conv, name) MVDISPATCH_EXPORT_##conv(name)

/**
 * @brief Export every C-tagged entry of a registration list
 */
#define MVDISPATCH_EXPORT_ALL(LIST) LIST(MVDISPATCH_EXPORT_ENTRY)

/**
 * @brief Fail the build unless this unit is compiled for level `tag`
 *
 * Checks the requested tag against both the preprocessor tag and
 * CompileTimeLevel(); a mismatch means the CPU model flag was wrong.
 */
#define MVDISPATCH_CHECK_VARIANT_LEVEL(tag)                                                            \
  static_assert(::mvdispatch::cpu::LevelFromTag(MVDISPATCH_STRINGIFY(tag)).has_value(),                \
                "unknown CPU level tag '" MVDISPATCH_STRINGIFY(tag) "'");                              \
  static_assert(::mvdispatch::cpu::LevelFromTag(MVDISPATCH_STRINGIFY(tag)) ==                          \
                    ::mvdispatch::cpu::LevelFromTag(MVDISPATCH_STRINGIFY(MVDISPATCH_VARIANT_TAG)),     \
                "level build '" MVDISPATCH_STRINGIFY(tag) "' was compiled as '" MVDISPATCH_STRINGIFY( \
                    MVDISPATCH_VARIANT_TAG) "' (wrong -march / -mcpu)");                               \
  static_assert(::mvdispatch::cpu::LevelFromTag(MVDISPATCH_STRINGIFY(tag)) ==                          \
                    ::mvdispatch::cpu::CompileTimeLevel(),                                             \
                "level build '" MVDISPATCH_STRINGIFY(tag) "' does not match CompileTimeLevel()")

#define MVDISPATCH_CHECK_SIGNATURE_C(name)                                                         \
  static_assert(std::is_same_v<decltype(&name), decltype(&::mvdispatch_declared_module_::name)>, \
                "definition of '" #name "' does not match its declaration");
#define MVDISPATCH_CHECK_SIGNATURE_CXX(name)
#define MVDISPATCH_CHECK_SIGNATURE_ENTRY(conv, name) MVDISPATCH_CHECK_SIGNATURE_##conv(name)

/**
 * @brief Compare every C-tagged definition with its declaration in namespace `ns`
 *
 * Use once per translation unit, at global scope.
 */
#define MVDISPATCH_CHECK_SIGNATURES(LIST, ns) \
  namespace mvdispatch_declared_module_ = ns; \
  LIST(MVDISPATCH_CHECK_SIGNATURE_ENTRY)

// ---------------------------------------------------------------------------
// Import side (host-compiled symbol unit)
// ---------------------------------------------------------------------------

/**
 * @brief Declare the exported symbol of (level tag, name)
 */
#define MVDISPATCH_IMPORT(level, name) \
  extern "C" const ::mvdispatch::dispatch::ErasedFn MVDISPATCH_SYMBOL(level, name);

// The list-driven import forms read the level from MVDISPATCH_IMPORT_LEVEL,
// which the symbol unit defines around each expansion.
#define MVDISPATCH_IMPORT_C(name) MVDISPATCH_IMPORT(MVDISPATCH_IMPORT_LEVEL, name)
#define MVDISPATCH_IMPORT_CXX(name)
#define MVDISPATCH_IMPORT_ENTRY(conv, name) MVDISPATCH_IMPORT_##conv(name)
#define MVDISPATCH_IMPORT_ALL(LIST) LIST(MVDISPATCH_IMPORT_ENTRY)

#define MVDISPATCH_TABLE_C(name)                                                                  \
  ::mvdispatch::dispatch::ExportedSymbol{MVDISPATCH_LEVEL_OF(MVDISPATCH_IMPORT_LEVEL), #name, \
                                         &MVDISPATCH_SYMBOL(MVDISPATCH_IMPORT_LEVEL, name)},
#define MVDISPATCH_TABLE_CXX(name)
#define MVDISPATCH_TABLE_ENTRY(conv, name) MVDISPATCH_TABLE_##conv(name)

/**
 * @brief ExportedSymbol initializers for every C-tagged entry at MVDISPATCH_IMPORT_LEVEL
 */
#define MVDISPATCH_TABLE_ALL(LIST) LIST(MVDISPATCH_TABLE_ENTRY)
