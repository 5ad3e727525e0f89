// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_API_H_INCLUDED
#define SWATCH_CORE_API_H_INCLUDED

#include <stddef.h>
#include <stdint.h>
#include <stdarg.h>

#ifdef __cplusplus
  #include <type_traits>
#endif

//! \addtogroup sw_api_macros
//! \{

// Swatch - Version
// ================

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define SW_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! Swatch library version.
#define SW_VERSION SW_MAKE_VERSION(0, 9, 0)

// Swatch - Target Compiler
// ========================

//! \def SW_API
//!
//! A base API decorator that marks functions and variables exported by Swatch.
#if defined(SW_STATIC)
  #define SW_API
#elif defined(_WIN32)
  #if defined(SW_BUILD_EXPORT)
    #define SW_API __declspec(dllexport)
  #else
    #define SW_API __declspec(dllimport)
  #endif
#elif defined(__GNUC__)
  #define SW_API __attribute__((__visibility__("default")))
#else
  #define SW_API
#endif

//! \def SW_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(SW_BUILD_DEBUG)
  #define SW_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(SW_BUILD_DEBUG)
  #define SW_INLINE __forceinline
#else
  #define SW_INLINE inline
#endif

//! \def SW_INLINE_NODEBUG
//!
//! The same as `SW_INLINE` combined with `__attribute__((artificial))` when supported, so trivial wrappers
//! don't show up in a debugger.
#if defined(__clang__)
  #define SW_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__)
  #define SW_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define SW_INLINE_NODEBUG SW_INLINE
#endif

//! \def SW_INLINE_CONSTEXPR
//!
//! Like `SW_INLINE_NODEBUG`, but also `constexpr`.
#define SW_INLINE_CONSTEXPR constexpr SW_INLINE_NODEBUG

//! \def SW_NORETURN
//!
//! Function attribute used to mark functions that never return.
#if defined(__GNUC__)
  #define SW_NORETURN __attribute__((__noreturn__))
#elif defined(_MSC_VER)
  #define SW_NORETURN __declspec(noreturn)
#else
  #define SW_NORETURN
#endif

//! \def SW_CDECL
//!
//! CDECL function attribute - either `__cdecl` or nothing.
#if defined(_MSC_VER) && defined(_M_IX86)
  #define SW_CDECL __cdecl
#else
  #define SW_CDECL
#endif

//! \def SW_LIKELY(EXP)
//!
//! Branch prediction hint - the expression is likely to be true.
//!
//! \def SW_UNLIKELY(EXP)
//!
//! Branch prediction hint - the expression is unlikely to be true.
#if defined(__GNUC__)
  #define SW_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define SW_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define SW_LIKELY(...) (__VA_ARGS__)
  #define SW_UNLIKELY(...) (__VA_ARGS__)
#endif

#ifdef __cplusplus
  #define SW_BEGIN_C_DECLS extern "C" {
  #define SW_END_C_DECLS }
  #define SW_NOEXCEPT_C noexcept
#else
  #define SW_BEGIN_C_DECLS
  #define SW_END_C_DECLS
  #define SW_NOEXCEPT_C
#endif

//! Defines an enumeration used by Swatch that is `uint32_t`.
#ifdef __cplusplus
  #define SW_DEFINE_ENUM(NAME) enum NAME : uint32_t
#else
  #define SW_DEFINE_ENUM(NAME) typedef enum NAME NAME; enum NAME
#endif

//! \}

// Swatch - Result Codes
// =====================

//! \addtogroup sw_globals
//! \{

//! Result code used by most Swatch functions that can fail.
typedef uint32_t SWResult;

//! Result codes used by Swatch API.
SW_DEFINE_ENUM(SWResultCode) {
  //! Successful result code.
  SW_SUCCESS = 0,

  //! First error code that can be returned by Swatch API.
  SW_ERROR_START_INDEX = 0x00010000u,

  //! Out of memory                 [ENOMEM].
  SW_ERROR_OUT_OF_MEMORY = 0x00010000u,
  //! Invalid value/argument        [EINVAL].
  SW_ERROR_INVALID_VALUE,
  //! Invalid state                 [EFAULT].
  SW_ERROR_INVALID_STATE,
  //! Invalid geometry (degenerate transform, empty path, collapsed quad).
  SW_ERROR_INVALID_GEOMETRY,
  //! Image or scratch buffer would exceed `SW_RUNTIME_MAX_IMAGE_SIZE`.
  SW_ERROR_IMAGE_TOO_LARGE
};

//! \}

// Swatch - Internal Assertions
// ============================

SW_BEGIN_C_DECLS

//! Called by `SW_ASSERT()` when an assertion fails. Prints the message and terminates the process.
SW_API SW_NORETURN void sw_runtime_assertion_failure(const char* file, int line, const char* msg) SW_NOEXCEPT_C;

SW_END_C_DECLS

//! \def SW_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#if defined(SW_BUILD_DEBUG)
  #define SW_ASSERT(EXP)                                                      \
    do {                                                                      \
      if (SW_UNLIKELY(!(EXP)))                                                \
        sw_runtime_assertion_failure(__FILE__, __LINE__, #EXP);               \
    } while (0)
#else
  #define SW_ASSERT(EXP) ((void)0)
#endif

//! Propagates a result code returned by `...` expression if it's not `SW_SUCCESS`.
#define SW_PROPAGATE(...)                                                     \
  do {                                                                        \
    SWResult _result_to_propagate = (__VA_ARGS__);                            \
    if (SW_UNLIKELY(_result_to_propagate != SW_SUCCESS))                      \
      return _result_to_propagate;                                            \
  } while (0)

#ifdef __cplusplus

//! Returns the passed `result`.
//!
//! All Swatch functions that fail go through this function, so a single breakpoint is enough to catch the place
//! where an error originated.
static SW_INLINE_NODEBUG SWResult sw_make_error(SWResult result) noexcept { return result; }

// Swatch - Internal Utilities
// ===========================

namespace SWInternal {

template<typename T>
[[nodiscard]]
SW_INLINE_CONSTEXPR T min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
[[nodiscard]]
SW_INLINE_CONSTEXPR T max(const T& a, const T& b) noexcept { return a < b ? b : a; }

template<typename T>
SW_INLINE_NODEBUG void swap(T& a, T& b) noexcept {
  T t(static_cast<T&&>(a));
  a = static_cast<T&&>(b);
  b = static_cast<T&&>(t);
}

} // {SWInternal}

//! Returns the minimum of `a` and `b`.
template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR T sw_min(const T& a, const T& b) noexcept { return SWInternal::min(a, b); }

//! Returns the maximum of `a` and `b`.
template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR T sw_max(const T& a, const T& b) noexcept { return SWInternal::max(a, b); }

//! Clamps `a` to a range defined as `[b, c]`.
template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR T sw_clamp(const T& a, const T& b, const T& c) noexcept { return sw_min(c, sw_max(b, a)); }

//! Returns an absolute value of `a`.
template<typename T>
[[nodiscard]]
static SW_INLINE_CONSTEXPR T sw_abs(const T& a) noexcept { return a < T(0) ? T(-a) : a; }

#endif // __cplusplus

#endif // SWATCH_CORE_API_H_INCLUDED
