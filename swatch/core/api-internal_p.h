// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_API_INTERNAL_P_H_INCLUDED
#define SWATCH_CORE_API_INTERNAL_P_H_INCLUDED

#include <swatch/core/api.h>

// C Headers
// =========

// NOTE: Some headers are already included by <api.h>. This should be useful for creating an overview of what
// Swatch really needs globally to be included.
#include <math.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

#if defined(_WIN32)
  //! \cond NEVER
  #if !defined(WIN32_LEAN_AND_MEAN)
    #define WIN32_LEAN_AND_MEAN
  #endif
  #if !defined(NOMINMAX)
    #define NOMINMAX
  #endif
  //! \endcond

  #include <windows.h>
#endif

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

// C++ Compiler Support
// ====================

//! \def SW_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define SW_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define SW_HIDDEN
#endif

//! \def SW_NOINLINE
//!
//! Decorates a function that should never be inlined. Used by functions that are called rarely, like buffer
//! reallocation or table construction.
#if defined(__GNUC__)
  #define SW_NOINLINE __attribute__((__noinline__))
#elif defined(_MSC_VER)
  #define SW_NOINLINE __declspec(noinline)
#else
  #define SW_NOINLINE
#endif

//! \def SW_API_IMPL
//!
//! Decorator used to mark all functions and variables that are exported - it expands to "extern C", which ensures
//! that an exported function can be implemented within a private namespace and it would still be exported properly.
#define SW_API_IMPL extern "C" SW_API

#define SW_STRINGIFY_WRAP(N) #N
#define SW_STRINGIFY(N) SW_STRINGIFY_WRAP(N)

#define SW_STATIC_ASSERT(...) static_assert(__VA_ARGS__, "Failed SW_STATIC_ASSERT(" #__VA_ARGS__ ")")

// Internal C++ Macros
// ===================

//! \def SW_NONCOPYABLE
//!
//! Makes a class noncopyable by making its copy constructor and copy assignment operator deleted.
#define SW_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

#if defined(_MSC_VER)
  #define SW_RESTRICT __restrict
#elif defined(__GNUC__)
  #define SW_RESTRICT __restrict__
#else
  #define SW_RESTRICT
#endif

#define SW_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

// Internal Macros
// ===============

#define SW_RETURN_ERROR_IF_NULL(ptr)                \
  do {                                              \
    if (!(ptr))                                     \
      return sw_make_error(SW_ERROR_OUT_OF_MEMORY); \
  } while (0)

// Internal Constants
// ==================

//! Host memory allocator alignment (can be lower than reality, but cannot be higher).
static constexpr uint32_t SW_ALLOC_ALIGNMENT = 8u;

// Internal C++ Functions
// ======================

//! Used to silence warnings about unused arguments or variables.
template<typename... Args>
static SW_INLINE_NODEBUG void sw_unused(Args&&...) noexcept {}

// SWInternal API Accessible Via 'sw' Namespace
// ============================================

namespace sw { using namespace SWInternal; }

//! \}
//! \endcond

#endif // SWATCH_CORE_API_INTERNAL_P_H_INCLUDED
