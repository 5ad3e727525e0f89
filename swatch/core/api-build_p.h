// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each Swatch source file. This means that any
// macros we might need to define to build 'swatch' can be defined here instead of passing them to the compiler
// through command line.

#ifndef SWATCH_CORE_API_BUILD_P_H_INCLUDED
#define SWATCH_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `SW_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `SW_BUILD_EXPORT` to define a proper `SW_API` decorator.
#define SW_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define SW_BUILD_DEBUG
// ----------------------
//
// Enables `SW_ASSERT()` and disables forced inlining. Set by CMakeLists.txt for Debug configurations, but it can be
// also defined manually.

//! \cond NEVER
#if !defined(SW_BUILD_DEBUG) && !defined(SW_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define SW_BUILD_DEBUG
  #else
    #define SW_BUILD_RELEASE
  #endif
#endif
//! \endcond

// #define SW_TRACE_ALL                // Trace everything.
// #define SW_TRACE_GRADIENT_LUT       // Trace color stop analysis and LUT construction.
// #define SW_TRACE_GRADIENT_CONTOUR   // Trace contour buffer sizing and the distance transform.
// #define SW_TRACE_IMAGE_FILTER       // Trace filter LUT construction and normalization.
// #define SW_TRACE_PERSPECTIVE        // Trace degenerate quads passed to perspective interpolators.
//
// Swatch provides traces that can be enabled during development. Traces go through `sw_runtime_message_out()` and
// are compiled out completely when disabled.

// Build - Requirements
// ====================

//! \cond NEVER

// Turn off deprecation warnings when building 'swatch'. Required as <stdio.h> could warn about using functions such
// as `vsnprintf()`, which we use correctly.
#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

//! \endcond

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wmaybe-uninitialized" // Unfortunately GCC emits lots of false positives.
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4201) // Nameless struct/union.
  #pragma warning(disable: 4458) // declaration of 'X' hides class member.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

//! \endcond

// Build - Include API
// ===================

#include <swatch/core/api.h>
#include <swatch/core/api-internal_p.h>

#endif // SWATCH_CORE_API_BUILD_P_H_INCLUDED
