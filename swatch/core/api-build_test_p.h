// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each Swatch test file.

#ifndef SWATCH_CORE_API_BUILD_TEST_P_H_INCLUDED
#define SWATCH_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <swatch/core/api-build_p.h>

// sw::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(SW_TEST) && defined(__INTELLISENSE__)
  #define SW_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `sw_test_runner` build.
#if defined(SW_TEST)

#include <swatch-testing/tests/unitrunner.h>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) UNITRUNNER_EXPECT_INTERNAL(__FILE__, __LINE__, "EXPECT_SUCCESS(" #__VA_ARGS__ ")", (__VA_ARGS__) == SW_SUCCESS)

//! Swatch test group.
enum SWTestGroup : int {
  SW_TEST_GROUP_SUPPORT_UTILITIES = 1,
  SW_TEST_GROUP_GEOMETRY_UTILITIES,
  SW_TEST_GROUP_SPAN_INTERPOLATORS,
  SW_TEST_GROUP_SPAN_GRADIENTS,
  SW_TEST_GROUP_SPAN_GOURAUD,
  SW_TEST_GROUP_IMAGE_FILTERS,
  SW_TEST_GROUP_SPAN_PATTERNS,
  SW_TEST_GROUP_SPAN_UTILITIES
};
//! \endcond

#endif // SW_TEST

#endif // SWATCH_CORE_API_BUILD_TEST_P_H_INCLUDED
