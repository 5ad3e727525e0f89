// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/runtime.h>

#include <stdio.h>

// SWRuntime - Build Information
// =============================

static const SWRuntimeBuildInfo sw_runtime_build_info = {
  // Swatch major version.
  (SW_VERSION >> 16),
  // Swatch minor version.
  (SW_VERSION >> 8) & 0xFF,
  // Swatch patch version.
  (SW_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef SW_BUILD_DEBUG
  SW_RUNTIME_BUILD_TYPE_DEBUG,
#else
  SW_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Gradient subpixel shift.
  4,
  // Image subpixel shift.
  8,
  // Image filter shift.
  14,

  // Maximum image size.
  SW_RUNTIME_MAX_IMAGE_SIZE,

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " SW_STRINGIFY(__clang_major__) "." SW_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  SW_STRINGIFY(__GNUC__) "." SW_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

// SWRuntime - API - Query
// =======================

SW_API_IMPL SWResult sw_runtime_query_build_info(SWRuntimeBuildInfo* info_out) noexcept {
  if (SW_UNLIKELY(!info_out))
    return sw_make_error(SW_ERROR_INVALID_VALUE);

  memcpy(info_out, &sw_runtime_build_info, sizeof(SWRuntimeBuildInfo));
  return SW_SUCCESS;
}

// SWRuntime - API - Message
// =========================

SW_API_IMPL SWResult sw_runtime_message_out(const char* msg) noexcept {
#if defined(_WIN32)
  // Support both Console and GUI applications on Windows.
  OutputDebugStringA(msg);
#endif

  fputs(msg, stderr);
  return SW_SUCCESS;
}

SW_API_IMPL SWResult sw_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  SWResult result = sw_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

SW_API_IMPL SWResult sw_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
  char buf[1024];
  vsnprintf(buf, SW_ARRAY_SIZE(buf), fmt, ap);
  return sw_runtime_message_out(buf);
}

// SWRuntime - API - Failure
// =========================

SW_API_IMPL void sw_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  sw_runtime_message_fmt("[Swatch] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}
