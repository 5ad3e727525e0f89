// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_RUNTIME_H_INCLUDED
#define SWATCH_CORE_RUNTIME_H_INCLUDED

#include <swatch/core/api.h>

//! \addtogroup sw_runtime
//! \{

//! \name Runtime - Constants
//! \{

//! Swatch runtime limits.
//!
//! \note These constants are used across Swatch, but they are not designed to be ABI stable. New versions of Swatch
//! can increase certain limits without notice. Use runtime to query the limits dynamically, see \ref SWRuntimeBuildInfo.
SW_DEFINE_ENUM(SWRuntimeLimits) {
  //! Maximum width and height of an image, contour buffer or gradient image.
  SW_RUNTIME_MAX_IMAGE_SIZE = 65535
};

//! Type of build.
SW_DEFINE_ENUM(SWRuntimeBuildType) {
  //! Describes a Swatch debug build.
  SW_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a Swatch release build.
  SW_RUNTIME_BUILD_TYPE_RELEASE = 1
};

//! \}

//! \name Runtime - Structs
//! \{

//! Swatch build information.
struct SWRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! Swatch build type, see \ref SWRuntimeBuildType.
  uint32_t build_type;

  //! Subpixel shift of gradient coordinates (coordinates passed to gradient shapes are scaled by `1 << shift`).
  uint32_t gradient_subpixel_shift;
  //! Subpixel shift of image coordinates produced by span interpolators.
  uint32_t image_subpixel_shift;
  //! Fixed-point shift of image filter weights.
  uint32_t image_filter_shift;

  //! Maximum size of an image (both width and height).
  uint32_t max_image_size;

  //! Identification of the C++ compiler used to build Swatch.
  char compiler_info[32];

#ifdef __cplusplus
  SW_INLINE_NODEBUG void reset() noexcept { *this = SWRuntimeBuildInfo{}; }
#endif
};

//! \}

//! \name Runtime - C API
//! \{

SW_BEGIN_C_DECLS

SW_API SWResult SW_CDECL sw_runtime_query_build_info(SWRuntimeBuildInfo* info_out) SW_NOEXCEPT_C;

SW_API SWResult SW_CDECL sw_runtime_message_out(const char* msg) SW_NOEXCEPT_C;
SW_API SWResult SW_CDECL sw_runtime_message_fmt(const char* fmt, ...) SW_NOEXCEPT_C;
SW_API SWResult SW_CDECL sw_runtime_message_vfmt(const char* fmt, va_list ap) SW_NOEXCEPT_C;

SW_END_C_DECLS

//! \}

//! \}

#endif // SWATCH_CORE_RUNTIME_H_INCLUDED
