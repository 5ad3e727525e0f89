// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_test_p.h>
#include <swatch/core/runtime.h>

int main(int argc, const char* argv[]) {
  SWRuntimeBuildInfo build_info;
  SWResult result = sw_runtime_query_build_info(&build_info);

  if (result != SW_SUCCESS) {
    INFO("Failed to query build information (result=0x%08X)\n", unsigned(result));
    return 1;
  }

  INFO(
    "Swatch Unit Tests [use --help for command line options]\n"
    "  Version    : %u.%u.%u\n"
    "  Build Type : %s\n"
    "  Compiled By: %s\n"
    "  Subpixel   : gradient=%u image=%u filter=%u\n\n",
    build_info.major_version,
    build_info.minor_version,
    build_info.patch_version,
    build_info.build_type == SW_RUNTIME_BUILD_TYPE_DEBUG ? "Debug" : "Release",
    build_info.compiler_info,
    build_info.gradient_subpixel_shift,
    build_info.image_subpixel_shift,
    build_info.image_filter_shift);

  return UnitRunner::run(argc, argv);
}
