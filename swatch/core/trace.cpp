// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/runtime.h>
#include <swatch/core/trace_p.h>

// SWDebugTrace - Log
// ==================

void SWDebugTrace::log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept {
  const char* prefix = "";
  if (indentation < 0xFFFFFFFFu) {
    switch (severity) {
      case 1: prefix = "[WARN] "; break;
      case 2: prefix = "[FAIL] "; break;
    }
    sw_runtime_message_fmt("%*s%s", int(indentation * 2), "", prefix);
  }

  va_list ap;
  va_start(ap, fmt);
  sw_runtime_message_vfmt(fmt, ap);
  va_end(ap);
}
