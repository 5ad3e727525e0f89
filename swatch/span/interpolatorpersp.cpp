// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/trace_p.h>
#include <swatch/span/interpolatorpersp_p.h>

// sw::SpanInterpolatorPersp - Tracing
// ===================================

#if defined(SW_TRACE_ALL) && !defined(SW_TRACE_PERSPECTIVE)
  #define SW_TRACE_PERSPECTIVE
#endif

#if defined(SW_TRACE_PERSPECTIVE)
  #define Trace SWDebugTrace
#else
  #define Trace SWDummyTrace
#endif

namespace sw {

// sw::SpanInterpolatorPerspBase - Setup
// =====================================

SWResult SpanInterpolatorPerspBase::quad_to_quad(const double* src, const double* dst) noexcept {
  Trace trace;

  SWResult r1 = _trans_dir.quad_to_quad(src, dst);
  SWResult r2 = _trans_inv.quad_to_quad(dst, src);

  if (r1 != SW_SUCCESS || r2 != SW_SUCCESS) {
    trace.warn("SpanInterpolatorPersp::quad_to_quad() degenerate mapping [%g %g, %g %g, %g %g, %g %g] -> [%g %g, %g %g, %g %g, %g %g]\n",
               src[0], src[1], src[2], src[3], src[4], src[5], src[6], src[7],
               dst[0], dst[1], dst[2], dst[3], dst[4], dst[5], dst[6], dst[7]);
    return r1 != SW_SUCCESS ? r1 : r2;
  }

  return SW_SUCCESS;
}

SWResult SpanInterpolatorPerspBase::rect_to_quad(double x1, double y1, double x2, double y2, const double* quad) noexcept {
  double src[8] = { x1, y1, x2, y1, x2, y2, x1, y2 };
  return quad_to_quad(src, quad);
}

SWResult SpanInterpolatorPerspBase::quad_to_rect(const double* quad, double x1, double y1, double x2, double y2) noexcept {
  double dst[8] = { x1, y1, x2, y1, x2, y2, x1, y2 };
  return quad_to_quad(quad, dst);
}

} // {sw}
