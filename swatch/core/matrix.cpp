// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/core/matrix.h>
#include <swatch/support/math_p.h>

// SWMatrix2D - API - Multiply
// ===========================

SW_API_IMPL SWResult sw_matrix2d_multiply(SWMatrix2D* dst, const SWMatrix2D* a, const SWMatrix2D* b) noexcept {
  double t00 = a->m00 * b->m00 + a->m01 * b->m10;
  double t01 = a->m00 * b->m01 + a->m01 * b->m11;
  double t10 = a->m10 * b->m00 + a->m11 * b->m10;
  double t11 = a->m10 * b->m01 + a->m11 * b->m11;
  double t20 = a->m20 * b->m00 + a->m21 * b->m10 + b->m20;
  double t21 = a->m20 * b->m01 + a->m21 * b->m11 + b->m21;

  *dst = SWMatrix2D(t00, t01, t10, t11, t20, t21);
  return SW_SUCCESS;
}

// SWMatrix2D - API - Invert
// =========================

SW_API_IMPL SWResult sw_matrix2d_invert(SWMatrix2D* dst, const SWMatrix2D* src) noexcept {
  double d = src->m00 * src->m11 - src->m01 * src->m10;

  if (d == 0.0 || !sw::Math::is_finite(d))
    return sw_make_error(SW_ERROR_INVALID_GEOMETRY);

  double t00 =  src->m11 / d;
  double t01 = -src->m01 / d;
  double t10 = -src->m10 / d;
  double t11 =  src->m00 / d;

  double t20 = -(src->m20 * t00 + src->m21 * t10);
  double t21 = -(src->m20 * t01 + src->m21 * t11);

  *dst = SWMatrix2D(t00, t01, t10, t11, t20, t21);
  return SW_SUCCESS;
}
