// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <swatch/core/api-build_p.h>
#include <swatch/geometry/perspective_p.h>

namespace sw {

// sw::TransPerspective - Quad Mapping
// ===================================

SWResult TransPerspective::square_to_quad(const double* q) noexcept {
  double dx = q[0] - q[2] + q[4] - q[6];
  double dy = q[1] - q[3] + q[5] - q[7];

  if (dx == 0.0 && dy == 0.0) {
    // Affine case (parallelogram).
    sx  = q[2] - q[0];
    shy = q[3] - q[1];
    w0  = 0.0;
    shx = q[4] - q[2];
    sy  = q[5] - q[3];
    w1  = 0.0;
    tx  = q[0];
    ty  = q[1];
    w2  = 1.0;
    return SW_SUCCESS;
  }

  double dx1 = q[2] - q[4];
  double dy1 = q[3] - q[5];
  double dx2 = q[6] - q[4];
  double dy2 = q[7] - q[5];
  double den = dx1 * dy2 - dx2 * dy1;

  if (den == 0.0) {
    // Singular case.
    *this = TransPerspective(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
    return sw_make_error(SW_ERROR_INVALID_GEOMETRY);
  }

  // General case.
  double u = (dx * dy2 - dy * dx2) / den;
  double v = (dy * dx1 - dx * dy1) / den;

  sx  = q[2] - q[0] + u * q[2];
  shy = q[3] - q[1] + u * q[3];
  w0  = u;
  shx = q[6] - q[0] + v * q[6];
  sy  = q[7] - q[1] + v * q[7];
  w1  = v;
  tx  = q[0];
  ty  = q[1];
  w2  = 1.0;
  return SW_SUCCESS;
}

SWResult TransPerspective::quad_to_square(const double* q) noexcept {
  SW_PROPAGATE(square_to_quad(q));
  return invert();
}

SWResult TransPerspective::quad_to_quad(const double* src, const double* dst) noexcept {
  TransPerspective p;

  SW_PROPAGATE(quad_to_square(src));
  SW_PROPAGATE(p.square_to_quad(dst));

  multiply(p);
  return SW_SUCCESS;
}

SWResult TransPerspective::rect_to_quad(double x1, double y1, double x2, double y2, const double* q) noexcept {
  double r[8] = { x1, y1, x2, y1, x2, y2, x1, y2 };
  return quad_to_quad(r, q);
}

SWResult TransPerspective::quad_to_rect(const double* q, double x1, double y1, double x2, double y2) noexcept {
  double r[8] = { x1, y1, x2, y1, x2, y2, x1, y2 };
  return quad_to_quad(q, r);
}

// sw::TransPerspective - Transform Operations
// ===========================================

SWResult TransPerspective::invert() noexcept {
  double d0 = sy  * w2 - w1  * ty;
  double d1 = w0  * ty - shy * w2;
  double d2 = shy * w1 - w0  * sy;
  double d  = sx  * d0 + shx * d1 + tx * d2;

  if (d == 0.0) {
    *this = TransPerspective(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
    return sw_make_error(SW_ERROR_INVALID_GEOMETRY);
  }

  d = 1.0 / d;
  TransPerspective a(*this);

  sx  = d * d0;
  shy = d * d1;
  w0  = d * d2;
  shx = d * (a.w1  * a.tx - a.shx * a.w2);
  sy  = d * (a.sx  * a.w2 - a.w0  * a.tx);
  w1  = d * (a.w0  * a.shx - a.sx * a.w1);
  tx  = d * (a.shx * a.ty - a.sy  * a.tx);
  ty  = d * (a.shy * a.tx - a.sx  * a.ty);
  w2  = d * (a.sx  * a.sy - a.shy * a.shx);
  return SW_SUCCESS;
}

static SW_INLINE TransPerspective mul_perspective(const TransPerspective& a, const TransPerspective& b) noexcept {
  // Returns a transform that applies `b` first, then `a`.
  return TransPerspective(
    a.sx  * b.sx + a.shx * b.shy + a.tx * b.w0,
    a.shy * b.sx + a.sy * b.shy + a.ty * b.w0,
    a.w0  * b.sx + a.w1 * b.shy + a.w2 * b.w0,
    a.sx  * b.shx + a.shx * b.sy + a.tx * b.w1,
    a.shy * b.shx + a.sy  * b.sy + a.ty * b.w1,
    a.w0  * b.shx + a.w1  * b.sy + a.w2 * b.w1,
    a.sx  * b.tx + a.shx * b.ty + a.tx * b.w2,
    a.shy * b.tx + a.sy  * b.ty + a.ty * b.w2,
    a.w0  * b.tx + a.w1  * b.ty + a.w2 * b.w2);
}

void TransPerspective::multiply(const TransPerspective& m) noexcept {
  *this = mul_perspective(m, *this);
}

void TransPerspective::premultiply(const TransPerspective& m) noexcept {
  *this = mul_perspective(*this, m);
}

} // {sw}
