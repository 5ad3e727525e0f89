// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_GEOMETRY_PERSPECTIVE_P_H_INCLUDED
#define SWATCH_GEOMETRY_PERSPECTIVE_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/matrix.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::TransPerspective
// ====================

//! Projective (perspective) 3x3 transform.
//!
//! Maps `[x, y]` into `[(x * sx + y * shx + tx) / w, (x * shy + y * sy + ty) / w]`, where `w = x * w0 + y * w1 + w2`.
//! Quads are passed as 8 doubles `[x0, y0, x1, y1, x2, y2, x3, y3]` in clockwise or counter-clockwise order.
class TransPerspective {
public:
  double sx, shy, w0;
  double shx, sy, w1;
  double tx, ty, w2;

  //! Iterator that transforms points along a horizontal line incrementally (the denominator and both numerators
  //! are stepped linearly, only the division is done per point).
  class IteratorX {
  public:
    double _den;
    double _den_step;
    double _nom_x;
    double _nom_x_step;
    double _nom_y;
    double _nom_y_step;

    double x;
    double y;

    SW_INLINE_NODEBUG IteratorX() noexcept = default;

    SW_INLINE IteratorX(double px, double py, double step, const TransPerspective& m) noexcept
      : _den(px * m.w0 + py * m.w1 + m.w2),
        _den_step(m.w0 * step),
        _nom_x(px * m.sx + py * m.shx + m.tx),
        _nom_x_step(step * m.sx),
        _nom_y(px * m.shy + py * m.sy + m.ty),
        _nom_y_step(step * m.shy),
        x(_nom_x / _den),
        y(_nom_y / _den) {}

    SW_INLINE void next() noexcept {
      _den += _den_step;
      _nom_x += _nom_x_step;
      _nom_y += _nom_y_step;

      double d = 1.0 / _den;
      x = _nom_x * d;
      y = _nom_y * d;
    }
  };

  //! \name Construction & Destruction
  //! \{

  SW_INLINE TransPerspective() noexcept
    : sx(1.0), shy(0.0), w0(0.0),
      shx(0.0), sy(1.0), w1(0.0),
      tx(0.0), ty(0.0), w2(1.0) {}

  SW_INLINE TransPerspective(double v0, double v1, double v2,
                             double v3, double v4, double v5,
                             double v6, double v7, double v8) noexcept
    : sx(v0), shy(v1), w0(v2),
      shx(v3), sy(v4), w1(v5),
      tx(v6), ty(v7), w2(v8) {}

  SW_INLINE explicit TransPerspective(const SWMatrix2D& m) noexcept
    : sx(m.m00), shy(m.m01), w0(0.0),
      shx(m.m10), sy(m.m11), w1(0.0),
      tx(m.m20), ty(m.m21), w2(1.0) {}

  //! \}

  //! \name Common Functionality
  //! \{

  SW_INLINE void reset() noexcept { *this = TransPerspective(); }

  //! Tests whether the transform is usable - both scales and the `w2` term must be greater than `epsilon`.
  [[nodiscard]]
  SW_INLINE bool is_valid(double epsilon = 1e-14) const noexcept {
    return ::fabs(sx) > epsilon && ::fabs(sy) > epsilon && ::fabs(w2) > epsilon;
  }

  [[nodiscard]]
  SW_INLINE double determinant() const noexcept {
    return sx  * (sy  * w2 - ty  * w1) +
           shx * (ty  * w0 - shy * w2) +
           tx  * (shy * w1 - sy  * w0);
  }

  //! \}

  //! \name Quad Mapping
  //! \{

  //! Maps the unit square `[0, 0, 1, 1]` to the quad `q`.
  SW_API SWResult square_to_quad(const double* q) noexcept;

  //! Maps the quad `q` to the unit square.
  SW_API SWResult quad_to_square(const double* q) noexcept;

  //! Maps the quad `src` to the quad `dst`.
  SW_API SWResult quad_to_quad(const double* src, const double* dst) noexcept;

  SW_API SWResult rect_to_quad(double x1, double y1, double x2, double y2, const double* q) noexcept;
  SW_API SWResult quad_to_rect(const double* q, double x1, double y1, double x2, double y2) noexcept;

  //! \}

  //! \name Transform Operations
  //! \{

  //! Inverts the transform, fails with `SW_ERROR_INVALID_GEOMETRY` (and resets to zero) if it's singular.
  SW_API SWResult invert() noexcept;

  //! Multiplies the transform by `m` (`m` is applied last).
  SW_API void multiply(const TransPerspective& m) noexcept;

  //! Premultiplies the transform by `m` (`m` is applied first).
  SW_API void premultiply(const TransPerspective& m) noexcept;

  //! \}

  //! \name Map Points
  //! \{

  SW_INLINE void transform(double* x, double* y) const noexcept {
    double px = *x;
    double py = *y;
    double m = 1.0 / (px * w0 + py * w1 + w2);
    *x = m * (px * sx  + py * shx + tx);
    *y = m * (px * shy + py * sy  + ty);
  }

  //! Maps a point through the inverted transform, leaves the point untouched if the transform is singular.
  SW_INLINE void inverse_transform(double* x, double* y) const noexcept {
    TransPerspective t(*this);
    if (t.invert() == SW_SUCCESS)
      t.transform(x, y);
  }

  [[nodiscard]]
  SW_INLINE IteratorX begin(double x, double y, double step) const noexcept { return IteratorX(x, y, step, *this); }

  //! \}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_GEOMETRY_PERSPECTIVE_P_H_INCLUDED
