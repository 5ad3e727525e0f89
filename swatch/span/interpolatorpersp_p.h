// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_INTERPOLATORPERSP_P_H_INCLUDED
#define SWATCH_SPAN_INTERPOLATORPERSP_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/geometry/perspective_p.h>
#include <swatch/span/dda_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::SpanInterpolatorPerspBase
// =============================

//! Shared state of perspective interpolators - the direct and the inverse perspective transform.
//!
//! Both are always set up together, the direct one maps destination to source space and the inverse one is used
//! to estimate the local scale of the mapping.
class SpanInterpolatorPerspBase {
public:
  TransPerspective _trans_dir;
  TransPerspective _trans_inv;

  //! \name Setup
  //! \{

  //! Maps the quadrilateral `src` to `dst` (both 4 points as 8 doubles).
  SW_API SWResult quad_to_quad(const double* src, const double* dst) noexcept;

  //! Maps the rectangle `[x1, y1, x2, y2]` to the quadrilateral `quad`.
  SW_API SWResult rect_to_quad(double x1, double y1, double x2, double y2, const double* quad) noexcept;

  //! Maps the quadrilateral `quad` to the rectangle `[x1, y1, x2, y2]`.
  SW_API SWResult quad_to_rect(const double* quad, double x1, double y1, double x2, double y2) noexcept;

  //! Tests whether the direct transform is valid (not degenerate).
  [[nodiscard]]
  SW_INLINE_NODEBUG bool is_valid() const noexcept { return _trans_dir.is_valid(); }

  //! \}

  //! \name Transformation
  //! \{

  SW_INLINE_NODEBUG void transform(double* x, double* y) const noexcept { _trans_dir.transform(x, y); }

  //! \}

  //! \name Local Scale
  //! \{

  //! Calculates the local scale of the mapping along a single axis at destination `[x, y]`, which maps to
  //! `[xt, yt]`. A small step `[dxt, dyt]` in source space is mapped back, the returned value is the ratio of both
  //! distances in `SubpixelShift` precision.
  template<uint32_t SubpixelShift>
  SW_INLINE int calc_scale(double x, double y, double xt, double yt, double dxt, double dyt) const noexcept {
    constexpr double kScale = double(1 << SubpixelShift);

    double dx = xt + dxt;
    double dy = yt + dyt;
    _trans_inv.transform(&dx, &dy);
    dx -= x;
    dy -= y;
    return int(Math::uround(kScale / Math::sqrt(dx * dx + dy * dy)) >> SubpixelShift);
  }

  //! \}
};

// sw::SpanInterpolatorPerspExact
// ==============================

//! Perspective interpolator that maps every pixel exactly by stepping a perspective iterator.
//!
//! The local scale is interpolated linearly between both span endpoints.
template<uint32_t SubpixelShift = 8>
class SpanInterpolatorPerspExact : public SpanInterpolatorPerspBase {
public:
  static constexpr uint32_t kSubpixelShift = SubpixelShift;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;

  TransPerspective::IteratorX _iterator;
  Dda2LineInterpolator _scale_x;
  Dda2LineInterpolator _scale_y;

  SW_INLINE_NODEBUG SpanInterpolatorPerspExact() noexcept = default;

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subpixel_shift() const noexcept { return kSubpixelShift; }

  SW_INLINE void begin(double x, double y, uint32_t len) noexcept {
    constexpr double kDelta = 1.0 / double(kSubpixelScale);

    _iterator = _trans_dir.begin(x, y, 1.0);
    double xt = _iterator.x;
    double yt = _iterator.y;

    int sx1 = calc_scale<kSubpixelShift>(x, y, xt, yt, kDelta, 0.0);
    int sy1 = calc_scale<kSubpixelShift>(x, y, xt, yt, 0.0, kDelta);

    x += double(len);
    double xe = x;
    double ye = y;
    _trans_dir.transform(&xe, &ye);

    int sx2 = calc_scale<kSubpixelShift>(x, y, xe, ye, kDelta, 0.0);
    int sy2 = calc_scale<kSubpixelShift>(x, y, xe, ye, 0.0, kDelta);

    _scale_x = Dda2LineInterpolator(sx1, sx2, int(len));
    _scale_y = Dda2LineInterpolator(sy1, sy2, int(len));
  }

  //! Coordinates are exact, only the scale interpolation is restarted from its current value.
  SW_INLINE void resynchronize(double xe, double ye, uint32_t len) noexcept {
    constexpr double kDelta = 1.0 / double(kSubpixelScale);

    int sx1 = _scale_x.y();
    int sy1 = _scale_y.y();

    double xt = xe;
    double yt = ye;
    _trans_dir.transform(&xt, &yt);

    int sx2 = calc_scale<kSubpixelShift>(xe, ye, xt, yt, kDelta, 0.0);
    int sy2 = calc_scale<kSubpixelShift>(xe, ye, xt, yt, 0.0, kDelta);

    _scale_x = Dda2LineInterpolator(sx1, sx2, int(len));
    _scale_y = Dda2LineInterpolator(sy1, sy2, int(len));
  }

  SW_INLINE void next() noexcept {
    _iterator.next();
    _scale_x.inc();
    _scale_y.inc();
  }

  SW_INLINE void coordinates(int* x, int* y) const noexcept {
    *x = Math::iround(_iterator.x * kSubpixelScale);
    *y = Math::iround(_iterator.y * kSubpixelScale);
  }

  SW_INLINE void local_scale(int* x, int* y) const noexcept {
    *x = _scale_x.y();
    *y = _scale_y.y();
  }
};

// sw::SpanInterpolatorPerspLerp
// =============================

//! Perspective interpolator that maps span endpoints exactly and interpolates linearly between them.
//!
//! Meant to be used with `SpanSubdivAdaptor`, which keeps the error bounded by resynchronizing periodically.
template<uint32_t SubpixelShift = 8>
class SpanInterpolatorPerspLerp : public SpanInterpolatorPerspBase {
public:
  static constexpr uint32_t kSubpixelShift = SubpixelShift;
  static constexpr int kSubpixelScale = 1 << kSubpixelShift;

  Dda2LineInterpolator _coord_x;
  Dda2LineInterpolator _coord_y;
  Dda2LineInterpolator _scale_x;
  Dda2LineInterpolator _scale_y;

  SW_INLINE_NODEBUG SpanInterpolatorPerspLerp() noexcept = default;

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t subpixel_shift() const noexcept { return kSubpixelShift; }

  SW_INLINE void begin(double x, double y, uint32_t len) noexcept {
    constexpr double kDelta = 1.0 / double(kSubpixelScale);

    double xt = x;
    double yt = y;
    _trans_dir.transform(&xt, &yt);
    int x1 = Math::iround(xt * kSubpixelScale);
    int y1 = Math::iround(yt * kSubpixelScale);
    int sx1 = calc_scale<kSubpixelShift>(x, y, xt, yt, kDelta, 0.0);
    int sy1 = calc_scale<kSubpixelShift>(x, y, xt, yt, 0.0, kDelta);

    x += double(len);
    xt = x;
    yt = y;
    _trans_dir.transform(&xt, &yt);
    int x2 = Math::iround(xt * kSubpixelScale);
    int y2 = Math::iround(yt * kSubpixelScale);
    int sx2 = calc_scale<kSubpixelShift>(x, y, xt, yt, kDelta, 0.0);
    int sy2 = calc_scale<kSubpixelShift>(x, y, xt, yt, 0.0, kDelta);

    _coord_x = Dda2LineInterpolator(x1, x2, int(len));
    _coord_y = Dda2LineInterpolator(y1, y2, int(len));
    _scale_x = Dda2LineInterpolator(sx1, sx2, int(len));
    _scale_y = Dda2LineInterpolator(sy1, sy2, int(len));
  }

  SW_INLINE void resynchronize(double xe, double ye, uint32_t len) noexcept {
    constexpr double kDelta = 1.0 / double(kSubpixelScale);

    int x1 = _coord_x.y();
    int y1 = _coord_y.y();
    int sx1 = _scale_x.y();
    int sy1 = _scale_y.y();

    double xt = xe;
    double yt = ye;
    _trans_dir.transform(&xt, &yt);
    int x2 = Math::iround(xt * kSubpixelScale);
    int y2 = Math::iround(yt * kSubpixelScale);
    int sx2 = calc_scale<kSubpixelShift>(xe, ye, xt, yt, kDelta, 0.0);
    int sy2 = calc_scale<kSubpixelShift>(xe, ye, xt, yt, 0.0, kDelta);

    _coord_x = Dda2LineInterpolator(x1, x2, int(len));
    _coord_y = Dda2LineInterpolator(y1, y2, int(len));
    _scale_x = Dda2LineInterpolator(sx1, sx2, int(len));
    _scale_y = Dda2LineInterpolator(sy1, sy2, int(len));
  }

  SW_INLINE void next() noexcept {
    _coord_x.inc();
    _coord_y.inc();
    _scale_x.inc();
    _scale_y.inc();
  }

  SW_INLINE void coordinates(int* x, int* y) const noexcept {
    *x = _coord_x.y();
    *y = _coord_y.y();
  }

  SW_INLINE void local_scale(int* x, int* y) const noexcept {
    *x = _scale_x.y();
    *y = _scale_y.y();
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_INTERPOLATORPERSP_P_H_INCLUDED
