// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SUPPORT_MATH_P_H_INCLUDED
#define SWATCH_SUPPORT_MATH_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/support/lookuptable_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {
namespace Math {

//! \name Math Constants
//! \{

static constexpr double kPI            = 3.14159265358979323846;  //!< pi.
static constexpr double kPI_MUL_2      = 6.28318530717958647692;  //!< pi * 2.
static constexpr double kPI_DIV_2      = 1.57079632679489661923;  //!< pi / 2.
static constexpr double kSQRT_2        = 1.41421356237309504880;  //!< sqrt(2).

//! Epsilon used by intersection and orthogonal vector calculations.
static constexpr double kIntersectionEpsilon = 1e-30;

//! \}

//! \name Tables
//! \{

//! Square roots of `[0, 1024)` scaled by 2048 and rounded, used by `fast_sqrt()`.
extern SW_API const LookupTable<uint16_t, 1024> sqrt_table;

//! Index of the most significant bit of `[0, 256)`, zero for zero.
extern SW_API const LookupTable<uint8_t, 256> msb_table;

//! \}

//! \name Special Functions
//! \{

//! Bessel function of the first kind of order `n` (computed by downward recurrence).
SW_API double bessel_j(double x, int n) noexcept;

//! \}

namespace {

//! \name Floating Point Testing
//! \{

static SW_INLINE_NODEBUG bool is_finite(double x) noexcept { return std::isfinite(x); }

//! \}

//! \name Rounding
//! \{

static SW_INLINE_NODEBUG double floor(double x) noexcept { return ::floor(x); }
static SW_INLINE_NODEBUG double ceil(double x) noexcept { return ::ceil(x); }

//! Rounds `x` half away from zero.
[[nodiscard]]
static SW_INLINE int iround(double x) noexcept { return int(x < 0.0 ? x - 0.5 : x + 0.5); }

//! Rounds a non-negative `x` half up.
[[nodiscard]]
static SW_INLINE unsigned uround(double x) noexcept { return unsigned(x + 0.5); }

[[nodiscard]]
static SW_INLINE int ifloor(double x) noexcept { int i = int(x); return i - int(double(i) > x); }

[[nodiscard]]
static SW_INLINE unsigned ufloor(double x) noexcept { return unsigned(x); }

[[nodiscard]]
static SW_INLINE int iceil(double x) noexcept { return int(::ceil(x)); }

[[nodiscard]]
static SW_INLINE unsigned uceil(double x) noexcept { return unsigned(::ceil(x)); }

//! \}

//! \name Power Functions
//! \{

template<typename T> SW_INLINE_CONSTEXPR T square(const T& x) noexcept { return x * x; }

static SW_INLINE_NODEBUG double sqrt(double x) noexcept { return ::sqrt(x); }

//! Integer square root of `val`, table driven, accurate to the truncated result of 11 significant bits.
[[nodiscard]]
static SW_INLINE unsigned fast_sqrt(unsigned val) noexcept {
  unsigned t = val;
  int bit = 0;
  unsigned shift = 11;

  bit = int(t >> 24);
  if (bit) {
    bit = msb_table[size_t(bit)] + 24;
  }
  else {
    bit = int((t >> 16) & 0xFFu);
    if (bit) {
      bit = msb_table[size_t(bit)] + 16;
    }
    else {
      bit = int((t >> 8) & 0xFFu);
      if (bit)
        bit = msb_table[size_t(bit)] + 8;
      else
        bit = msb_table[t];
    }
  }

  // At most 10 significant bits can be looked up in the table, the rest is shifted out in pairs.
  bit -= 9;
  if (bit > 0) {
    bit = (bit >> 1) + (bit & 1);
    shift -= unsigned(bit);
    val >>= (unsigned(bit) << 1);
  }

  return unsigned(sqrt_table[val]) >> shift;
}

//! \}

//! \name Trigonometric Functions
//! \{

static SW_INLINE_NODEBUG double sin(double x) noexcept { return ::sin(x); }
static SW_INLINE_NODEBUG double cos(double x) noexcept { return ::cos(x); }
static SW_INLINE_NODEBUG double atan2(double y, double x) noexcept { return ::atan2(y, x); }

//! \}

//! \name Geometry Helpers
//! \{

//! Returns the cross product of `(x2 - x1, y2 - y1)` and `(x - x2, y - y2)`; its sign tells the side of the point.
[[nodiscard]]
static SW_INLINE double cross_product(double x1, double y1, double x2, double y2, double x, double y) noexcept {
  return (x - x2) * (y2 - y1) - (y - y2) * (x2 - x1);
}

//! Calculates the intersection of lines `(ax, ay)-(bx, by)` and `(cx, cy)-(dx, dy)`.
//!
//! Returns false if the lines are parallel (within `kIntersectionEpsilon`).
static SW_INLINE bool calc_intersection(double ax, double ay, double bx, double by,
                                        double cx, double cy, double dx, double dy,
                                        double* x, double* y) noexcept {
  double num = (ay - cy) * (dx - cx) - (ax - cx) * (dy - cy);
  double den = (bx - ax) * (dy - cy) - (by - ay) * (dx - cx);

  if (::fabs(den) < kIntersectionEpsilon)
    return false;

  double r = num / den;
  *x = ax + r * (bx - ax);
  *y = ay + r * (by - ay);
  return true;
}

//! Calculates a vector orthogonal to `(x1, y1)-(x2, y2)` of the `thickness` length.
static SW_INLINE void calc_orthogonal(double thickness, double x1, double y1, double x2, double y2,
                                      double* x, double* y) noexcept {
  double dx = x2 - x1;
  double dy = y2 - y1;
  double d = ::sqrt(dx * dx + dy * dy);
  *x =  thickness * dy / d;
  *y = -thickness * dx / d;
}

//! \}

} // {anonymous}
} // {Math}
} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SUPPORT_MATH_P_H_INCLUDED
