// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_CORE_MATRIX_H_INCLUDED
#define SWATCH_CORE_MATRIX_H_INCLUDED

#include <swatch/core/api.h>

#ifdef __cplusplus
  #include <math.h>
#endif

//! \addtogroup sw_geometry
//! \{

struct SWMatrix2D;

//! \name SWMatrix2D - C API
//! \{

SW_BEGIN_C_DECLS

//! Multiplies `a` by `b` and stores the result to `dst` - the result maps points through `a` first, then `b`.
SW_API SWResult SW_CDECL sw_matrix2d_multiply(SWMatrix2D* dst, const SWMatrix2D* a, const SWMatrix2D* b) SW_NOEXCEPT_C;

//! Inverts `src` and stores the result to `dst`, fails with `SW_ERROR_INVALID_GEOMETRY` if `src` is singular.
SW_API SWResult SW_CDECL sw_matrix2d_invert(SWMatrix2D* dst, const SWMatrix2D* src) SW_NOEXCEPT_C;

SW_END_C_DECLS

//! \}

//! 2D affine matrix.
//!
//! The matrix maps a point `[x, y]` into `[x * m00 + y * m10 + m20, x * m01 + y * m11 + m21]`. Span interpolators
//! consume it through `transform()`, which maps a destination pixel into source (image or gradient) space. So the
//! matrix passed to an interpolator is usually an inverted user transform.
struct SWMatrix2D {
  double m00;
  double m01;
  double m10;
  double m11;
  double m20;
  double m21;

#ifdef __cplusplus
  //! \name Construction & Destruction
  //! \{

  SW_INLINE_NODEBUG SWMatrix2D() noexcept = default;
  SW_INLINE_NODEBUG constexpr SWMatrix2D(const SWMatrix2D& src) noexcept = default;

  SW_INLINE_NODEBUG constexpr SWMatrix2D(double m00_value, double m01_value,
                                         double m10_value, double m11_value,
                                         double m20_value, double m21_value) noexcept
    : m00(m00_value), m01(m01_value),
      m10(m10_value), m11(m11_value),
      m20(m20_value), m21(m21_value) {}

  //! \}

  //! \name Static Constructors
  //! \{

  [[nodiscard]]
  static SW_INLINE_NODEBUG constexpr SWMatrix2D make_identity() noexcept { return SWMatrix2D(1.0, 0.0, 0.0, 1.0, 0.0, 0.0); }

  [[nodiscard]]
  static SW_INLINE_NODEBUG constexpr SWMatrix2D make_translation(double x, double y) noexcept { return SWMatrix2D(1.0, 0.0, 0.0, 1.0, x, y); }

  [[nodiscard]]
  static SW_INLINE_NODEBUG constexpr SWMatrix2D make_scaling(double xy) noexcept { return SWMatrix2D(xy, 0.0, 0.0, xy, 0.0, 0.0); }

  [[nodiscard]]
  static SW_INLINE_NODEBUG constexpr SWMatrix2D make_scaling(double x, double y) noexcept { return SWMatrix2D(x, 0.0, 0.0, y, 0.0, 0.0); }

  [[nodiscard]]
  static SW_INLINE SWMatrix2D make_rotation(double angle) noexcept {
    double as = ::sin(angle);
    double ac = ::cos(angle);
    return SWMatrix2D(ac, as, -as, ac, 0.0, 0.0);
  }

  //! \}

  //! \name Overloaded Operators
  //! \{

  SW_INLINE_NODEBUG SWMatrix2D& operator=(const SWMatrix2D& other) noexcept = default;

  [[nodiscard]]
  SW_INLINE bool operator==(const SWMatrix2D& other) const noexcept {
    return m00 == other.m00 && m01 == other.m01 &&
           m10 == other.m10 && m11 == other.m11 &&
           m20 == other.m20 && m21 == other.m21;
  }

  [[nodiscard]]
  SW_INLINE bool operator!=(const SWMatrix2D& other) const noexcept { return !(*this == other); }

  //! \}

  //! \name Common Functionality
  //! \{

  SW_INLINE void reset() noexcept { *this = make_identity(); }

  //! \}

  //! \name Accessors
  //! \{

  //! Calculates the matrix determinant.
  [[nodiscard]]
  SW_INLINE double determinant() const noexcept { return m00 * m11 - m01 * m10; }

  //! Returns the absolute scaling of the matrix along X and Y axes (rotation and shear included).
  SW_INLINE void scaling_abs(double* x, double* y) const noexcept {
    *x = ::sqrt(m00 * m00 + m10 * m10);
    *y = ::sqrt(m01 * m01 + m11 * m11);
  }

  //! \}

  //! \name Matrix Operations
  //! \{

  SW_INLINE SWResult translate(double x, double y) noexcept {
    m20 += x * m00 + y * m10;
    m21 += x * m01 + y * m11;
    return SW_SUCCESS;
  }

  SW_INLINE SWResult scale(double x, double y) noexcept {
    m00 *= x;
    m01 *= x;
    m10 *= y;
    m11 *= y;
    return SW_SUCCESS;
  }

  SW_INLINE SWResult rotate(double angle) noexcept {
    SWMatrix2D r = make_rotation(angle);
    return sw_matrix2d_multiply(this, &r, this);
  }

  SW_INLINE SWResult post_translate(double x, double y) noexcept {
    m20 += x;
    m21 += y;
    return SW_SUCCESS;
  }

  SW_INLINE SWResult post_scale(double x, double y) noexcept {
    m00 *= x;
    m01 *= y;
    m10 *= x;
    m11 *= y;
    m20 *= x;
    m21 *= y;
    return SW_SUCCESS;
  }

  SW_INLINE SWResult post_rotate(double angle) noexcept {
    SWMatrix2D r = make_rotation(angle);
    return sw_matrix2d_multiply(this, this, &r);
  }

  //! Premultiplies the matrix by `m` (`m` is applied first).
  SW_INLINE SWResult transform(const SWMatrix2D& m) noexcept { return sw_matrix2d_multiply(this, &m, this); }

  //! Multiplies the matrix by `m` (`m` is applied last).
  SW_INLINE SWResult post_transform(const SWMatrix2D& m) noexcept { return sw_matrix2d_multiply(this, this, &m); }

  //! Inverts the matrix, returns \ref SW_SUCCESS if the matrix has been inverted successfully.
  SW_INLINE SWResult invert() noexcept { return sw_matrix2d_invert(this, this); }

  //! \}

  //! \name Map Points
  //! \{

  //! Maps the point `[*x, *y]` in place.
  SW_INLINE void transform(double* x, double* y) const noexcept {
    double tx = *x;
    *x = tx * m00 + *y * m10 + m20;
    *y = tx * m01 + *y * m11 + m21;
  }

  //! \}
#endif
};

//! \}

#endif // SWATCH_CORE_MATRIX_H_INCLUDED
