// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_IMAGE_IMAGEFILTER_P_H_INCLUDED
#define SWATCH_IMAGE_IMAGEFILTER_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>
#include <swatch/support/podarray_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::ImageKernel
// ===============

//! \name Image Filter Kernels
//!
//! A kernel provides `radius()` and `calc_weight(x)` for `x` in `[0, radius]`. Kernels are symmetric, so only the
//! positive half is evaluated.
//!
//! \{

struct KernelBilinear {
  static SW_INLINE_NODEBUG double radius() noexcept { return 1.0; }
  static SW_INLINE double calc_weight(double x) noexcept { return 1.0 - x; }
};

struct KernelHanning {
  static SW_INLINE_NODEBUG double radius() noexcept { return 1.0; }
  static SW_INLINE double calc_weight(double x) noexcept { return 0.5 + 0.5 * ::cos(Math::kPI * x); }
};

struct KernelHamming {
  static SW_INLINE_NODEBUG double radius() noexcept { return 1.0; }
  static SW_INLINE double calc_weight(double x) noexcept { return 0.54 + 0.46 * ::cos(Math::kPI * x); }
};

struct KernelHermite {
  static SW_INLINE_NODEBUG double radius() noexcept { return 1.0; }
  static SW_INLINE double calc_weight(double x) noexcept { return (2.0 * x - 3.0) * x * x + 1.0; }
};

struct KernelQuadric {
  static SW_INLINE_NODEBUG double radius() noexcept { return 1.5; }

  static SW_INLINE double calc_weight(double x) noexcept {
    if (x < 0.5)
      return 0.75 - x * x;

    if (x < 1.5) {
      double t = x - 1.5;
      return 0.5 * t * t;
    }

    return 0.0;
  }
};

struct KernelBicubic {
  static SW_INLINE_NODEBUG double radius() noexcept { return 2.0; }

  static SW_INLINE double pow3(double x) noexcept { return x <= 0.0 ? 0.0 : x * x * x; }

  static SW_INLINE double calc_weight(double x) noexcept {
    return (1.0 / 6.0) * (pow3(x + 2.0) - 4.0 * pow3(x + 1.0) + 6.0 * pow3(x) - 4.0 * pow3(x - 1.0));
  }
};

//! Kaiser window with the shape parameter `b`.
class KernelKaiser {
public:
  double _a;
  double _i0a;
  double _epsilon;

  SW_INLINE explicit KernelKaiser(double b = 6.33) noexcept
    : _a(b),
      _epsilon(1e-12) {
    _i0a = 1.0 / bessel_i0(b);
  }

  static SW_INLINE_NODEBUG double radius() noexcept { return 1.0; }

  SW_INLINE double calc_weight(double x) const noexcept {
    return bessel_i0(_a * ::sqrt(1.0 - x * x)) * _i0a;
  }

  //! Modified Bessel function of the first kind of order zero.
  SW_INLINE double bessel_i0(double x) const noexcept {
    double sum = 1.0;
    double y = x * x / 4.0;
    double t = y;

    for (int i = 2; t > _epsilon; i++) {
      sum += t;
      t *= y / double(i * i);
    }

    return sum;
  }
};

struct KernelCatrom {
  static SW_INLINE_NODEBUG double radius() noexcept { return 2.0; }

  static SW_INLINE double calc_weight(double x) noexcept {
    if (x < 1.0)
      return 0.5 * (2.0 + x * x * (-5.0 + x * 3.0));
    if (x < 2.0)
      return 0.5 * (4.0 + x * (-8.0 + x * (5.0 - x)));
    return 0.0;
  }
};

//! Mitchell-Netravali cubic with parameters `b` and `c`.
class KernelMitchell {
public:
  double _p0, _p2, _p3;
  double _q0, _q1, _q2, _q3;

  SW_INLINE explicit KernelMitchell(double b = 1.0 / 3.0, double c = 1.0 / 3.0) noexcept
    : _p0((6.0 - 2.0 * b) / 6.0),
      _p2((-18.0 + 12.0 * b + 6.0 * c) / 6.0),
      _p3((12.0 - 9.0 * b - 6.0 * c) / 6.0),
      _q0((8.0 * b + 24.0 * c) / 6.0),
      _q1((-12.0 * b - 48.0 * c) / 6.0),
      _q2((6.0 * b + 30.0 * c) / 6.0),
      _q3((-b - 6.0 * c) / 6.0) {}

  static SW_INLINE_NODEBUG double radius() noexcept { return 2.0; }

  SW_INLINE double calc_weight(double x) const noexcept {
    if (x < 1.0)
      return _p0 + x * x * (_p2 + x * _p3);
    if (x < 2.0)
      return _q0 + x * (_q1 + x * (_q2 + x * _q3));
    return 0.0;
  }
};

struct KernelSpline16 {
  static SW_INLINE_NODEBUG double radius() noexcept { return 2.0; }

  static SW_INLINE double calc_weight(double x) noexcept {
    if (x < 1.0)
      return ((x - 9.0 / 5.0) * x - 1.0 / 5.0) * x + 1.0;

    double t = x - 1.0;
    return ((-1.0 / 3.0 * t + 4.0 / 5.0) * t - 7.0 / 15.0) * t;
  }
};

struct KernelSpline36 {
  static SW_INLINE_NODEBUG double radius() noexcept { return 3.0; }

  static SW_INLINE double calc_weight(double x) noexcept {
    if (x < 1.0)
      return ((13.0 / 11.0 * x - 453.0 / 209.0) * x - 3.0 / 209.0) * x + 1.0;

    if (x < 2.0) {
      double t = x - 1.0;
      return ((-6.0 / 11.0 * t + 270.0 / 209.0) * t - 156.0 / 209.0) * t;
    }

    double t = x - 2.0;
    return ((1.0 / 11.0 * t - 45.0 / 209.0) * t + 26.0 / 209.0) * t;
  }
};

struct KernelGaussian {
  static SW_INLINE_NODEBUG double radius() noexcept { return 2.0; }

  static SW_INLINE double calc_weight(double x) noexcept {
    return ::exp(-2.0 * x * x) * ::sqrt(2.0 / Math::kPI);
  }
};

struct KernelBessel {
  static SW_INLINE_NODEBUG double radius() noexcept { return 3.2383; }

  static SW_INLINE double calc_weight(double x) noexcept {
    return x == 0.0 ? Math::kPI / 4.0 : Math::bessel_j(Math::kPI * x, 1) / (2.0 * x);
  }
};

//! Windowed kernels share a configurable radius, which is at least 2.
class KernelRadius {
public:
  double _radius;

  SW_INLINE explicit KernelRadius(double r) noexcept
    : _radius(r < 2.0 ? 2.0 : r) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG double radius() const noexcept { return _radius; }
};

class KernelSinc : public KernelRadius {
public:
  SW_INLINE explicit KernelSinc(double r = 3.0) noexcept
    : KernelRadius(r) {}

  SW_INLINE double calc_weight(double x) const noexcept {
    if (x == 0.0)
      return 1.0;

    x *= Math::kPI;
    return ::sin(x) / x;
  }
};

class KernelLanczos : public KernelRadius {
public:
  SW_INLINE explicit KernelLanczos(double r = 3.0) noexcept
    : KernelRadius(r) {}

  SW_INLINE double calc_weight(double x) const noexcept {
    if (x == 0.0)
      return 1.0;
    if (x > _radius)
      return 0.0;

    x *= Math::kPI;
    double xr = x / _radius;
    return (::sin(x) / x) * (::sin(xr) / xr);
  }
};

class KernelBlackman : public KernelRadius {
public:
  SW_INLINE explicit KernelBlackman(double r = 3.0) noexcept
    : KernelRadius(r) {}

  SW_INLINE double calc_weight(double x) const noexcept {
    if (x == 0.0)
      return 1.0;
    if (x > _radius)
      return 0.0;

    x *= Math::kPI;
    double xr = x / _radius;
    return (::sin(x) / x) * (0.42 + 0.5 * ::cos(xr) + 0.08 * ::cos(2.0 * xr));
  }
};

//! \}

// sw::ImageFilterLUT
// ==================

//! Fixed-point weights of a filter kernel sampled at `Image::kSubpixelScale` positions per pixel.
//!
//! The table has `diameter() * Image::kSubpixelScale` entries scaled to `Image::kFilterScale`. After normalization
//! the weights of every subpixel phase sum to exactly `Image::kFilterScale`.
class ImageFilterLUT {
public:
  SW_NONCOPYABLE(ImageFilterLUT)

  //! Maximum supported kernel radius (in source pixels).
  static constexpr double kMaxRadius = 64.0;

  double _radius;
  uint32_t _diameter;
  int _start;
  PodArray<int16_t> _weights;
  SWResult _init_result;

  SW_INLINE ImageFilterLUT() noexcept
    : _radius(0.0),
      _diameter(0),
      _start(0),
      _init_result(SW_SUCCESS) {}

  template<typename Kernel>
  SW_INLINE explicit ImageFilterLUT(const Kernel& kernel, bool normalization = true) noexcept
    : _radius(0.0),
      _diameter(0),
      _start(0),
      _init_result(SW_SUCCESS) {
    _init_result = calculate(kernel, normalization);
  }

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG bool empty() const noexcept { return _diameter == 0; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double radius() const noexcept { return _radius; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t diameter() const noexcept { return _diameter; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int start() const noexcept { return _start; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const int16_t* weight_array() const noexcept { return _weights.data(); }

  //! Result of the calculation done by the constructor, if any.
  [[nodiscard]]
  SW_INLINE_NODEBUG SWResult init_result() const noexcept { return _init_result; }

  //! \}

  //! Samples `kernel` into the table and normalizes it if `normalization` is true.
  template<typename Kernel>
  SWResult calculate(const Kernel& kernel, bool normalization = true) noexcept {
    SW_PROPAGATE(_realloc_lut(kernel.radius()));

    uint32_t pivot = _diameter << (Image::kSubpixelShift - 1u);
    int16_t* weights = _weights.data();

    for (uint32_t i = 0; i < pivot; i++) {
      double x = double(i) / double(Image::kSubpixelScale);
      double y = kernel.calc_weight(x);
      weights[pivot + i] = weights[pivot - i] = int16_t(Math::iround(y * double(Image::kFilterScale)));
    }

    uint32_t end = (_diameter << Image::kSubpixelShift) - 1u;
    weights[0] = weights[end];

    if (normalization)
      return normalize();

    return SW_SUCCESS;
  }

  //! Makes the weights of every subpixel phase sum to `Image::kFilterScale`.
  //!
  //! Fails with `SW_ERROR_INVALID_STATE` if the table is empty and with `SW_ERROR_INVALID_VALUE` if the weights of
  //! some phase sum to zero.
  SW_API SWResult normalize() noexcept;

  SW_API SWResult _realloc_lut(double radius) noexcept;
};

// sw::ImageFilter
// ===============

//! Filter LUT built from a default constructed `Kernel`.
template<typename Kernel>
class ImageFilter : public ImageFilterLUT {
public:
  SW_INLINE ImageFilter() noexcept
    : ImageFilterLUT(Kernel()) {}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_IMAGE_IMAGEFILTER_P_H_INCLUDED
