// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_GRADIENT_P_H_INCLUDED
#define SWATCH_SPAN_GRADIENT_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// Gradient shape functions map a point to a distance along the gradient. The signature is always
// `int calculate(int x, int y, int d) const`, where `x`, `y` are in `Gradient::kSubpixelShift` precision and `d`
// is the end of the gradient range in the same precision. The result doesn't have to be within `[0, d]`, span
// generators clamp it.

// sw::GradientX & GradientY
// =========================

class GradientX {
public:
  [[nodiscard]]
  static SW_INLINE_NODEBUG int calculate(int x, int y, int d) noexcept { sw_unused(y, d); return x; }
};

class GradientY {
public:
  [[nodiscard]]
  static SW_INLINE_NODEBUG int calculate(int x, int y, int d) noexcept { sw_unused(x, d); return y; }
};

// sw::GradientRadial
// ==================

//! Radial gradient centered at the origin, uses the table based integer square root.
class GradientRadial {
public:
  [[nodiscard]]
  static SW_INLINE int calculate(int x, int y, int d) noexcept {
    sw_unused(d);
    uint64_t r2 = uint64_t(int64_t(x) * int64_t(x)) + uint64_t(int64_t(y) * int64_t(y));
    return int(Math::fast_sqrt(unsigned(sw_min<uint64_t>(r2, 0xFFFFFFFFu))));
  }
};

//! Radial gradient centered at the origin, uses floating point square root.
class GradientRadialD {
public:
  [[nodiscard]]
  static SW_INLINE int calculate(int x, int y, int d) noexcept {
    sw_unused(d);
    return int(Math::uround(Math::sqrt(double(x) * double(x) + double(y) * double(y))));
  }
};

// sw::GradientRadialFocus
// =======================

//! Radial gradient of radius `r` centered at the origin, with a focal point at `[fx, fy]`.
class GradientRadialFocus {
public:
  int _r;
  int _fx;
  int _fy;
  double _r2;
  double _fx2;
  double _fy2;
  double _mul;

  SW_INLINE GradientRadialFocus() noexcept
    : _r(100 * Gradient::kSubpixelScale),
      _fx(0),
      _fy(0) { _update_values(); }

  SW_INLINE GradientRadialFocus(double r, double fx, double fy) noexcept { init(r, fx, fy); }

  SW_INLINE void init(double r, double fx, double fy) noexcept {
    _r = Math::iround(r * Gradient::kSubpixelScale);
    _fx = Math::iround(fx * Gradient::kSubpixelScale);
    _fy = Math::iround(fy * Gradient::kSubpixelScale);
    _update_values();
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG double radius() const noexcept { return double(_r) / Gradient::kSubpixelScale; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double focus_x() const noexcept { return double(_fx) / Gradient::kSubpixelScale; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double focus_y() const noexcept { return double(_fy) / Gradient::kSubpixelScale; }

  [[nodiscard]]
  SW_INLINE int calculate(int x, int y, int d) const noexcept {
    sw_unused(d);
    double dx = double(x - _fx);
    double dy = double(y - _fy);
    double d2 = dx * double(_fy) - dy * double(_fx);
    double d3 = _r2 * (dx * dx + dy * dy) - d2 * d2;
    return Math::iround((dx * double(_fx) + dy * double(_fy) + Math::sqrt(::fabs(d3))) * _mul);
  }

  SW_INLINE void _update_values() noexcept {
    _r2 = double(_r) * double(_r);
    _fx2 = double(_fx) * double(_fx);
    _fy2 = double(_fy) * double(_fy);

    double d = _r2 - (_fx2 + _fy2);

    // The divisor is zero when the focus lies exactly on the circle, move it by one subpixel towards the center.
    if (d == 0.0) {
      if (_fx) _fx += _fx < 0 ? 1 : -1;
      if (_fy) _fy += _fy < 0 ? 1 : -1;

      _fx2 = double(_fx) * double(_fx);
      _fy2 = double(_fy) * double(_fy);
      d = _r2 - (_fx2 + _fy2);
    }

    _mul = double(_r) / d;
  }
};

// sw::GradientDiamond & GradientXY & GradientSqrtXY & GradientConic
// =================================================================

class GradientDiamond {
public:
  [[nodiscard]]
  static SW_INLINE int calculate(int x, int y, int d) noexcept {
    sw_unused(d);
    return sw_max(sw_abs(x), sw_abs(y));
  }
};

class GradientXY {
public:
  [[nodiscard]]
  static SW_INLINE int calculate(int x, int y, int d) noexcept {
    int64_t v = int64_t(sw_abs(x)) * int64_t(sw_abs(y)) / int64_t(sw_max(d, 1));
    return int(sw_min<int64_t>(v, std::numeric_limits<int>::max()));
  }
};

class GradientSqrtXY {
public:
  [[nodiscard]]
  static SW_INLINE int calculate(int x, int y, int d) noexcept {
    sw_unused(d);
    uint64_t v = uint64_t(sw_abs(x)) * uint64_t(sw_abs(y));
    return int(Math::fast_sqrt(unsigned(sw_min<uint64_t>(v, 0xFFFFFFFFu))));
  }
};

//! Angle around the origin mapped to `[0, d]`, symmetric along the X axis.
class GradientConic {
public:
  [[nodiscard]]
  static SW_INLINE int calculate(int x, int y, int d) noexcept {
    return int(Math::uround(::fabs(Math::atan2(double(y), double(x))) * double(d) / Math::kPI));
  }
};

// sw::GradientRepeatAdaptor & GradientReflectAdaptor
// ==================================================

//! Repeats the wrapped gradient shape every `d` units.
template<typename Shape>
class GradientRepeatAdaptor {
public:
  const Shape* _shape;

  SW_INLINE_NODEBUG explicit GradientRepeatAdaptor(const Shape& shape) noexcept
    : _shape(&shape) {}

  [[nodiscard]]
  SW_INLINE int calculate(int x, int y, int d) const noexcept {
    if (d < 1)
      return 0;

    int ret = _shape->calculate(x, y, d) % d;
    if (ret < 0)
      ret += d;
    return ret;
  }
};

//! Mirrors the wrapped gradient shape every `d` units.
template<typename Shape>
class GradientReflectAdaptor {
public:
  const Shape* _shape;

  SW_INLINE_NODEBUG explicit GradientReflectAdaptor(const Shape& shape) noexcept
    : _shape(&shape) {}

  [[nodiscard]]
  SW_INLINE int calculate(int x, int y, int d) const noexcept {
    if (d < 1)
      return 0;

    int d2 = d << 1;
    int ret = _shape->calculate(x, y, d) % d2;
    if (ret < 0)
      ret += d2;
    if (ret >= d)
      ret = d2 - ret;
    return ret;
  }
};

// sw::GradientLinearColor
// =======================

//! Color function that mixes two colors, `size` steps from `c1` to `c2`.
template<typename Color>
class GradientLinearColor {
public:
  typedef Color ColorType;

  Color _c1;
  Color _c2;
  uint32_t _size;

  SW_INLINE_NODEBUG GradientLinearColor() noexcept
    : _c1(ColorOps::no_color<Color>()),
      _c2(ColorOps::no_color<Color>()),
      _size(256) {}

  SW_INLINE_NODEBUG GradientLinearColor(const Color& c1, const Color& c2, uint32_t size = 256) noexcept
    : _c1(c1),
      _c2(c2),
      _size(sw_max(size, 2u)) {}

  SW_INLINE void colors(const Color& c1, const Color& c2, uint32_t size = 256) noexcept {
    _c1 = c1;
    _c2 = c2;
    _size = sw_max(size, 2u);
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t size() const noexcept { return _size; }

  [[nodiscard]]
  SW_INLINE Color operator[](uint32_t i) const noexcept {
    return ColorOps::gradient(_c1, _c2, double(i) / double(_size - 1u));
  }
};

// sw::GradientAlphaArray & GradientAlphaIdentity
// ==============================================

//! Alpha function backed by a table of `N` alpha values.
template<uint32_t N = 256, typename T = uint8_t>
class GradientAlphaArray {
public:
  typedef T ValueType;

  T _data[N];

  SW_INLINE GradientAlphaArray() noexcept { memset(_data, 0, sizeof(_data)); }

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR uint32_t size() noexcept { return N; }

  [[nodiscard]]
  SW_INLINE_NODEBUG T& operator[](uint32_t i) noexcept { return _data[i]; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const T& operator[](uint32_t i) const noexcept { return _data[i]; }

  [[nodiscard]]
  SW_INLINE_NODEBUG T* data() noexcept { return _data; }
};

//! Alpha function that returns the gradient index itself.
template<typename T = uint8_t>
class GradientAlphaIdentity {
public:
  typedef T ValueType;

  [[nodiscard]]
  static SW_INLINE_CONSTEXPR uint32_t size() noexcept { return uint32_t(std::numeric_limits<T>::max()) + 1u; }

  [[nodiscard]]
  SW_INLINE_CONSTEXPR T operator[](uint32_t i) const noexcept { return T(i); }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_GRADIENT_P_H_INCLUDED
