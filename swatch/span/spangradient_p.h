// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANGRADIENT_P_H_INCLUDED
#define SWATCH_SPAN_SPANGRADIENT_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {
namespace Internal {

//! Maps the output of a gradient shape `d` into `[0, size)`, where `[d1, d2]` is the gradient range.
//!
//! Calculated in 64 bits so any `d` returned by a shape clamps correctly.
[[nodiscard]]
static SW_INLINE uint32_t gradient_index(int d, int d1, int d2, uint32_t size) noexcept {
  int64_t dd = sw_max<int64_t>(int64_t(d2) - int64_t(d1), 1);
  int64_t i = ((int64_t(d) - int64_t(d1)) * int64_t(size)) / dd;

  if (i < 0)
    return 0;
  if (i >= int64_t(size))
    return size - 1u;
  return uint32_t(i);
}

} // {Internal}

// sw::SpanGradient
// ================

//! Gradient span generator.
//!
//! Every pixel is mapped by `Interpolator` into gradient space, passed to `Shape::calculate()`, scaled into the
//! range of `ColorFunc` and looked up. `ColorFunc` provides `size()` and `operator[]`.
template<typename Color, typename Interpolator, typename Shape, typename ColorFunc>
class SpanGradient {
public:
  typedef Color ColorType;

  static constexpr uint32_t kDownscaleShift = Interpolator::kSubpixelShift - Gradient::kSubpixelShift;

  Interpolator* _interpolator;
  const Shape* _shape;
  const ColorFunc* _color_func;
  int _d1;
  int _d2;

  SW_INLINE_NODEBUG SpanGradient() noexcept
    : _interpolator(nullptr),
      _shape(nullptr),
      _color_func(nullptr),
      _d1(0),
      _d2(0) {}

  SW_INLINE SpanGradient(Interpolator& interpolator, const Shape& shape, const ColorFunc& color_func, double d1, double d2) noexcept
    : _interpolator(&interpolator),
      _shape(&shape),
      _color_func(&color_func),
      _d1(Math::iround(d1 * Gradient::kSubpixelScale)),
      _d2(Math::iround(d2 * Gradient::kSubpixelScale)) {}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG Interpolator& interpolator() const noexcept { return *_interpolator; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const Shape& shape() const noexcept { return *_shape; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const ColorFunc& color_function() const noexcept { return *_color_func; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double d1() const noexcept { return double(_d1) / Gradient::kSubpixelScale; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double d2() const noexcept { return double(_d2) / Gradient::kSubpixelScale; }

  SW_INLINE_NODEBUG void set_interpolator(Interpolator& interpolator) noexcept { _interpolator = &interpolator; }
  SW_INLINE_NODEBUG void set_shape(const Shape& shape) noexcept { _shape = &shape; }
  SW_INLINE_NODEBUG void set_color_function(const ColorFunc& color_func) noexcept { _color_func = &color_func; }
  SW_INLINE_NODEBUG void set_d1(double v) noexcept { _d1 = Math::iround(v * Gradient::kSubpixelScale); }
  SW_INLINE_NODEBUG void set_d2(double v) noexcept { _d2 = Math::iround(v * Gradient::kSubpixelScale); }

  //! \}

  //! \name Generator
  //! \{

  SW_INLINE_NODEBUG void prepare() noexcept {}

  SW_INLINE void generate(Color* span, int x, int y, uint32_t len) noexcept {
    uint32_t size = uint32_t(_color_func->size());
    _interpolator->begin(double(x) + 0.5, double(y) + 0.5, len);

    for (uint32_t i = 0; i < len; i++) {
      int ix, iy;
      _interpolator->coordinates(&ix, &iy);

      int d = _shape->calculate(ix >> kDownscaleShift, iy >> kDownscaleShift, _d2);
      span[i] = (*_color_func)[Internal::gradient_index(d, _d1, _d2, size)];
      _interpolator->next();
    }
  }

  //! \}
};

// sw::SpanGradientAlpha
// =====================

//! Gradient span converter that replaces the alpha of already generated colors.
//!
//! Works the same way as `SpanGradient`, but `AlphaFunc` returns alpha values. Usually chained after another
//! generator by `SpanConverter`.
template<typename Color, typename Interpolator, typename Shape, typename AlphaFunc>
class SpanGradientAlpha {
public:
  typedef Color ColorType;
  typedef ColorTraits<Color> Traits;

  static constexpr uint32_t kDownscaleShift = Interpolator::kSubpixelShift - Gradient::kSubpixelShift;

  Interpolator* _interpolator;
  const Shape* _shape;
  const AlphaFunc* _alpha_func;
  int _d1;
  int _d2;

  SW_INLINE_NODEBUG SpanGradientAlpha() noexcept
    : _interpolator(nullptr),
      _shape(nullptr),
      _alpha_func(nullptr),
      _d1(0),
      _d2(0) {}

  SW_INLINE SpanGradientAlpha(Interpolator& interpolator, const Shape& shape, const AlphaFunc& alpha_func, double d1, double d2) noexcept
    : _interpolator(&interpolator),
      _shape(&shape),
      _alpha_func(&alpha_func),
      _d1(Math::iround(d1 * Gradient::kSubpixelScale)),
      _d2(Math::iround(d2 * Gradient::kSubpixelScale)) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG Interpolator& interpolator() const noexcept { return *_interpolator; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const Shape& shape() const noexcept { return *_shape; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const AlphaFunc& alpha_function() const noexcept { return *_alpha_func; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double d1() const noexcept { return double(_d1) / Gradient::kSubpixelScale; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double d2() const noexcept { return double(_d2) / Gradient::kSubpixelScale; }

  SW_INLINE_NODEBUG void set_interpolator(Interpolator& interpolator) noexcept { _interpolator = &interpolator; }
  SW_INLINE_NODEBUG void set_shape(const Shape& shape) noexcept { _shape = &shape; }
  SW_INLINE_NODEBUG void set_alpha_function(const AlphaFunc& alpha_func) noexcept { _alpha_func = &alpha_func; }
  SW_INLINE_NODEBUG void set_d1(double v) noexcept { _d1 = Math::iround(v * Gradient::kSubpixelScale); }
  SW_INLINE_NODEBUG void set_d2(double v) noexcept { _d2 = Math::iround(v * Gradient::kSubpixelScale); }

  SW_INLINE_NODEBUG void prepare() noexcept {}

  SW_INLINE void generate(Color* span, int x, int y, uint32_t len) noexcept {
    uint32_t size = uint32_t(_alpha_func->size());
    _interpolator->begin(double(x) + 0.5, double(y) + 0.5, len);

    for (uint32_t i = 0; i < len; i++) {
      int ix, iy;
      _interpolator->coordinates(&ix, &iy);

      int d = _shape->calculate(ix >> kDownscaleShift, iy >> kDownscaleShift, _d2);
      ColorOps::set_alpha(span[i], typename Traits::ValueType((*_alpha_func)[Internal::gradient_index(d, _d1, _d2, size)]));
      _interpolator->next();
    }
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANGRADIENT_P_H_INCLUDED
