// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_SPANIMAGEFILTER_P_H_INCLUDED
#define SWATCH_SPAN_SPANIMAGEFILTER_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/image/imagefilter_p.h>
#include <swatch/image/pixelformat_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {
namespace Internal {

// sw::Internal::ImageFilterOps
// ============================

//! Per-format accumulation used by all image filters.
//!
//! Component `i` of a stored pixel is read from `p[offset[i]]` and accumulated into `fg[i]`. `store()` clamps the
//! accumulated values to the channel range and, for formats with alpha, clamps color channels to alpha.
template<typename Format>
struct ImageFilterOps {
  typedef typename Format::ColorType ColorType;
  typedef ColorTraits<ColorType> Traits;
  typedef typename Traits::ValueType ValueType;
  typedef typename Traits::AccumType AccumType;

  static constexpr uint32_t kComponents = Format::kComponents;

  static SW_INLINE void init(AccumType* fg, AccumType value) noexcept {
    for (uint32_t i = 0; i < kComponents; i++)
      fg[i] = value;
  }

  template<typename Weight>
  static SW_INLINE void add(AccumType* fg, const ValueType* p, const uint8_t* offset, Weight weight) noexcept {
    for (uint32_t i = 0; i < kComponents; i++)
      fg[i] += AccumType(weight) * AccumType(p[offset[i]]);
  }

  static SW_INLINE void downshift(AccumType* fg, uint32_t shift) noexcept {
    for (uint32_t i = 0; i < kComponents; i++)
      fg[i] = Traits::downshift(fg[i], shift);
  }

  static SW_INLINE void store(ColorType& dst, const AccumType* fg) noexcept {
    for (uint32_t i = 0; i < kComponents; i++)
      Traits::set(dst, i, Traits::from_accum(fg[i]));

    if constexpr (Format::kHasAlpha) {
      ValueType a = Traits::get(dst, Traits::kAlphaIndex);
      for (uint32_t i = 0; i < kComponents; i++) {
        if (i != Traits::kAlphaIndex && Traits::get(dst, i) > a)
          Traits::set(dst, i, a);
      }
    }
    else {
      Traits::set(dst, Traits::kAlphaIndex, Traits::base_mask());
    }
  }

  static SW_INLINE void copy(ColorType& dst, const ValueType* p, const uint8_t* offset) noexcept {
    for (uint32_t i = 0; i < kComponents; i++)
      Traits::set(dst, i, p[offset[i]]);

    if constexpr (!Format::kHasAlpha)
      Traits::set(dst, Traits::kAlphaIndex, Traits::base_mask());
  }
};

//! Divides the accumulated values by the total weight and stores the result.
template<typename Ops>
static SW_INLINE void resample_store(typename Ops::ColorType& dst, typename Ops::AccumType* fg, int total_weight) noexcept {
  if (total_weight != 0) {
    for (uint32_t i = 0; i < Ops::kComponents; i++)
      fg[i] /= typename Ops::AccumType(total_weight);
  }
  Ops::store(dst, fg);
}

//! Number of kernel taps starting at `hr_start` and stepping by `step` while below `filter_scale`.
static SW_INLINE uint32_t resample_tap_count(int hr_start, int step, int filter_scale) noexcept {
  return uint32_t((filter_scale - hr_start + step - 1) / step);
}

} // {Internal}

// sw::SpanImageFilter
// ===================

//! Common state of image span generators.
//!
//! `Source` is an image accessor (or a `PixelSource` for clipping filters), `Interpolator` maps destination pixels
//! into the source in `Image::kSubpixelShift` precision. The filter offset moves the sampling point, by default to
//! the center of the destination pixel.
template<typename Source, typename Interpolator>
class SpanImageFilter {
public:
  typedef Source SourceType;
  typedef Interpolator InterpolatorType;

  Source* _source;
  Interpolator* _interpolator;
  const ImageFilterLUT* _filter;
  double _dx_dbl;
  double _dy_dbl;
  int _dx_int;
  int _dy_int;

  SW_INLINE SpanImageFilter() noexcept
    : _source(nullptr),
      _interpolator(nullptr),
      _filter(nullptr),
      _dx_dbl(0.5),
      _dy_dbl(0.5),
      _dx_int(Image::kSubpixelScale / 2),
      _dy_int(Image::kSubpixelScale / 2) {}

  SW_INLINE SpanImageFilter(Source& source, Interpolator& interpolator, const ImageFilterLUT* filter) noexcept
    : _source(&source),
      _interpolator(&interpolator),
      _filter(filter),
      _dx_dbl(0.5),
      _dy_dbl(0.5),
      _dx_int(Image::kSubpixelScale / 2),
      _dy_int(Image::kSubpixelScale / 2) {}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG Source& source() const noexcept { return *_source; }

  [[nodiscard]]
  SW_INLINE_NODEBUG Interpolator& interpolator() const noexcept { return *_interpolator; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const ImageFilterLUT* filter() const noexcept { return _filter; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int filter_dx_int() const noexcept { return _dx_int; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int filter_dy_int() const noexcept { return _dy_int; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double filter_dx_dbl() const noexcept { return _dx_dbl; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double filter_dy_dbl() const noexcept { return _dy_dbl; }

  SW_INLINE_NODEBUG void attach(Source& source) noexcept { _source = &source; }
  SW_INLINE_NODEBUG void set_interpolator(Interpolator& interpolator) noexcept { _interpolator = &interpolator; }
  SW_INLINE_NODEBUG void set_filter(const ImageFilterLUT& filter) noexcept { _filter = &filter; }
  SW_INLINE_NODEBUG void reset_filter() noexcept { _filter = nullptr; }

  //! \}

  SW_INLINE void filter_offset(double dx, double dy) noexcept {
    _dx_dbl = dx;
    _dy_dbl = dy;
    _dx_int = Math::iround(dx * Image::kSubpixelScale);
    _dy_int = Math::iround(dy * Image::kSubpixelScale);
  }

  SW_INLINE void filter_offset(double d) noexcept { filter_offset(d, d); }

  SW_INLINE_NODEBUG void prepare() noexcept {}

protected:
  [[nodiscard]]
  SW_INLINE bool has_filter() const noexcept { return _filter && !_filter->empty(); }

  //! Bilinear interpolation of the 2x2 neighborhood, also used as a fallback by filters without a LUT.
  template<typename Color>
  void generate_bilinear(Color* span, int x, int y, uint32_t len) noexcept {
    using Ops = Internal::ImageFilterOps<typename Source::FormatType>;
    using AccumType = typename Ops::AccumType;
    using Traits = typename Ops::Traits;

    constexpr uint32_t kShift = Image::kSubpixelShift;
    constexpr int kScale = Image::kSubpixelScale;
    constexpr int kMask = Image::kSubpixelMask;

    const uint8_t* offset = _source->pixel_source().offsets();
    AccumType fg[4];

    _interpolator->begin(double(x) + _dx_dbl, double(y) + _dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int x_hr, y_hr;
      _interpolator->coordinates(&x_hr, &y_hr);

      x_hr -= _dx_int;
      y_hr -= _dy_int;

      int x_lr = x_hr >> kShift;
      int y_lr = y_hr >> kShift;

      x_hr &= kMask;
      y_hr &= kMask;

      Ops::init(fg, Traits::round_bias(kShift * 2));

      const typename Ops::ValueType* p = _source->span(x_lr, y_lr, 2);
      Ops::add(fg, p, offset, (kScale - x_hr) * (kScale - y_hr));

      p = _source->next_x();
      Ops::add(fg, p, offset, x_hr * (kScale - y_hr));

      p = _source->next_y();
      Ops::add(fg, p, offset, (kScale - x_hr) * y_hr);

      p = _source->next_x();
      Ops::add(fg, p, offset, x_hr * y_hr);

      Ops::downshift(fg, kShift * 2);
      Ops::store(span[i], fg);

      _interpolator->next();
    }
  }
};

// sw::SpanImageFilterNN
// =====================

//! Nearest neighbor sampling.
template<typename Source, typename Interpolator>
class SpanImageFilterNN : public SpanImageFilter<Source, Interpolator> {
public:
  using Base = SpanImageFilter<Source, Interpolator>;
  using Format = typename Source::FormatType;
  using Ops = Internal::ImageFilterOps<Format>;
  typedef typename Format::ColorType ColorType;

  SW_INLINE SpanImageFilterNN() noexcept {}

  SW_INLINE SpanImageFilterNN(Source& source, Interpolator& interpolator) noexcept
    : Base(source, interpolator, nullptr) {}

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    const uint8_t* offset = this->_source->pixel_source().offsets();

    this->_interpolator->begin(double(x) + this->_dx_dbl, double(y) + this->_dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int sx, sy;
      this->_interpolator->coordinates(&sx, &sy);

      const typename Ops::ValueType* p = this->_source->span(sx >> Image::kSubpixelShift, sy >> Image::kSubpixelShift, 1);
      Ops::copy(span[i], p, offset);

      this->_interpolator->next();
    }
  }
};

// sw::SpanImageFilterBilinear
// ===========================

//! Bilinear interpolation of the 2x2 neighborhood.
template<typename Source, typename Interpolator>
class SpanImageFilterBilinear : public SpanImageFilter<Source, Interpolator> {
public:
  using Base = SpanImageFilter<Source, Interpolator>;
  using Format = typename Source::FormatType;
  typedef typename Format::ColorType ColorType;

  SW_INLINE SpanImageFilterBilinear() noexcept {}

  SW_INLINE SpanImageFilterBilinear(Source& source, Interpolator& interpolator) noexcept
    : Base(source, interpolator, nullptr) {}

  SW_INLINE void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    this->generate_bilinear(span, x, y, len);
  }
};

// sw::SpanImageFilterBilinearClip
// ===============================

//! Bilinear interpolation that reads a `PixelSource` directly and blends with a background color at the edges.
//!
//! Pixels whose neighborhood lies completely outside of the image get the background color, pixels at the edges
//! blend the background with the pixels that are inside.
template<typename Format, typename Interpolator>
class SpanImageFilterBilinearClip : public SpanImageFilter<PixelSource<Format>, Interpolator> {
public:
  using Base = SpanImageFilter<PixelSource<Format>, Interpolator>;
  using Ops = Internal::ImageFilterOps<Format>;
  using Traits = typename Ops::Traits;
  using ValueType = typename Ops::ValueType;
  using AccumType = typename Ops::AccumType;
  typedef typename Format::ColorType ColorType;

  ColorType _background;

  SW_INLINE SpanImageFilterBilinearClip() noexcept
    : _background(ColorOps::no_color<ColorType>()) {}

  SW_INLINE SpanImageFilterBilinearClip(PixelSource<Format>& source, const ColorType& background, Interpolator& interpolator) noexcept
    : Base(source, interpolator, nullptr),
      _background(background) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG const ColorType& background_color() const noexcept { return _background; }

  SW_INLINE_NODEBUG void set_background_color(const ColorType& background) noexcept { _background = background; }

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    constexpr uint32_t kShift = Image::kSubpixelShift;
    constexpr int kScale = Image::kSubpixelScale;
    constexpr int kMask = Image::kSubpixelMask;

    const PixelSource<Format>& src = *this->_source;
    const uint8_t* offset = src.offsets();
    AccumType fg[4];

    // Background in stored order, so it can be accumulated the same way as pixels.
    ValueType back[4];
    src.store_color(back, _background);

    int maxx = src.width() - 1;
    int maxy = src.height() - 1;

    this->_interpolator->begin(double(x) + this->_dx_dbl, double(y) + this->_dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int x_hr, y_hr;
      this->_interpolator->coordinates(&x_hr, &y_hr);

      x_hr -= this->_dx_int;
      y_hr -= this->_dy_int;

      int x_lr = x_hr >> kShift;
      int y_lr = y_hr >> kShift;

      if (x_lr >= 0 && y_lr >= 0 && x_lr < maxx && y_lr < maxy) {
        x_hr &= kMask;
        y_hr &= kMask;

        Ops::init(fg, Traits::round_bias(kShift * 2));

        const ValueType* p = src.pix_ptr(x_lr, y_lr);
        Ops::add(fg, p, offset, (kScale - x_hr) * (kScale - y_hr));
        Ops::add(fg, p + Format::kComponents, offset, x_hr * (kScale - y_hr));

        p = src.pix_ptr(x_lr, y_lr + 1);
        Ops::add(fg, p, offset, (kScale - x_hr) * y_hr);
        Ops::add(fg, p + Format::kComponents, offset, x_hr * y_hr);

        Ops::downshift(fg, kShift * 2);
        Ops::store(span[i], fg);
      }
      else if (x_lr < -1 || y_lr < -1 || x_lr > maxx || y_lr > maxy) {
        span[i] = _background;
      }
      else {
        x_hr &= kMask;
        y_hr &= kMask;

        Ops::init(fg, Traits::round_bias(kShift * 2));

        add_clipped(fg, src, back, x_lr    , y_lr    , (kScale - x_hr) * (kScale - y_hr));
        add_clipped(fg, src, back, x_lr + 1, y_lr    , x_hr * (kScale - y_hr));
        add_clipped(fg, src, back, x_lr    , y_lr + 1, (kScale - x_hr) * y_hr);
        add_clipped(fg, src, back, x_lr + 1, y_lr + 1, x_hr * y_hr);

        Ops::downshift(fg, kShift * 2);
        Ops::store(span[i], fg);
      }

      this->_interpolator->next();
    }
  }

private:
  static SW_INLINE void add_clipped(AccumType* fg, const PixelSource<Format>& src, const ValueType* back, int x, int y, int weight) noexcept {
    if (x >= 0 && y >= 0 && x < src.width() && y < src.height())
      Ops::add(fg, src.pix_ptr(x, y), src.offsets(), weight);
    else
      Ops::add(fg, back, src.offsets(), weight);
  }
};

// sw::SpanImageFilter2x2
// ======================

//! 2x2 filter that takes its weights from the central part of a filter LUT.
//!
//! Falls back to bilinear interpolation when no filter is attached.
template<typename Source, typename Interpolator>
class SpanImageFilter2x2 : public SpanImageFilter<Source, Interpolator> {
public:
  using Base = SpanImageFilter<Source, Interpolator>;
  using Format = typename Source::FormatType;
  using Ops = Internal::ImageFilterOps<Format>;
  using Traits = typename Ops::Traits;
  using AccumType = typename Ops::AccumType;
  typedef typename Format::ColorType ColorType;

  SW_INLINE SpanImageFilter2x2() noexcept {}

  SW_INLINE SpanImageFilter2x2(Source& source, Interpolator& interpolator, const ImageFilterLUT& filter) noexcept
    : Base(source, interpolator, &filter) {}

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    if (!this->has_filter()) {
      this->generate_bilinear(span, x, y, len);
      return;
    }

    constexpr uint32_t kShift = Image::kSubpixelShift;
    constexpr int kScale = Image::kSubpixelScale;
    constexpr int kMask = Image::kSubpixelMask;
    constexpr uint32_t kFilterShift = Image::kFilterShift;
    constexpr int kFilterHalf = Image::kFilterScale / 2;

    const uint8_t* offset = this->_source->pixel_source().offsets();
    const int16_t* weights = this->_filter->weight_array() + ((this->_filter->diameter() / 2u - 1u) << kShift);
    AccumType fg[4];

    this->_interpolator->begin(double(x) + this->_dx_dbl, double(y) + this->_dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int x_hr, y_hr;
      this->_interpolator->coordinates(&x_hr, &y_hr);

      x_hr -= this->_dx_int;
      y_hr -= this->_dy_int;

      int x_lr = x_hr >> kShift;
      int y_lr = y_hr >> kShift;

      x_hr &= kMask;
      y_hr &= kMask;

      Ops::init(fg, Traits::round_bias(kFilterShift));

      const typename Ops::ValueType* p = this->_source->span(x_lr, y_lr, 2);
      Ops::add(fg, p, offset, (weights[x_hr + kScale] * weights[y_hr + kScale] + kFilterHalf) >> kFilterShift);

      p = this->_source->next_x();
      Ops::add(fg, p, offset, (weights[x_hr] * weights[y_hr + kScale] + kFilterHalf) >> kFilterShift);

      p = this->_source->next_y();
      Ops::add(fg, p, offset, (weights[x_hr + kScale] * weights[y_hr] + kFilterHalf) >> kFilterShift);

      p = this->_source->next_x();
      Ops::add(fg, p, offset, (weights[x_hr] * weights[y_hr] + kFilterHalf) >> kFilterShift);

      Ops::downshift(fg, kFilterShift);
      Ops::store(span[i], fg);

      this->_interpolator->next();
    }
  }
};

// sw::SpanImageFilterGeneral
// ==========================

//! N-tap filter covering `diameter x diameter` source pixels.
//!
//! Falls back to bilinear interpolation when no filter is attached.
template<typename Source, typename Interpolator>
class SpanImageFilterGeneral : public SpanImageFilter<Source, Interpolator> {
public:
  using Base = SpanImageFilter<Source, Interpolator>;
  using Format = typename Source::FormatType;
  using Ops = Internal::ImageFilterOps<Format>;
  using Traits = typename Ops::Traits;
  using AccumType = typename Ops::AccumType;
  typedef typename Format::ColorType ColorType;

  SW_INLINE SpanImageFilterGeneral() noexcept {}

  SW_INLINE SpanImageFilterGeneral(Source& source, Interpolator& interpolator, const ImageFilterLUT& filter) noexcept
    : Base(source, interpolator, &filter) {}

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    if (!this->has_filter()) {
      this->generate_bilinear(span, x, y, len);
      return;
    }

    constexpr uint32_t kShift = Image::kSubpixelShift;
    constexpr int kScale = Image::kSubpixelScale;
    constexpr int kMask = Image::kSubpixelMask;
    constexpr uint32_t kFilterShift = Image::kFilterShift;
    constexpr int kFilterHalf = Image::kFilterScale / 2;

    const uint8_t* offset = this->_source->pixel_source().offsets();
    uint32_t diameter = this->_filter->diameter();
    int start = this->_filter->start();
    const int16_t* weights = this->_filter->weight_array();
    AccumType fg[4];

    this->_interpolator->begin(double(x) + this->_dx_dbl, double(y) + this->_dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int sx, sy;
      this->_interpolator->coordinates(&sx, &sy);

      sx -= this->_dx_int;
      sy -= this->_dy_int;

      int x_lr = sx >> kShift;
      int y_lr = sy >> kShift;
      int x_fract = sx & kMask;
      int y_hr = kMask - (sy & kMask);

      Ops::init(fg, Traits::round_bias(kFilterShift));

      const typename Ops::ValueType* p = this->_source->span(x_lr + start, y_lr + start, diameter);
      uint32_t y_count = diameter;

      for (;;) {
        int weight_y = weights[y_hr];
        int x_hr = kMask - x_fract;
        uint32_t x_count = diameter;

        for (;;) {
          Ops::add(fg, p, offset, (weight_y * weights[x_hr] + kFilterHalf) >> kFilterShift);
          if (--x_count == 0)
            break;

          x_hr += kScale;
          p = this->_source->next_x();
        }

        if (--y_count == 0)
          break;

        y_hr += kScale;
        p = this->_source->next_y();
      }

      Ops::downshift(fg, kFilterShift);
      Ops::store(span[i], fg);

      this->_interpolator->next();
    }
  }
};

// sw::SpanImageResampleAffine
// ===========================

//! Resampling filter for affine transformations.
//!
//! The kernel is stretched by the scale of the transformation (limited by `scale_limit()` and multiplied by blur),
//! computed once by `prepare()`. The interpolator must expose its transform, which provides `scaling_abs()`.
//! Falls back to bilinear interpolation when no filter is attached.
template<typename Source, typename Interpolator>
class SpanImageResampleAffine : public SpanImageFilter<Source, Interpolator> {
public:
  using Base = SpanImageFilter<Source, Interpolator>;
  using Format = typename Source::FormatType;
  using Ops = Internal::ImageFilterOps<Format>;
  using AccumType = typename Ops::AccumType;
  typedef typename Format::ColorType ColorType;

  SW_STATIC_ASSERT(SpanTraits<Interpolator>::kHasTransformer);

  double _scale_limit;
  double _blur_x;
  double _blur_y;
  int _rx;
  int _ry;
  int _rx_inv;
  int _ry_inv;

  SW_INLINE SpanImageResampleAffine() noexcept
    : _scale_limit(200.0),
      _blur_x(1.0),
      _blur_y(1.0),
      _rx(Image::kSubpixelScale),
      _ry(Image::kSubpixelScale),
      _rx_inv(Image::kSubpixelScale),
      _ry_inv(Image::kSubpixelScale) {}

  SW_INLINE SpanImageResampleAffine(Source& source, Interpolator& interpolator, const ImageFilterLUT& filter) noexcept
    : Base(source, interpolator, &filter),
      _scale_limit(200.0),
      _blur_x(1.0),
      _blur_y(1.0),
      _rx(Image::kSubpixelScale),
      _ry(Image::kSubpixelScale),
      _rx_inv(Image::kSubpixelScale),
      _ry_inv(Image::kSubpixelScale) {}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG int scale_limit() const noexcept { return Math::iround(_scale_limit); }

  SW_INLINE_NODEBUG void set_scale_limit(int v) noexcept { _scale_limit = double(v); }

  [[nodiscard]]
  SW_INLINE_NODEBUG double blur_x() const noexcept { return _blur_x; }

  [[nodiscard]]
  SW_INLINE_NODEBUG double blur_y() const noexcept { return _blur_y; }

  SW_INLINE_NODEBUG void set_blur_x(double v) noexcept { _blur_x = v; }
  SW_INLINE_NODEBUG void set_blur_y(double v) noexcept { _blur_y = v; }
  SW_INLINE_NODEBUG void set_blur(double v) noexcept { _blur_x = _blur_y = v; }

  //! \}

  void prepare() noexcept {
    double scale_x;
    double scale_y;
    this->_interpolator->transformer().scaling_abs(&scale_x, &scale_y);

    double scale_xy = scale_x * scale_y;
    if (scale_xy > _scale_limit) {
      scale_x = scale_x * _scale_limit / scale_xy;
      scale_y = scale_y * _scale_limit / scale_xy;
    }

    scale_x = sw_clamp(scale_x, 1.0, _scale_limit) * _blur_x;
    scale_y = sw_clamp(scale_y, 1.0, _scale_limit) * _blur_y;

    scale_x = sw_max(scale_x, 1.0);
    scale_y = sw_max(scale_y, 1.0);

    _rx = int(Math::uround(scale_x * double(Image::kSubpixelScale)));
    _ry = int(Math::uround(scale_y * double(Image::kSubpixelScale)));
    _rx_inv = int(Math::uround(1.0 / scale_x * double(Image::kSubpixelScale)));
    _ry_inv = int(Math::uround(1.0 / scale_y * double(Image::kSubpixelScale)));
  }

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    if (!this->has_filter()) {
      this->generate_bilinear(span, x, y, len);
      return;
    }

    constexpr uint32_t kShift = Image::kSubpixelShift;
    constexpr int kMask = Image::kSubpixelMask;
    constexpr uint32_t kFilterShift = Image::kFilterShift;
    constexpr int kFilterHalf = Image::kFilterScale / 2;

    const uint8_t* offset = this->_source->pixel_source().offsets();
    int diameter = int(this->_filter->diameter());
    int filter_scale = diameter << kShift;
    int radius_x = (diameter * _rx) >> 1;
    int radius_y = (diameter * _ry) >> 1;
    const int16_t* weights = this->_filter->weight_array();
    AccumType fg[4];

    this->_interpolator->begin(double(x) + this->_dx_dbl, double(y) + this->_dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int sx, sy;
      this->_interpolator->coordinates(&sx, &sy);

      sx += this->_dx_int - radius_x;
      sy += this->_dy_int - radius_y;

      Ops::init(fg, AccumType(0));
      int total_weight = 0;

      int y_lr = sy >> kShift;
      int y_hr = ((kMask - (sy & kMask)) * _ry_inv) >> kShift;
      int x_lr = sx >> kShift;
      int x_hr_start = ((kMask - (sx & kMask)) * _rx_inv) >> kShift;
      uint32_t len_x_lr = Internal::resample_tap_count(x_hr_start, _rx_inv, filter_scale);

      const typename Ops::ValueType* p = this->_source->span(x_lr, y_lr, len_x_lr);
      for (;;) {
        int weight_y = weights[y_hr];
        int x_hr = x_hr_start;

        for (;;) {
          int weight = (weight_y * weights[x_hr] + kFilterHalf) >> kFilterShift;
          Ops::add(fg, p, offset, weight);
          total_weight += weight;

          x_hr += _rx_inv;
          if (x_hr >= filter_scale)
            break;
          p = this->_source->next_x();
        }

        y_hr += _ry_inv;
        if (y_hr >= filter_scale)
          break;
        p = this->_source->next_y();
      }

      Internal::resample_store<Ops>(span[i], fg, total_weight);
      this->_interpolator->next();
    }
  }
};

// sw::SpanImageResample
// =====================

//! Resampling filter for any transformation.
//!
//! The kernel is stretched per pixel by the local scale reported by the interpolator, limited by `scale_limit()`
//! and multiplied by blur. Interpolators without a local scale are treated as identity. Falls back to bilinear
//! interpolation when no filter is attached.
template<typename Source, typename Interpolator>
class SpanImageResample : public SpanImageFilter<Source, Interpolator> {
public:
  using Base = SpanImageFilter<Source, Interpolator>;
  using Format = typename Source::FormatType;
  using Ops = Internal::ImageFilterOps<Format>;
  using AccumType = typename Ops::AccumType;
  typedef typename Format::ColorType ColorType;

  int _scale_limit;
  int _blur_x;
  int _blur_y;

  SW_INLINE SpanImageResample() noexcept
    : _scale_limit(20),
      _blur_x(Image::kSubpixelScale),
      _blur_y(Image::kSubpixelScale) {}

  SW_INLINE SpanImageResample(Source& source, Interpolator& interpolator, const ImageFilterLUT& filter) noexcept
    : Base(source, interpolator, &filter),
      _scale_limit(20),
      _blur_x(Image::kSubpixelScale),
      _blur_y(Image::kSubpixelScale) {}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG int scale_limit() const noexcept { return _scale_limit; }

  SW_INLINE_NODEBUG void set_scale_limit(int v) noexcept { _scale_limit = sw_max(v, 1); }

  [[nodiscard]]
  SW_INLINE_NODEBUG double blur_x() const noexcept { return double(_blur_x) / double(Image::kSubpixelScale); }

  [[nodiscard]]
  SW_INLINE_NODEBUG double blur_y() const noexcept { return double(_blur_y) / double(Image::kSubpixelScale); }

  SW_INLINE void set_blur_x(double v) noexcept { _blur_x = int(Math::uround(v * double(Image::kSubpixelScale))); }
  SW_INLINE void set_blur_y(double v) noexcept { _blur_y = int(Math::uround(v * double(Image::kSubpixelScale))); }
  SW_INLINE void set_blur(double v) noexcept { set_blur_x(v); set_blur_y(v); }

  //! \}

  //! Clamps the local scale to `[1, scale_limit]` and applies blur, in `Image::kSubpixelShift` precision.
  SW_INLINE void adjust_scale(int* rx, int* ry) const noexcept {
    constexpr int kScale = Image::kSubpixelScale;

    *rx = sw_clamp(*rx, kScale, kScale * _scale_limit);
    *ry = sw_clamp(*ry, kScale, kScale * _scale_limit);

    *rx = sw_max((*rx * _blur_x) >> Image::kSubpixelShift, kScale);
    *ry = sw_max((*ry * _blur_y) >> Image::kSubpixelShift, kScale);
  }

  void generate(ColorType* span, int x, int y, uint32_t len) noexcept {
    if (!this->has_filter()) {
      this->generate_bilinear(span, x, y, len);
      return;
    }

    constexpr uint32_t kShift = Image::kSubpixelShift;
    constexpr int kScale = Image::kSubpixelScale;
    constexpr int kMask = Image::kSubpixelMask;
    constexpr uint32_t kFilterShift = Image::kFilterShift;
    constexpr int kFilterHalf = Image::kFilterScale / 2;

    const uint8_t* offset = this->_source->pixel_source().offsets();
    int diameter = int(this->_filter->diameter());
    int filter_scale = diameter << kShift;
    const int16_t* weights = this->_filter->weight_array();
    AccumType fg[4];

    this->_interpolator->begin(double(x) + this->_dx_dbl, double(y) + this->_dy_dbl, len);
    for (uint32_t i = 0; i < len; i++) {
      int sx, sy;
      int rx, ry;

      this->_interpolator->coordinates(&sx, &sy);
      SpanTraits<Interpolator>::local_scale(*this->_interpolator, &rx, &ry);
      adjust_scale(&rx, &ry);

      int rx_inv = kScale * kScale / rx;
      int ry_inv = kScale * kScale / ry;

      int radius_x = (diameter * rx) >> 1;
      int radius_y = (diameter * ry) >> 1;

      sx += this->_dx_int - radius_x;
      sy += this->_dy_int - radius_y;

      Ops::init(fg, AccumType(0));
      int total_weight = 0;

      int y_lr = sy >> kShift;
      int y_hr = ((kMask - (sy & kMask)) * ry_inv) >> kShift;
      int x_lr = sx >> kShift;
      int x_hr_start = ((kMask - (sx & kMask)) * rx_inv) >> kShift;
      uint32_t len_x_lr = Internal::resample_tap_count(x_hr_start, rx_inv, filter_scale);

      const typename Ops::ValueType* p = this->_source->span(x_lr, y_lr, len_x_lr);
      for (;;) {
        int weight_y = weights[y_hr];
        int x_hr = x_hr_start;

        for (;;) {
          int weight = (weight_y * weights[x_hr] + kFilterHalf) >> kFilterShift;
          Ops::add(fg, p, offset, weight);
          total_weight += weight;

          x_hr += rx_inv;
          if (x_hr >= filter_scale)
            break;
          p = this->_source->next_x();
        }

        y_hr += ry_inv;
        if (y_hr >= filter_scale)
          break;
        p = this->_source->next_y();
      }

      Internal::resample_store<Ops>(span[i], fg, total_weight);
      this->_interpolator->next();
    }
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_SPANIMAGEFILTER_P_H_INCLUDED
