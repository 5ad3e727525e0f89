// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_SPAN_GRADIENTIMAGE_P_H_INCLUDED
#define SWATCH_SPAN_GRADIENTIMAGE_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>
#include <swatch/span/spantraits_p.h>
#include <swatch/support/podarray_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::GradientImage
// =================

//! Gradient whose colors come from an RGBA image that repeats infinitely in both directions.
//!
//! The image is owned by the gradient, `create()` allocates it cleared to transparent black and the caller fills it
//! through `pixel_data()`.
class GradientImage {
public:
  SW_NONCOPYABLE(GradientImage)

  PodArray<SWRgba8> _pixels;
  int _width;
  int _height;

  SW_INLINE GradientImage() noexcept
    : _width(0),
      _height(0) {}

  //! Allocates a `width` x `height` image, the previous content is discarded.
  SW_API SWResult create(int width, int height) noexcept;

  SW_INLINE void reset() noexcept {
    _pixels.reset();
    _width = 0;
    _height = 0;
  }

  [[nodiscard]]
  SW_INLINE_NODEBUG bool empty() const noexcept { return _pixels.empty(); }

  [[nodiscard]]
  SW_INLINE_NODEBUG int width() const noexcept { return _width; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int height() const noexcept { return _height; }

  //! Returns the stride of the image in bytes.
  [[nodiscard]]
  SW_INLINE_NODEBUG intptr_t stride() const noexcept { return intptr_t(_width) * intptr_t(sizeof(SWRgba8)); }

  [[nodiscard]]
  SW_INLINE_NODEBUG SWRgba8* pixel_data() noexcept { return _pixels.data(); }

  [[nodiscard]]
  SW_INLINE_NODEBUG const SWRgba8* pixel_data() const noexcept { return _pixels.data(); }

  [[nodiscard]]
  SW_INLINE SWRgba8* row_ptr(int y) noexcept { return _pixels.data() + size_t(y) * size_t(_width); }

  //! Returns the color at `[x, y]` given in `Gradient::kSubpixelShift` precision, wrapped to the image size.
  [[nodiscard]]
  SW_INLINE SWRgba8 sample(int x, int y) const noexcept {
    if (_pixels.empty())
      return ColorOps::no_color<SWRgba8>();

    int px = (x >> Gradient::kSubpixelShift) % _width;
    int py = (y >> Gradient::kSubpixelShift) % _height;

    if (px < 0) px += _width;
    if (py < 0) py += _height;

    return _pixels[size_t(py) * size_t(_width) + size_t(px)];
  }
};

// sw::SpanGradientImage
// =====================

//! Span generator that samples `GradientImage` through an interpolator.
template<typename Interpolator>
class SpanGradientImage {
public:
  typedef SWRgba8 ColorType;

  static constexpr uint32_t kDownscaleShift = Interpolator::kSubpixelShift - Gradient::kSubpixelShift;

  Interpolator* _interpolator;
  const GradientImage* _image;

  SW_INLINE_NODEBUG SpanGradientImage() noexcept
    : _interpolator(nullptr),
      _image(nullptr) {}

  SW_INLINE_NODEBUG SpanGradientImage(Interpolator& interpolator, const GradientImage& image) noexcept
    : _interpolator(&interpolator),
      _image(&image) {}

  [[nodiscard]]
  SW_INLINE_NODEBUG Interpolator& interpolator() const noexcept { return *_interpolator; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const GradientImage& image() const noexcept { return *_image; }

  SW_INLINE_NODEBUG void set_interpolator(Interpolator& interpolator) noexcept { _interpolator = &interpolator; }
  SW_INLINE_NODEBUG void set_image(const GradientImage& image) noexcept { _image = &image; }

  SW_INLINE_NODEBUG void prepare() noexcept {}

  SW_INLINE void generate(SWRgba8* span, int x, int y, uint32_t len) noexcept {
    _interpolator->begin(double(x) + 0.5, double(y) + 0.5, len);

    for (uint32_t i = 0; i < len; i++) {
      int ix, iy;
      _interpolator->coordinates(&ix, &iy);
      span[i] = _image->sample(ix >> kDownscaleShift, iy >> kDownscaleShift);
      _interpolator->next();
    }
  }
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_SPAN_GRADIENTIMAGE_P_H_INCLUDED
