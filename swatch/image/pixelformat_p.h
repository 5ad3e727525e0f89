// This file is part of Swatch project
//
// See swatch.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef SWATCH_IMAGE_PIXELFORMAT_P_H_INCLUDED
#define SWATCH_IMAGE_PIXELFORMAT_P_H_INCLUDED

#include <swatch/core/api-internal_p.h>
#include <swatch/core/rgba_p.h>

//! \cond INTERNAL
//! \addtogroup swatch_internal
//! \{

namespace sw {

// sw::PixelFormat
// ===============

//! Describes how a pixel of raw image data is stored.
//!
//!   - `ColorType` - color produced when the pixel is read.
//!   - `ValueType` - type of a single stored channel.
//!   - `kComponents` - number of stored channels; component `i` maps to channel `i` of `ColorType`.
//!   - `kHasAlpha` - whether alpha is stored, otherwise every pixel is opaque.
//!
//! Formats that store alpha are premultiplied, filters never produce a color channel greater than alpha.
template<typename Color, uint32_t Components, bool HasAlpha>
struct PixelFormatT {
  typedef Color ColorType;
  typedef ColorTraits<Color> Traits;
  typedef typename Traits::ValueType ValueType;

  static constexpr uint32_t kComponents = Components;
  static constexpr bool kHasAlpha = HasAlpha;
  static constexpr uint32_t kPixelSize = uint32_t(Components * sizeof(ValueType));

  SW_STATIC_ASSERT(Components <= Traits::kChannels);
};

//! 8-bit gray without alpha.
struct PixelFormatGray8 : public PixelFormatT<SWGray8, 1, false> {};
//! 8-bit RGB without alpha, channel order given by the source.
struct PixelFormatRgb8 : public PixelFormatT<SWRgba8, 3, false> {};
//! 8-bit premultiplied RGBA, channel order given by the source.
struct PixelFormatRgba8 : public PixelFormatT<SWRgba8, 4, true> {};
//! 16-bit premultiplied RGBA, channel order given by the source.
struct PixelFormatRgba16 : public PixelFormatT<SWRgba16, 4, true> {};
//! 32-bit float premultiplied RGBA, channel order given by the source.
struct PixelFormatRgba32f : public PixelFormatT<SWRgba32f, 4, true> {};

// sw::PixelSource
// ===============

//! Read-only view of raw pixel data stored in `Format`.
//!
//! The data is not owned. Stride is in bytes and can be negative for bottom-up images. Channel order is a runtime
//! property, the `offset(i)` of component `i` within a pixel is resolved from it once.
template<typename Format>
class PixelSource {
public:
  typedef Format FormatType;
  typedef typename Format::ColorType ColorType;
  typedef typename Format::ValueType ValueType;
  typedef ColorTraits<ColorType> Traits;

  static constexpr uint32_t kComponents = Format::kComponents;

  const uint8_t* _data;
  int _width;
  int _height;
  intptr_t _stride;
  SWChannelOrder _order;
  uint8_t _offset[4];

  SW_INLINE PixelSource() noexcept
    : _data(nullptr),
      _width(0),
      _height(0),
      _stride(0) {
    set_order(sw_channel_order_rgba);
  }

  SW_INLINE PixelSource(const void* data, int w, int h, intptr_t stride, const SWChannelOrder& order = sw_channel_order_rgba) noexcept {
    attach(data, w, h, stride);
    set_order(order);
  }

  SW_INLINE void attach(const void* data, int w, int h, intptr_t stride) noexcept {
    _data = static_cast<const uint8_t*>(data);
    _width = w;
    _height = h;
    _stride = stride;
  }

  //! \name Accessors
  //! \{

  [[nodiscard]]
  SW_INLINE_NODEBUG int width() const noexcept { return _width; }

  [[nodiscard]]
  SW_INLINE_NODEBUG int height() const noexcept { return _height; }

  [[nodiscard]]
  SW_INLINE_NODEBUG intptr_t stride() const noexcept { return _stride; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const SWChannelOrder& order() const noexcept { return _order; }

  [[nodiscard]]
  SW_INLINE_NODEBUG const uint8_t* offsets() const noexcept { return _offset; }

  [[nodiscard]]
  SW_INLINE_NODEBUG uint32_t offset(uint32_t i) const noexcept { return _offset[i]; }

  //! \}

  SW_INLINE void set_order(const SWChannelOrder& order) noexcept {
    _order = order;
    if (kComponents == 1) {
      _offset[0] = 0;
      _offset[1] = 0;
      _offset[2] = 0;
      _offset[3] = 0;
    }
    else {
      for (uint32_t i = 0; i < 4; i++)
        _offset[i] = uint8_t(i < kComponents ? order.index_of(i) : 0u);
    }
  }

  //! \name Pixel Access
  //! \{

  [[nodiscard]]
  SW_INLINE const uint8_t* row_ptr(int y) const noexcept {
    return _data + intptr_t(y) * _stride;
  }

  [[nodiscard]]
  SW_INLINE const ValueType* pix_ptr(int x, int y) const noexcept {
    return reinterpret_cast<const ValueType*>(row_ptr(y) + intptr_t(x) * intptr_t(Format::kPixelSize));
  }

  //! Converts a stored pixel into `ColorType`.
  [[nodiscard]]
  SW_INLINE ColorType make_color(const ValueType* p) const noexcept {
    ColorType c;
    for (uint32_t i = 0; i < kComponents; i++)
      Traits::set(c, i, p[_offset[i]]);

    if (!Format::kHasAlpha)
      Traits::set(c, Traits::kAlphaIndex, Traits::base_mask());
    return c;
  }

  //! Converts `c` into the stored representation written to `dst`.
  SW_INLINE void store_color(ValueType* dst, const ColorType& c) const noexcept {
    for (uint32_t i = 0; i < kComponents; i++)
      dst[_offset[i]] = Traits::get(c, i);
  }

  [[nodiscard]]
  SW_INLINE ColorType pixel(int x, int y) const noexcept { return make_color(pix_ptr(x, y)); }

  //! \}
};

} // {sw}

//! \}
//! \endcond

#endif // SWATCH_IMAGE_PIXELFORMAT_P_H_INCLUDED
